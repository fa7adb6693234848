#include <collatd/app/misc/LoanStateMachine.h>
//
#include <collatd/app/misc/CreditGate.h>
#include <collatd/app/misc/LendingHelpers.h>
#include <collatd/app/tx/applySteps.h>
#include <collatd/core/TimeKeeper.h>

#include <collat/basics/Log.h>

#include <exception>

namespace collat {

LoanStateMachine::LoanStateMachine(
    Config const& config,
    LedgerStore& store,
    CreditGate const& gate,
    CollateralVault& vault,
    FungibleToken& token,
    TimeKeeper const& timeKeeper,
    Journal journal)
    : registry_{config, gate, vault, token, timeKeeper}
    , store_(store)
    , j_(journal)
{
}

void
LoanStateMachine::subscribe(std::shared_ptr<LoanEventListener> listener)
{
    std::lock_guard lock(listenerLock_);
    listeners_.push_back(std::move(listener));
}

void
LoanStateMachine::publish(std::vector<LoanEvent> const& events)
{
    std::lock_guard lock(listenerLock_);
    for (auto const& event : events)
    {
        JLOG(j_.debug()) << "publish: " << event;
        for (auto const& listener : listeners_)
        {
            // The transaction already committed.
            try
            {
                listener->onLoanEvent(event);
            }
            catch (std::exception const& e)
            {
                JLOG(j_.error()) << "Listener failed on " << event << ": "
                                 << e.what();
            }
        }
    }
}

Expected<LoanID, TER>
LoanStateMachine::submit(LendingTx const& tx)
{
    std::lock_guard lock(txLock_);

    auto const result = apply(registry_, store_, tx, j_);
    if (!isTesSuccess(result.ter))
        return Unexpected(result.ter);

    publish(result.events);
    return result.loanID;
}

TER
LoanStateMachine::verifyUser(
    AccountID const& caller,
    AccountID const& user,
    bool verified)
{
    auto const result =
        submit(LendingTx::makeAccountVerify(caller, user, verified));
    return result ? tesSUCCESS : result.error();
}

Expected<LoanID, TER>
LoanStateMachine::request(
    AccountID const& borrower,
    std::uint64_t amount,
    NetClock::duration duration,
    CollateralRef const& collateral)
{
    return submit(
        LendingTx::makeLoanRequest(borrower, amount, duration, collateral));
}

TER
LoanStateMachine::approve(AccountID const& caller, LoanID id)
{
    auto const result = submit(LendingTx::makeLoanApprove(caller, id));
    return result ? tesSUCCESS : result.error();
}

TER
LoanStateMachine::repay(AccountID const& caller, LoanID id)
{
    auto const result = submit(LendingTx::makeLoanRepay(caller, id));
    return result ? tesSUCCESS : result.error();
}

TER
LoanStateMachine::checkDefault(AccountID const& caller, LoanID id)
{
    auto const result = submit(LendingTx::makeLoanDefault(caller, id));
    return result ? tesSUCCESS : result.error();
}

Expected<Loan, TER>
LoanStateMachine::getLoan(LoanID id) const
{
    return store_.get(id);
}

Expected<std::uint64_t, TER>
LoanStateMachine::repaymentDue(LoanID id) const
{
    auto const loan = store_.read(id);
    if (!loan)
        return Unexpected(tecNO_ENTRY);
    if (loan->isTerminal())
        return Unexpected(tecLOAN_FINALIZED);
    return totalRepayment(*loan);
}

bool
LoanStateMachine::isEligible(AccountID const& user) const
{
    return registry_.gate.isEligible(store_, user);
}

bool
LoanStateMachine::isDue(LoanID id) const
{
    auto const loan = store_.read(id);
    return loan && !loan->isTerminal() &&
        hasExpired(registry_.timeKeeper.now(), *loan);
}

}  // namespace collat
