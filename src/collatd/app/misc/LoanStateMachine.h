#ifndef COLLAT_APP_MISC_LOANSTATEMACHINE_H_INCLUDED
#define COLLAT_APP_MISC_LOANSTATEMACHINE_H_INCLUDED

#include <collatd/app/misc/LoanEvents.h>
#include <collatd/core/ServiceRegistry.h>
#include <collatd/ledger/LedgerStore.h>

#include <collat/basics/Expected.h>
#include <collat/basics/Journal.h>
#include <collat/protocol/LendingTx.h>
#include <collat/protocol/Loan.h>
#include <collat/protocol/TER.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace collat {

class CollateralVault;
class Config;
class CreditGate;
class FungibleToken;
class TimeKeeper;

/** Drives the lifecycle of every loan.

    Each operation is one transaction. Transactions are serialized: the
    next one starts only after the previous one committed or rolled back.
    A transaction that fails leaves neither the ledger nor the custody of
    any asset changed, and publishes nothing.

    Listeners are notified after commit, while the transaction lock is
    still held. They must not call back into the state machine. A
    listener that throws is logged and skipped; it does not change the
    result of the transaction.
*/
class LoanStateMachine
{
private:
    ServiceRegistry registry_;
    LedgerStore& store_;
    Journal const j_;

    std::mutex txLock_;

    std::mutex mutable listenerLock_;
    std::vector<std::shared_ptr<LoanEventListener>> listeners_;

public:
    LoanStateMachine(
        Config const& config,
        LedgerStore& store,
        CreditGate const& gate,
        CollateralVault& vault,
        FungibleToken& token,
        TimeKeeper const& timeKeeper,
        Journal journal);

    LoanStateMachine(LoanStateMachine const&) = delete;
    LoanStateMachine&
    operator=(LoanStateMachine const&) = delete;

    void
    subscribe(std::shared_ptr<LoanEventListener> listener);

    /** Set or clear the verification flag of an account. Admin only. */
    TER
    verifyUser(AccountID const& caller, AccountID const& user, bool verified);

    /** Pledge collateral and open a loan.

        @return the id of the new loan.
    */
    Expected<LoanID, TER>
    request(
        AccountID const& borrower,
        std::uint64_t amount,
        NetClock::duration duration,
        CollateralRef const& collateral);

    /** Disburse the principal of a loan. Admin only, once per loan. */
    TER
    approve(AccountID const& caller, LoanID id);

    /** Pay back a loan with interest and take the collateral back.
        Only the borrower may repay.
    */
    TER
    repay(AccountID const& caller, LoanID id);

    /** Declare an overdue loan in default and seize its collateral.
        Anyone may call this.
    */
    TER
    checkDefault(AccountID const& caller, LoanID id);

    /** Run an arbitrary lending transaction. */
    Expected<LoanID, TER>
    submit(LendingTx const& tx);

    Expected<Loan, TER>
    getLoan(LoanID id) const;

    /** The amount the borrower must pay to close the loan. */
    Expected<std::uint64_t, TER>
    repaymentDue(LoanID id) const;

    bool
    isEligible(AccountID const& user) const;

    /** Returns `true` if the loan is open and past its due time. */
    bool
    isDue(LoanID id) const;

private:
    void
    publish(std::vector<LoanEvent> const& events);
};

}  // namespace collat

#endif
