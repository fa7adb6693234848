#include <collatd/ledger/LedgerStore.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

#include <limits>

namespace collat {

LedgerStore::LedgerStore(Journal journal) : LedgerStore(1, journal)
{
}

LedgerStore::LedgerStore(LoanID firstID, Journal journal)
    : next_(firstID), j_(journal)
{
    if (firstID == 0)
        LogicError("LedgerStore : loan id zero is reserved");
}

std::shared_ptr<Loan const>
LedgerStore::read(LoanID id) const
{
    std::lock_guard lock(mutex_);
    auto const iter = loans_.find(id);
    if (iter == loans_.end())
        return nullptr;
    return std::make_shared<Loan const>(iter->second);
}

bool
LedgerStore::isVerified(AccountID const& account) const
{
    std::lock_guard lock(mutex_);
    return verified_.count(account) != 0;
}

LoanID
LedgerStore::nextLoanID() const
{
    std::lock_guard lock(mutex_);
    return next_;
}

Expected<LoanID, TER>
LedgerStore::create(Loan loan)
{
    std::lock_guard lock(mutex_);

    if (next_ == 0)
    {
        JLOG(j_.error()) << "Loan id space exhausted";
        return Unexpected(tecDIR_FULL);
    }

    LoanID const id = next_;
    next_ = (id == std::numeric_limits<LoanID>::max()) ? 0 : id + 1;

    loan.id = id;
    loans_.emplace(id, std::move(loan));

    JLOG(j_.trace()) << "Created loan " << id;
    return id;
}

TER
LedgerStore::finalize(LoanID id, LoanStatus status)
{
    std::lock_guard lock(mutex_);

    auto const iter = loans_.find(id);
    if (iter == loans_.end())
        return tecNO_ENTRY;

    if (auto const ter = finalizeLoan(iter->second, status); !isTesSuccess(ter))
    {
        JLOG(j_.warn()) << "Loan " << id << " is already "
                        << to_string(iter->second.status);
        return ter;
    }

    JLOG(j_.trace()) << "Loan " << id << " is now " << to_string(status);
    return tesSUCCESS;
}

TER
LedgerStore::markRepaid(LoanID id)
{
    return finalize(id, LoanStatus::repaid);
}

TER
LedgerStore::markDefaulted(LoanID id)
{
    return finalize(id, LoanStatus::defaulted);
}

TER
LedgerStore::markDisbursed(LoanID id)
{
    std::lock_guard lock(mutex_);

    auto const iter = loans_.find(id);
    if (iter == loans_.end())
        return tecNO_ENTRY;

    return disburseLoan(iter->second);
}

void
LedgerStore::setVerified(AccountID const& account, bool verified)
{
    std::lock_guard lock(mutex_);
    if (verified)
        verified_.insert(account);
    else
        verified_.erase(account);
}

std::vector<LoanID>
LedgerStore::loansOf(AccountID const& borrower) const
{
    std::lock_guard lock(mutex_);

    std::vector<LoanID> result;
    for (auto const& [id, loan] : loans_)
    {
        if (loan.borrower == borrower)
            result.push_back(id);
    }
    return result;
}

std::size_t
LedgerStore::size() const
{
    std::lock_guard lock(mutex_);
    return loans_.size();
}

}  // namespace collat
