#ifndef COLLAT_LEDGER_LEDGERSTORE_H_INCLUDED
#define COLLAT_LEDGER_LEDGERSTORE_H_INCLUDED

#include <collatd/ledger/ApplyView.h>

#include <collat/basics/Journal.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace collat {

/** The authoritative lending ledger.

    Owns the loan table, the verification table and the loan id counter.
    Ids are assigned strictly increasing starting at one and are never
    reused. All members are safe to call concurrently.
*/
class LedgerStore : public ApplyView
{
private:
    std::mutex mutable mutex_;

    std::map<LoanID, Loan> loans_;
    std::set<AccountID> verified_;

    // Zero once the id space is exhausted.
    LoanID next_;

    Journal const j_;

public:
    explicit LedgerStore(Journal journal);

    /** Construct a store whose first loan receives the given id.
        Used to exercise id exhaustion.
    */
    LedgerStore(LoanID firstID, Journal journal);

    std::shared_ptr<Loan const>
    read(LoanID id) const override;

    bool
    isVerified(AccountID const& account) const override;

    LoanID
    nextLoanID() const override;

    Expected<LoanID, TER>
    create(Loan loan) override;

    TER
    markRepaid(LoanID id) override;

    TER
    markDefaulted(LoanID id) override;

    TER
    markDisbursed(LoanID id) override;

    void
    setVerified(AccountID const& account, bool verified) override;

    /** Returns the ids of every loan taken out by the borrower. */
    std::vector<LoanID>
    loansOf(AccountID const& borrower) const;

    /** Returns the number of loans ever created. */
    std::size_t
    size() const;

private:
    TER
    finalize(LoanID id, LoanStatus status);
};

}  // namespace collat

#endif
