#ifndef COLLAT_LEDGER_READVIEW_H_INCLUDED
#define COLLAT_LEDGER_READVIEW_H_INCLUDED

#include <collat/basics/Expected.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>
#include <collat/protocol/TER.h>

#include <memory>

namespace collat {

/** A view into the lending ledger.

    The ledger consists of the loan table, keyed by loan id, and the
    verification table, keyed by account.
*/
class ReadView
{
public:
    ReadView() = default;
    ReadView(ReadView const&) = delete;
    ReadView&
    operator=(ReadView const&) = delete;

    virtual ~ReadView() = default;

    /** Return the loan with the given id.

        @return `nullptr` if the id was never assigned. Id zero is never
                assigned.
    */
    virtual std::shared_ptr<Loan const>
    read(LoanID id) const = 0;

    /** Returns `true` if an administrator has verified the account. */
    virtual bool
    isVerified(AccountID const& account) const = 0;

    /** Returns the id the next created loan will receive.

        @return zero once the id space is exhausted.
    */
    virtual LoanID
    nextLoanID() const = 0;

    /** Returns a copy of the loan or tecNO_ENTRY. */
    Expected<Loan, TER>
    get(LoanID id) const
    {
        auto const loan = read(id);
        if (!loan)
            return Unexpected(tecNO_ENTRY);
        return *loan;
    }
};

}  // namespace collat

#endif
