#ifndef COLLAT_LEDGER_APPLYVIEW_H_INCLUDED
#define COLLAT_LEDGER_APPLYVIEW_H_INCLUDED

#include <collatd/ledger/ReadView.h>

namespace collat {

/** Writeable view to the lending ledger.

    Loans are created once and never erased. The only mutations of an
    existing loan are the transition to a terminal status and the record
    of the disbursement.
*/
class ApplyView : public ReadView
{
public:
    ApplyView() = default;

    /** Insert a new loan.

        The id field of the argument is ignored; the view assigns the next
        id and returns it.

        @return tecDIR_FULL if the id space is exhausted.
    */
    virtual Expected<LoanID, TER>
    create(Loan loan) = 0;

    /** Move the loan to the repaid status.

        @return tecNO_ENTRY for an unknown id, tecLOAN_FINALIZED if the
                loan already is repaid or defaulted.
    */
    virtual TER
    markRepaid(LoanID id) = 0;

    /** Move the loan to the defaulted status. Errors as for markRepaid. */
    virtual TER
    markDefaulted(LoanID id) = 0;

    /** Record that the principal was disbursed.

        @return tecNO_ENTRY, tecLOAN_FINALIZED or tecALREADY_DISBURSED.
    */
    virtual TER
    markDisbursed(LoanID id) = 0;

    virtual void
    setVerified(AccountID const& account, bool verified) = 0;
};

}  // namespace collat

#endif
