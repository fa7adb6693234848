#ifndef COLLAT_LEDGER_SANDBOX_H_INCLUDED
#define COLLAT_LEDGER_SANDBOX_H_INCLUDED

#include <collatd/ledger/ApplyView.h>

#include <map>
#include <variant>
#include <vector>

namespace collat {

/** Discardable, editable view to a ledger.

    The sandbox inherits the state of the base view. Changes are buffered
    in the order they are made and only reach the base when apply is
    called. Dropping the sandbox discards them.

    The base must not change while the sandbox is alive.
*/
class Sandbox : public ApplyView
{
private:
    struct Create
    {
        Loan loan;
    };

    struct Finalize
    {
        LoanID id;
        LoanStatus status;
    };

    struct Disburse
    {
        LoanID id;
    };

    struct Verify
    {
        AccountID account;
        bool verified;
    };

    using Action = std::variant<Create, Finalize, Disburse, Verify>;

    ReadView const& base_;

    std::map<LoanID, std::shared_ptr<Loan>> items_;
    std::map<AccountID, bool> verified_;
    std::vector<Action> actions_;

    // Zero once the id space is exhausted.
    LoanID next_;

public:
    explicit Sandbox(ReadView const& base);

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

    /** Returns `true` if nothing was changed. */
    bool
    empty() const
    {
        return actions_.empty();
    }

    /** Replay every buffered change into the target.

        The target must be the base view, unchanged since the sandbox was
        constructed. A change the target refuses is a broken invariant.
    */
    void
    apply(ApplyView& to);

private:
    std::shared_ptr<Loan>
    peek(LoanID id);
};

}  // namespace collat

#endif
