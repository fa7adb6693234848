#ifndef COLLAT_APP_MISC_LOANEVENTS_H_INCLUDED
#define COLLAT_APP_MISC_LOANEVENTS_H_INCLUDED

#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace collat {

/** A notification published after a lending transaction commits. */
struct LoanEvent
{
    enum Type {
        requested,
        approved,
        repaid,
        defaulted,
        collateralLiquidated,
    };

    Type type;
    LoanID id;
    AccountID borrower;

    // Set for requested and approved.
    std::optional<std::uint64_t> amount;

    bool
    operator==(LoanEvent const&) const = default;
};

std::string
to_string(LoanEvent::Type type);

std::ostream&
operator<<(std::ostream& os, LoanEvent const& event);

/** Receives the events of every committed transaction, in order. */
class LoanEventListener
{
public:
    virtual ~LoanEventListener() = default;

    virtual void
    onLoanEvent(LoanEvent const& event) = 0;
};

}  // namespace collat

#endif
