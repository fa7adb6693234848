#include <collatd/app/misc/LoanEvents.h>

namespace collat {

std::string
to_string(LoanEvent::Type type)
{
    switch (type)
    {
        case LoanEvent::requested:
            return "LoanRequested";
        case LoanEvent::approved:
            return "LoanApproved";
        case LoanEvent::repaid:
            return "LoanRepaid";
        case LoanEvent::defaulted:
            return "LoanDefaulted";
        case LoanEvent::collateralLiquidated:
            return "CollateralLiquidated";
    }
    return "Unknown";
}

std::ostream&
operator<<(std::ostream& os, LoanEvent const& event)
{
    os << to_string(event.type) << "(" << event.id << ", " << event.borrower;
    if (event.amount)
        os << ", " << *event.amount;
    return os << ")";
}

}  // namespace collat
