#include <collat/basics/contract.h>
#include <collat/protocol/Loan.h>

namespace collat {

std::string
to_string(LoanStatus status)
{
    switch (status)
    {
        case LoanStatus::requested:
            return "requested";
        case LoanStatus::repaid:
            return "repaid";
        case LoanStatus::defaulted:
            return "defaulted";
    }
    return "unknown";
}

std::string
to_string(CollateralRef const& collateral)
{
    return to_string(collateral.asset) + "#" +
        std::to_string(collateral.tokenID);
}

std::ostream&
operator<<(std::ostream& os, CollateralRef const& collateral)
{
    return os << to_string(collateral);
}

TER
finalizeLoan(Loan& loan, LoanStatus status)
{
    if (status == LoanStatus::requested)
        LogicError("finalizeLoan : requested is not a terminal status");

    if (loan.isTerminal())
        return tecLOAN_FINALIZED;

    loan.status = status;
    return tesSUCCESS;
}

TER
disburseLoan(Loan& loan)
{
    if (loan.isTerminal())
        return tecLOAN_FINALIZED;

    if (loan.disbursed)
        return tecALREADY_DISBURSED;

    loan.disbursed = true;
    return tesSUCCESS;
}

}  // namespace collat
