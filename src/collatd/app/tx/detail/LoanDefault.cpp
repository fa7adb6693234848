#include <collatd/app/tx/detail/LoanDefault.h>
//
#include <collatd/app/misc/CollateralVault.h>
#include <collatd/app/misc/LendingHelpers.h>
#include <collatd/core/Config.h>

#include <collat/basics/Log.h>

namespace collat {

TER
LoanDefault::preflight(PreflightContext const& ctx)
{
    return tesSUCCESS;
}

TER
LoanDefault::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    auto const loan = ctx.view.read(tx.loanID);
    if (!loan)
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID << " does not exist.";
        return tecNO_ENTRY;
    }

    if (loan->isTerminal())
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID << " is already "
                           << to_string(loan->status) << ".";
        return tecLOAN_FINALIZED;
    }

    if (!hasExpired(ctx.now, *loan))
    {
        JLOG(ctx.j.warn())
            << "Loan " << tx.loanID
            << " can not be defaulted before its due time "
            << to_string(loan->dueTime()) << ".";
        return tecTOO_SOON;
    }

    return tesSUCCESS;
}

TER
LoanDefault::doApply()
{
    auto const loanID = ctx_.tx.loanID;
    auto const& liquidator = ctx_.registry.config.LIQUIDATION_ACCOUNT;

    auto const loan = view().read(loanID);
    if (!loan)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    if (auto const ter = view().markDefaulted(loanID); !isTesSuccess(ter))
        return ter;

    if (auto const ter =
            ctx_.registry.vault.seize(loan->collateralLock, liquidator);
        !isTesSuccess(ter))
        return ter;

    ctx_.emit({LoanEvent::defaulted, loanID, loan->borrower, std::nullopt});
    ctx_.emit(
        {LoanEvent::collateralLiquidated,
         loanID,
         loan->borrower,
         std::nullopt});

    JLOG(j_.info()) << "Loan " << loanID << " defaulted, "
                    << loan->collateral << " seized to " << liquidator;
    return tesSUCCESS;
}

}  // namespace collat
