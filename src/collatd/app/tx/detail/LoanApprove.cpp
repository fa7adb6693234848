#include <collatd/app/tx/detail/LoanApprove.h>
//
#include <collatd/app/misc/FungibleToken.h>
#include <collatd/app/misc/LendingHelpers.h>

#include <collat/basics/Log.h>

namespace collat {

TER
LoanApprove::preflight(PreflightContext const& ctx)
{
    return tesSUCCESS;
}

TER
LoanApprove::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!isAdmin(ctx.registry.config, tx.account))
    {
        JLOG(ctx.j.warn()) << "LoanApprove: " << tx.account
                           << " is not the administrator.";
        return tecNO_PERMISSION;
    }

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

    if (loan->disbursed)
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID
                           << " principal was already disbursed.";
        return tecALREADY_DISBURSED;
    }

    return tesSUCCESS;
}

TER
LoanApprove::doApply()
{
    auto const loanID = ctx_.tx.loanID;

    auto const loan = view().read(loanID);
    if (!loan)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    if (auto const ter = view().markDisbursed(loanID); !isTesSuccess(ter))
        return ter;

    // Nothing may fail once the disbursement succeeded.
    if (!ctx_.registry.token.transfer(loan->borrower, loan->principal))
    {
        JLOG(j_.warn()) << "Disbursement of " << loan->principal << " to "
                        << loan->borrower << " was refused.";
        return tecUNFUNDED_PAYMENT;
    }

    ctx_.emit(
        {LoanEvent::approved, loanID, loan->borrower, loan->principal});

    JLOG(j_.info()) << "Loan " << loanID << " approved, " << loan->principal
                    << " disbursed to " << loan->borrower;
    return tesSUCCESS;
}

}  // namespace collat
