#include <collatd/app/tx/detail/LoanRepay.h>
//
#include <collatd/app/misc/CollateralVault.h>
#include <collatd/app/misc/FungibleToken.h>
#include <collatd/app/misc/LendingHelpers.h>
#include <collatd/core/Config.h>

#include <collat/basics/Log.h>

namespace collat {

TER
LoanRepay::preflight(PreflightContext const& ctx)
{
    return tesSUCCESS;
}

TER
LoanRepay::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    auto const loan = ctx.view.read(tx.loanID);
    if (!loan)
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID << " does not exist.";
        return tecNO_ENTRY;
    }

    if (loan->borrower != tx.account)
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID
                           << " can only be repaid by its borrower.";
        return tecNO_PERMISSION;
    }

    // A defaulted loan can no longer be repaid: its collateral is gone.
    if (loan->isTerminal())
    {
        JLOG(ctx.j.warn()) << "Loan " << tx.loanID << " is already "
                           << to_string(loan->status) << ".";
        return tecLOAN_FINALIZED;
    }

    return tesSUCCESS;
}

TER
LoanRepay::doApply()
{
    auto const loanID = ctx_.tx.loanID;
    auto& token = ctx_.registry.token;
    auto& vault = ctx_.registry.vault;
    auto const& reserve = ctx_.registry.config.RESERVE_ACCOUNT;

    auto const loan = view().read(loanID);
    if (!loan)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const amount = totalRepayment(*loan);

    if (!token.transferFrom(account_, reserve, amount))
    {
        JLOG(j_.warn()) << "Repayment of " << amount << " from " << account_
                        << " was refused.";
        return tecUNFUNDED_PAYMENT;
    }

    ctx_.onDiscard([&token, reserve, borrower = account_, amount]() {
        return token.transferFrom(reserve, borrower, amount)
            ? tesSUCCESS
            : tecUNFUNDED_PAYMENT;
    });

    if (auto const ter = view().markRepaid(loanID); !isTesSuccess(ter))
        return ter;

    if (auto const ter = vault.release(loan->collateralLock, account_);
        !isTesSuccess(ter))
        return ter;

    ctx_.emit({LoanEvent::repaid, loanID, account_, std::nullopt});

    JLOG(j_.info()) << "Loan " << loanID << " repaid with " << amount;
    return tesSUCCESS;
}

}  // namespace collat
