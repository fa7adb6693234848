#include <collatd/app/tx/detail/LoanRequest.h>
//
#include <collatd/app/misc/CollateralVault.h>
#include <collatd/app/misc/CreditGate.h>
#include <collatd/app/misc/LendingHelpers.h>

#include <collat/basics/Log.h>

namespace collat {

TER
LoanRequest::preflight(PreflightContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (tx.amount == 0 || tx.amount > Lending::maxPrincipal)
    {
        JLOG(ctx.j.warn()) << "LoanRequest: invalid principal " << tx.amount;
        return temBAD_AMOUNT;
    }

    if (tx.collateral.asset.isZero())
    {
        JLOG(ctx.j.warn()) << "LoanRequest: no collateral asset.";
        return temMALFORMED;
    }

    return tesSUCCESS;
}

TER
LoanRequest::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (dueTimeOverflows(ctx.now, tx.duration))
    {
        JLOG(ctx.j.warn()) << "LoanRequest: duration " << tx.duration.count()
                           << "s is past the end of ledger time.";
        return tecKILLED;
    }

    // The gate logs its own reason.
    if (auto const ter = ctx.registry.gate.checkEligible(ctx.view, tx.account);
        !isTesSuccess(ter))
        return ter;

    auto const& vault = ctx.registry.vault;
    if (!vault.hasAsset(tx.collateral.asset))
    {
        JLOG(ctx.j.warn()) << "LoanRequest: asset " << tx.collateral.asset
                           << " is not accepted as collateral.";
        return tecNO_ISSUER;
    }

    if (vault.isLocked(tx.collateral))
    {
        JLOG(ctx.j.warn()) << "LoanRequest: " << tx.collateral
                           << " already secures a loan.";
        return tecDUPLICATE;
    }

    if (ctx.view.nextLoanID() == 0)
    {
        JLOG(ctx.j.warn()) << "LoanRequest: loan ids exhausted.";
        return tecDIR_FULL;
    }

    return tesSUCCESS;
}

TER
LoanRequest::doApply()
{
    auto const& tx = ctx_.tx;
    auto& vault = ctx_.registry.vault;

    auto const handle = vault.lock(tx.collateral, account_);
    if (!handle)
        return handle.error();

    ctx_.onDiscard([&vault, h = *handle]() { return vault.unlock(h); });

    Loan loan;
    loan.borrower = account_;
    loan.principal = tx.amount;
    loan.interestRate = Lending::interestRate;
    loan.duration = tx.duration;
    loan.collateral = tx.collateral;
    loan.collateralLock = *handle;
    loan.issuedTime = ctx_.now;

    auto const id = view().create(std::move(loan));
    if (!id)
        return id.error();

    ctx_.createdLoanID = *id;
    ctx_.emit({LoanEvent::requested, *id, account_, tx.amount});

    JLOG(j_.info()) << "Loan " << *id << " requested by " << account_
                    << " for " << tx.amount;
    return tesSUCCESS;
}

}  // namespace collat
