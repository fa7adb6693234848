#include <collatd/app/tx/applySteps.h>
//
#include <collatd/app/tx/detail/AccountVerify.h>
#include <collatd/app/tx/detail/ApplyContext.h>
#include <collatd/app/tx/detail/LoanApprove.h>
#include <collatd/app/tx/detail/LoanDefault.h>
#include <collatd/app/tx/detail/LoanRepay.h>
#include <collatd/app/tx/detail/LoanRequest.h>
#include <collatd/core/TimeKeeper.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

#include <stdexcept>
#include <string>

namespace collat {

namespace {

struct UnknownTxnType : std::exception
{
    TxType txnType;
    UnknownTxnType(TxType t) : txnType{t}
    {
    }

    char const*
    what() const noexcept override
    {
        return "unknown transaction type";
    }
};

// Call a lambda with the concrete transaction type as a template parameter
// throw an "UnknownTxnType" exception on error
template <class F>
auto
with_txn_type(TxType txnType, F&& f)
{
    switch (txnType)
    {
        case ttACCOUNT_VERIFY:
            return f.template operator()<AccountVerify>();
        case ttLOAN_REQUEST:
            return f.template operator()<LoanRequest>();
        case ttLOAN_APPROVE:
            return f.template operator()<LoanApprove>();
        case ttLOAN_REPAY:
            return f.template operator()<LoanRepay>();
        case ttLOAN_DEFAULT:
            return f.template operator()<LoanDefault>();
        default:
            throw UnknownTxnType(txnType);
    }
}

TER
invoke_preflight(PreflightContext const& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.type, [&]<typename T>() {
            if (auto const ter = Transactor::preflight0(ctx);
                !isTesSuccess(ter))
                return ter;
            return T::preflight(ctx);
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        // LCOV_EXCL_START
        JLOG(ctx.j.fatal())
            << "Unknown transaction type in preflight: " << e.txnType;
        return temUNKNOWN;
        // LCOV_EXCL_STOP
    }
}

TER
invoke_preclaim(PreclaimContext const& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.type, [&]<typename T>() {
            return T::preclaim(ctx);
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        // LCOV_EXCL_START
        JLOG(ctx.j.fatal())
            << "Unknown transaction type in preclaim: " << e.txnType;
        return temUNKNOWN;
        // LCOV_EXCL_STOP
    }
}

TER
invoke_apply(ApplyContext& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.type, [&]<typename T>() {
            T p(ctx);
            return p();
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        // LCOV_EXCL_START
        JLOG(ctx.journal.fatal())
            << "Unknown transaction type in apply: " << e.txnType;
        return temUNKNOWN;
        // LCOV_EXCL_STOP
    }
}

TER
checkedPreclaim(PreclaimContext const& ctx)
{
    try
    {
        return invoke_preclaim(ctx);
    }
    catch (std::exception const& e)
    {
        JLOG(ctx.j.fatal()) << "apply (preclaim): " << e.what();
        return tefEXCEPTION;
    }
}

}  // namespace

TER
preflight(ServiceRegistry& registry, LendingTx const& tx, Journal j)
{
    PreflightContext const pfctx(registry, tx, j);
    try
    {
        return invoke_preflight(pfctx);
    }
    catch (std::exception const& e)
    {
        JLOG(j.fatal()) << "apply (preflight): " << e.what();
        return tefEXCEPTION;
    }
}

TER
preclaim(
    ServiceRegistry& registry,
    ReadView const& view,
    LendingTx const& tx,
    Journal j)
{
    PreclaimContext const ctx(
        registry, view, tx, registry.timeKeeper.now(), j);
    return checkedPreclaim(ctx);
}

ApplyResult
apply(
    ServiceRegistry& registry,
    ApplyView& view,
    LendingTx const& tx,
    Journal j)
{
    if (auto const ter = preflight(registry, tx, j); !isTesSuccess(ter))
        return {ter, false};

    // Preclaim and doApply observe the same instant.
    auto const now = registry.timeKeeper.now();

    if (auto const ter =
            checkedPreclaim(PreclaimContext(registry, view, tx, now, j));
        !isTesSuccess(ter))
        return {ter, false};

    ApplyContext ctx(registry, view, tx, now, j);

    TER ter;
    try
    {
        ter = invoke_apply(ctx);
    }
    catch (std::exception const& e)
    {
        JLOG(j.fatal()) << "apply: " << to_string(tx.type) << " threw "
                        << e.what();
        ter = tefEXCEPTION;
    }

    if (!isTesSuccess(ter))
    {
        JLOG(j.warn()) << to_string(tx.type) << " by " << tx.account
                       << " failed: " << transToken(ter);
        if (auto const undo = ctx.discard(); !isTesSuccess(undo))
            ter = undo;
        return {ter, false};
    }

    ctx.apply(view);

    JLOG(j.debug()) << to_string(tx.type) << " by " << tx.account
                    << " applied";
    return {tesSUCCESS, true, ctx.createdLoanID, ctx.events()};
}

}  // namespace collat
