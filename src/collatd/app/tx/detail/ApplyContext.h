#ifndef COLLAT_TX_APPLYCONTEXT_H_INCLUDED
#define COLLAT_TX_APPLYCONTEXT_H_INCLUDED

#include <collatd/app/misc/LoanEvents.h>
#include <collatd/core/ServiceRegistry.h>
#include <collatd/ledger/Sandbox.h>

#include <collat/basics/Journal.h>
#include <collat/basics/chrono.h>
#include <collat/protocol/LendingTx.h>
#include <collat/protocol/TER.h>

#include <functional>
#include <vector>

namespace collat {

/** State information when preflighting a tx. */
struct PreflightContext
{
public:
    ServiceRegistry& registry;
    LendingTx const& tx;
    Journal const j;

    PreflightContext(
        ServiceRegistry& registry_,
        LendingTx const& tx_,
        Journal j_)
        : registry(registry_), tx(tx_), j(j_)
    {
    }

    PreflightContext&
    operator=(PreflightContext const&) = delete;
};

/** State information when determining if a tx is likely to claim a fee. */
struct PreclaimContext
{
public:
    ServiceRegistry& registry;
    ReadView const& view;
    LendingTx const& tx;
    NetClock::time_point const now;
    Journal const j;

    PreclaimContext(
        ServiceRegistry& registry_,
        ReadView const& view_,
        LendingTx const& tx_,
        NetClock::time_point now_,
        Journal j_)
        : registry(registry_), view(view_), tx(tx_), now(now_), j(j_)
    {
    }

    PreclaimContext&
    operator=(PreclaimContext const&) = delete;
};

/** State information when applying a tx.

    Ledger changes are made to a sandbox over the base view. External
    effects cannot be buffered, so each one that succeeds registers a
    compensation. If the transaction fails, discard runs the compensations
    newest first and the sandbox is dropped.
*/
class ApplyContext
{
public:
    using Compensation = std::function<TER()>;

    ApplyContext(
        ServiceRegistry& registry,
        ReadView const& base,
        LendingTx const& tx,
        NetClock::time_point now,
        Journal journal);

    ServiceRegistry& registry;
    LendingTx const& tx;
    NetClock::time_point const now;
    Journal const journal;

    ApplyView&
    view()
    {
        return view_;
    }

    ApplyView const&
    view() const
    {
        return view_;
    }

    /** Queue a notification for publication after commit. */
    void
    emit(LoanEvent event)
    {
        events_.push_back(std::move(event));
    }

    std::vector<LoanEvent> const&
    events() const
    {
        return events_;
    }

    /** Register the undo action for an external effect that happened. */
    void
    onDiscard(Compensation undo)
    {
        compensations_.push_back(std::move(undo));
    }

    /** The id of the loan created by this transaction, if any. */
    LoanID createdLoanID = 0;

    /** Commit the ledger changes to the base view. */
    void
    apply(ApplyView& base);

    /** Roll back every external effect and drop the ledger changes.

        @return tesSUCCESS, or tefBAD_LEDGER if an external effect could
                not be undone.
    */
    TER
    discard();

private:
    Sandbox view_;
    std::vector<LoanEvent> events_;
    std::vector<Compensation> compensations_;
};

}  // namespace collat

#endif
