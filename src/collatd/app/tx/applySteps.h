#ifndef COLLAT_TX_APPLYSTEPS_H_INCLUDED
#define COLLAT_TX_APPLYSTEPS_H_INCLUDED

#include <collatd/app/misc/LoanEvents.h>
#include <collatd/core/ServiceRegistry.h>
#include <collatd/ledger/ApplyView.h>

#include <collat/basics/Journal.h>
#include <collat/protocol/LendingTx.h>
#include <collat/protocol/TER.h>

#include <vector>

namespace collat {

/** The outcome of applying a transaction. */
struct ApplyResult
{
    TER ter;

    // `true` if the ledger changed.
    bool applied;

    // The loan created by a ttLOAN_REQUEST.
    LoanID loanID = 0;

    // Notifications to publish, in emission order.
    std::vector<LoanEvent> events;
};

/** Checks the transaction in isolation.

    @return tesSUCCESS or a tem code.
*/
TER
preflight(ServiceRegistry& registry, LendingTx const& tx, Journal j);

/** Checks the transaction against the current ledger.

    @return tesSUCCESS or a tec code.
*/
TER
preclaim(
    ServiceRegistry& registry,
    ReadView const& view,
    LendingTx const& tx,
    Journal j);

/** Apply a transaction to a ledger.

    The transaction is preflighted, preclaimed and finally applied to a
    sandbox over the view. The sandbox reaches the view only if every step
    succeeds; otherwise every external effect is undone and the view is
    left exactly as it was.

    The caller must keep the view from changing for the duration.
*/
ApplyResult
apply(
    ServiceRegistry& registry,
    ApplyView& view,
    LendingTx const& tx,
    Journal j);

}  // namespace collat

#endif
