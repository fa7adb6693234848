#ifndef COLLAT_TX_TRANSACTOR_H_INCLUDED
#define COLLAT_TX_TRANSACTOR_H_INCLUDED

#include <collatd/app/tx/detail/ApplyContext.h>

#include <collat/basics/Journal.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/TER.h>

namespace collat {

/** Base of every lending transaction.

    A derived class supplies three steps:

    static TER preflight(PreflightContext const&)
        Checks that need nothing but the transaction itself.

    static TER preclaim(PreclaimContext const&)
        Checks against the ledger before anything is changed.

    TER doApply()
        Makes the changes. May still fail, in which case the caller rolls
        everything back.
*/
class Transactor
{
protected:
    ApplyContext& ctx_;
    Journal const j_;

    AccountID const account_;

    explicit Transactor(ApplyContext& ctx);

public:
    virtual ~Transactor() = default;

    Transactor(Transactor const&) = delete;
    Transactor&
    operator=(Transactor const&) = delete;

    /** Process the transaction. */
    TER
    operator()();

    ApplyView&
    view()
    {
        return ctx_.view();
    }

    ApplyView const&
    view() const
    {
        return ctx_.view();
    }

    /** Checks shared by every transaction type. */
    static TER
    preflight0(PreflightContext const& ctx);

protected:
    virtual TER
    doApply() = 0;
};

}  // namespace collat

#endif
