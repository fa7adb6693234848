#include <collatd/app/tx/detail/AccountVerify.h>
//
#include <collatd/app/misc/LendingHelpers.h>

#include <collat/basics/Log.h>

namespace collat {

TER
AccountVerify::preflight(PreflightContext const& ctx)
{
    if (ctx.tx.subject.isZero())
    {
        JLOG(ctx.j.warn()) << "AccountVerify: no subject account.";
        return temINVALID;
    }

    return tesSUCCESS;
}

TER
AccountVerify::preclaim(PreclaimContext const& ctx)
{
    if (!isAdmin(ctx.registry.config, ctx.tx.account))
    {
        JLOG(ctx.j.warn()) << "AccountVerify: " << ctx.tx.account
                           << " is not the administrator.";
        return tecNO_PERMISSION;
    }

    return tesSUCCESS;
}

TER
AccountVerify::doApply()
{
    auto const& tx = ctx_.tx;

    view().setVerified(tx.subject, tx.verified);

    JLOG(j_.info()) << "Account " << tx.subject
                    << (tx.verified ? " verified" : " unverified");
    return tesSUCCESS;
}

}  // namespace collat
