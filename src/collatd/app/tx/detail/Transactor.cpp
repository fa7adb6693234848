#include <collatd/app/tx/detail/Transactor.h>

#include <collat/basics/Log.h>

namespace collat {

Transactor::Transactor(ApplyContext& ctx)
    : ctx_(ctx), j_(ctx.journal), account_(ctx.tx.account)
{
}

TER
Transactor::preflight0(PreflightContext const& ctx)
{
    if (ctx.tx.account.isZero())
    {
        JLOG(ctx.j.warn()) << "preflight0: no submitting account";
        return temBAD_SRC_ACCOUNT;
    }

    return tesSUCCESS;
}

TER
Transactor::operator()()
{
    JLOG(j_.trace()) << "apply: " << to_string(ctx_.tx.type) << " by "
                     << account_;

    auto const result = doApply();

    JLOG(j_.trace()) << "doApply: " << transToken(result);
    return result;
}

}  // namespace collat
