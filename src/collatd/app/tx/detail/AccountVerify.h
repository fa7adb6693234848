#ifndef COLLAT_TX_ACCOUNTVERIFY_H_INCLUDED
#define COLLAT_TX_ACCOUNTVERIFY_H_INCLUDED

#include <collatd/app/tx/detail/Transactor.h>

namespace collat {

class AccountVerify : public Transactor
{
public:
    explicit AccountVerify(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static TER
    preflight(PreflightContext const& ctx);

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace collat

#endif
