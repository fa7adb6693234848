#ifndef COLLAT_TX_LOANREPAY_H_INCLUDED
#define COLLAT_TX_LOANREPAY_H_INCLUDED

#include <collatd/app/tx/detail/Transactor.h>

namespace collat {

class LoanRepay : public Transactor
{
public:
    explicit LoanRepay(ApplyContext& ctx) : Transactor(ctx)
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
