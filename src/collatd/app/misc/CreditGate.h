#ifndef COLLAT_APP_MISC_CREDITGATE_H_INCLUDED
#define COLLAT_APP_MISC_CREDITGATE_H_INCLUDED

#include <collatd/app/misc/ScoreOracle.h>
#include <collatd/ledger/ReadView.h>

#include <collat/basics/Journal.h>
#include <collat/protocol/TER.h>

#include <memory>

namespace collat {

/** Decides whether an account may borrow.

    An account is eligible if an administrator verified it and the score
    oracle currently reports a score above Lending::minimumScore. The score
    is read afresh on every check.
*/
class CreditGate
{
private:
    std::shared_ptr<ScoreOracle const> oracle_;
    Journal const j_;

public:
    CreditGate(std::shared_ptr<ScoreOracle const> oracle, Journal journal);

    /** Check eligibility against the given ledger view.

        @return tesSUCCESS, or tecNO_AUTH for an unverified account,
                tecORACLE_FAILURE if the oracle has no reading,
                tecINSUFFICIENT_SCORE if the score is too low.
    */
    TER
    checkEligible(ReadView const& view, AccountID const& account) const;

    bool
    isEligible(ReadView const& view, AccountID const& account) const
    {
        return isTesSuccess(checkEligible(view, account));
    }
};

}  // namespace collat

#endif
