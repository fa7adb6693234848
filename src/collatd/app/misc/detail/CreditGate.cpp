#include <collatd/app/misc/CreditGate.h>
//
#include <collatd/app/misc/LendingHelpers.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

namespace collat {

CreditGate::CreditGate(
    std::shared_ptr<ScoreOracle const> oracle,
    Journal journal)
    : oracle_(std::move(oracle)), j_(journal)
{
    if (!oracle_)
        LogicError("CreditGate : no score oracle");
}

TER
CreditGate::checkEligible(ReadView const& view, AccountID const& account) const
{
    if (!view.isVerified(account))
    {
        JLOG(j_.warn()) << "Account " << account << " is not verified.";
        return tecNO_AUTH;
    }

    auto const reading = oracle_->latestReading(account);
    if (!reading)
    {
        JLOG(j_.warn()) << "No score reading for " << account;
        return tecORACLE_FAILURE;
    }

    // Round metadata is informational only.
    JLOG(j_.debug()) << "Score for " << account << ": " << reading->answer
                     << " round " << reading->roundID << " answered in "
                     << reading->answeredInRound << " updated "
                     << to_string(reading->updatedAt);

    if (reading->answer <= Lending::minimumScore)
    {
        JLOG(j_.warn()) << "Account " << account << " score "
                        << reading->answer << " does not exceed "
                        << Lending::minimumScore;
        return tecINSUFFICIENT_SCORE;
    }

    return tesSUCCESS;
}

}  // namespace collat
