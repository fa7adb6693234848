#ifndef COLLAT_APP_MISC_SCOREORACLE_H_INCLUDED
#define COLLAT_APP_MISC_SCOREORACLE_H_INCLUDED

#include <collat/basics/chrono.h>
#include <collat/protocol/AccountID.h>

#include <cstdint>
#include <optional>

namespace collat {

/** One answer published by a score oracle. */
struct OracleReading
{
    std::uint64_t roundID = 0;
    std::int64_t answer = 0;
    NetClock::time_point startedAt{};
    NetClock::time_point updatedAt{};
    std::uint64_t answeredInRound = 0;
};

/** Source of credit scores. */
class ScoreOracle
{
public:
    virtual ~ScoreOracle() = default;

    /** Returns the latest reading for the subject, or nullopt if the oracle
        has none.
    */
    virtual std::optional<OracleReading>
    latestReading(AccountID const& subject) const = 0;
};

}  // namespace collat

#endif
