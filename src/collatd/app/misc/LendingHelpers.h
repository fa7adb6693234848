#ifndef COLLAT_APP_MISC_LENDINGHELPERS_H_INCLUDED
#define COLLAT_APP_MISC_LENDINGHELPERS_H_INCLUDED

#include <collat/basics/chrono.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>

#include <cstdint>
#include <limits>

namespace collat {

class Config;

namespace Lending {

/** Interest charged on every loan, in percent of the principal. */
static constexpr std::uint32_t interestRate = 5;

/** A borrower's score must be strictly greater than this. */
static constexpr std::int64_t minimumScore = 600;

/** The largest principal for which the repayment total cannot overflow. */
static constexpr std::uint64_t maxPrincipal =
    std::numeric_limits<std::uint64_t>::max() / 100;

}  // namespace Lending

/** The amount a borrower owes to close a loan.

    Interest is a flat percentage of the principal, rounded down. It does
    not compound and does not depend on how long the loan was open.
*/
std::uint64_t
totalRepayment(std::uint64_t principal, std::uint32_t interestRate);

inline std::uint64_t
totalRepayment(Loan const& loan)
{
    return totalRepayment(loan.principal, loan.interestRate);
}

/** Returns `true` if `now` lies strictly after the due time. */
inline bool
hasExpired(NetClock::time_point now, NetClock::time_point dueTime)
{
    return now > dueTime;
}

/** Returns `true` if the loan has passed its due time. */
inline bool
hasExpired(NetClock::time_point now, Loan const& loan)
{
    return hasExpired(now, loan.dueTime());
}

/** Returns `true` if issue + duration does not fit in a NetClock time. */
bool
dueTimeOverflows(NetClock::time_point issued, NetClock::duration duration);

/** Returns `true` if the account is the configured administrator. */
bool
isAdmin(Config const& config, AccountID const& account);

}  // namespace collat

#endif
