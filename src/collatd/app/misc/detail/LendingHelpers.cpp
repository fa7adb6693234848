#include <collatd/app/misc/LendingHelpers.h>
//
#include <collatd/core/Config.h>

#include <collat/basics/contract.h>

#include <stdexcept>

namespace collat {

std::uint64_t
totalRepayment(std::uint64_t principal, std::uint32_t interestRate)
{
    if (principal > Lending::maxPrincipal || interestRate > 100)
        Throw<std::overflow_error>("totalRepayment : amount out of range");

    return principal + principal * interestRate / 100;
}

bool
dueTimeOverflows(NetClock::time_point issued, NetClock::duration duration)
{
    auto const limit = NetClock::time_point::max().time_since_epoch().count();
    return duration.count() > limit - issued.time_since_epoch().count();
}

bool
isAdmin(Config const& config, AccountID const& account)
{
    return !account.isZero() && account == config.ADMIN_ACCOUNT;
}

}  // namespace collat
