#include <collatd/app/misc/InMemoryAssets.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

#include <limits>
#include <stdexcept>

namespace collat {

MemoryFungibleToken::MemoryFungibleToken(AccountID reserve, Journal journal)
    : reserve_(std::move(reserve)), j_(journal)
{
}

void
MemoryFungibleToken::mint(AccountID const& to, std::uint64_t amount)
{
    std::lock_guard lock(mutex_);
    auto& balance = balances_[to];
    if (amount > std::numeric_limits<std::uint64_t>::max() - balance)
        Throw<std::overflow_error>("MemoryFungibleToken::mint : overflow");
    balance += amount;
}

std::uint64_t
MemoryFungibleToken::balanceOf(AccountID const& account) const
{
    std::lock_guard lock(mutex_);
    auto const iter = balances_.find(account);
    return iter == balances_.end() ? 0 : iter->second;
}

bool
MemoryFungibleToken::move(
    AccountID const& from,
    AccountID const& to,
    std::uint64_t amount)
{
    std::lock_guard lock(mutex_);

    auto const iter = balances_.find(from);
    if (iter == balances_.end() || iter->second < amount)
    {
        JLOG(j_.debug()) << "Insufficient balance: " << from << " pays "
                         << amount;
        return false;
    }

    auto& credit = balances_[to];
    if (from != to &&
        amount > std::numeric_limits<std::uint64_t>::max() - credit)
    {
        JLOG(j_.debug()) << "Balance overflow: " << to << " receives "
                         << amount;
        return false;
    }

    iter->second -= amount;
    credit += amount;
    return true;
}

bool
MemoryFungibleToken::transfer(AccountID const& to, std::uint64_t amount)
{
    return move(reserve_, to, amount);
}

bool
MemoryFungibleToken::transferFrom(
    AccountID const& from,
    AccountID const& to,
    std::uint64_t amount)
{
    return move(from, to, amount);
}

//------------------------------------------------------------------------------

MemoryNonFungibleToken::MemoryNonFungibleToken(Journal journal) : j_(journal)
{
}

bool
MemoryNonFungibleToken::mint(AccountID const& to, TokenID tokenID)
{
    std::lock_guard lock(mutex_);
    return owners_.emplace(tokenID, to).second;
}

std::optional<AccountID>
MemoryNonFungibleToken::ownerOf(TokenID tokenID) const
{
    std::lock_guard lock(mutex_);
    auto const iter = owners_.find(tokenID);
    if (iter == owners_.end())
        return std::nullopt;
    return iter->second;
}

bool
MemoryNonFungibleToken::transferFrom(
    AccountID const& from,
    AccountID const& to,
    TokenID tokenID)
{
    std::lock_guard lock(mutex_);

    auto const iter = owners_.find(tokenID);
    if (iter == owners_.end() || iter->second != from)
    {
        JLOG(j_.debug()) << "Token " << tokenID << " is not owned by "
                         << from;
        return false;
    }

    iter->second = to;
    return true;
}

//------------------------------------------------------------------------------

void
MemoryScoreOracle::setScore(
    AccountID const& subject,
    std::int64_t score,
    NetClock::time_point updated)
{
    std::lock_guard lock(mutex_);
    ++round_;
    readings_[subject] = OracleReading{round_, score, updated, updated, round_};
}

void
MemoryScoreOracle::clearScore(AccountID const& subject)
{
    std::lock_guard lock(mutex_);
    readings_.erase(subject);
}

std::optional<OracleReading>
MemoryScoreOracle::latestReading(AccountID const& subject) const
{
    std::lock_guard lock(mutex_);
    auto const iter = readings_.find(subject);
    if (iter == readings_.end())
        return std::nullopt;
    return iter->second;
}

}  // namespace collat
