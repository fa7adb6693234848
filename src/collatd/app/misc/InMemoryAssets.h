#ifndef COLLAT_APP_MISC_INMEMORYASSETS_H_INCLUDED
#define COLLAT_APP_MISC_INMEMORYASSETS_H_INCLUDED

#include <collatd/app/misc/FungibleToken.h>
#include <collatd/app/misc/NonFungibleToken.h>
#include <collatd/app/misc/ScoreOracle.h>

#include <collat/basics/Journal.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace collat {

/** An in-process stable value ledger.

    transfer draws on the reserve account. A transfer is refused if the
    payer's balance is too small.
*/
class MemoryFungibleToken : public FungibleToken
{
private:
    AccountID const reserve_;
    Journal const j_;

    std::mutex mutable mutex_;
    std::map<AccountID, std::uint64_t> balances_;

public:
    MemoryFungibleToken(AccountID reserve, Journal journal);

    /** Create new value in an account. */
    void
    mint(AccountID const& to, std::uint64_t amount);

    std::uint64_t
    balanceOf(AccountID const& account) const;

    bool
    transfer(AccountID const& to, std::uint64_t amount) override;

    bool
    transferFrom(
        AccountID const& from,
        AccountID const& to,
        std::uint64_t amount) override;

private:
    bool
    move(AccountID const& from, AccountID const& to, std::uint64_t amount);
};

/** An in-process asset contract. A transfer is refused unless `from`
    owns the token.
*/
class MemoryNonFungibleToken : public NonFungibleToken
{
private:
    Journal const j_;

    std::mutex mutable mutex_;
    std::map<TokenID, AccountID> owners_;

public:
    explicit MemoryNonFungibleToken(Journal journal);

    /** Create a token. Returns `false` if the id is taken. */
    bool
    mint(AccountID const& to, TokenID tokenID);

    std::optional<AccountID>
    ownerOf(TokenID tokenID) const;

    bool
    transferFrom(AccountID const& from, AccountID const& to, TokenID tokenID)
        override;
};

/** An in-process score oracle publishing one score per account.

    Every update starts a new round.
*/
class MemoryScoreOracle : public ScoreOracle
{
private:
    std::mutex mutable mutex_;
    std::map<AccountID, OracleReading> readings_;
    std::uint64_t round_ = 0;

public:
    void
    setScore(
        AccountID const& subject,
        std::int64_t score,
        NetClock::time_point updated = {});

    void
    clearScore(AccountID const& subject);

    std::optional<OracleReading>
    latestReading(AccountID const& subject) const override;
};

}  // namespace collat

#endif
