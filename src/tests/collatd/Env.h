#ifndef COLLAT_TEST_ENV_H_INCLUDED
#define COLLAT_TEST_ENV_H_INCLUDED

#include <collatd/app/misc/CollateralVault.h>
#include <collatd/app/misc/CreditGate.h>
#include <collatd/app/misc/InMemoryAssets.h>
#include <collatd/app/misc/LoanStateMachine.h>
#include <collatd/core/Config.h>
#include <collatd/core/TimeKeeper.h>
#include <collatd/ledger/LedgerStore.h>

#include <collat/basics/Log.h>

#include <doctest/doctest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <mutex>
#include <string>
#include <vector>

namespace collat {
namespace test {

inline std::string const defaultConfig =
    "[lending]\n"
    "admin = ops\n"
    "reserve = treasury\n"
    "vault = vault\n"
    "liquidator = liquidator\n";

/** Records every published event. */
class EventRecorder : public LoanEventListener
{
    std::mutex mutable mutex_;
    std::vector<LoanEvent> events_;

public:
    void
    onLoanEvent(LoanEvent const& event) override
    {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    std::vector<LoanEvent>
    events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

    void
    clear()
    {
        std::lock_guard lock(mutex_);
        events_.clear();
    }
};

/** A lending engine wired to in-memory collaborators.

    The clock starts at `start` and only moves when told to. One asset
    contract, `assetA`, is accepted as collateral.
*/
class Env
{
public:
    static NetClock::time_point constexpr start{NetClock::duration{100000}};

    std::unique_ptr<Config> config;
    Logs logs;
    LedgerStore store;
    ManualTimeKeeper clock;
    std::shared_ptr<MemoryScoreOracle> oracle;
    MemoryFungibleToken token;
    std::shared_ptr<MemoryNonFungibleToken> nft;
    CreditGate gate;
    CollateralVault vault;
    LoanStateMachine lsm;
    std::shared_ptr<EventRecorder> recorder;

    AccountID const admin{"ops"};
    AccountID const reserve{"treasury"};
    AccountID const vaultAccount{"vault"};
    AccountID const liquidator{"liquidator"};
    AccountID const assetA{"assetA"};

    explicit Env(std::string const& configText = defaultConfig)
        : config(makeConfig(configText))
        , logs(severities::kFatal)
        , store(logs.journal("LedgerStore"))
        , clock(start)
        , oracle(std::make_shared<MemoryScoreOracle>())
        , token(config->RESERVE_ACCOUNT, logs.journal("Token"))
        , nft(std::make_shared<MemoryNonFungibleToken>(logs.journal("NFT")))
        , gate(oracle, logs.journal("CreditGate"))
        , vault(config->VAULT_ACCOUNT, logs.journal("CollateralVault"))
        , lsm(*config,
              store,
              gate,
              vault,
              token,
              clock,
              logs.journal("LoanStateMachine"))
        , recorder(std::make_shared<EventRecorder>())
    {
        logs.silent(true);
        vault.addAsset(assetA, nft);
        lsm.subscribe(recorder);
    }

    /** Verify the account, give it a score and a token to pledge. */
    void
    borrower(AccountID const& account, std::int64_t score, TokenID tokenID)
    {
        REQUIRE(lsm.verifyUser(admin, account, true) == tesSUCCESS);
        oracle->setScore(account, score, clock.now());
        REQUIRE(nft->mint(account, tokenID));
    }

    CollateralRef
    collateral(TokenID tokenID) const
    {
        return CollateralRef{assetA, tokenID};
    }

    std::optional<AccountID>
    ownerOf(TokenID tokenID) const
    {
        return nft->ownerOf(tokenID);
    }

    std::uint64_t
    balance(AccountID const& account) const
    {
        return token.balanceOf(account);
    }

private:
    static std::unique_ptr<Config>
    makeConfig(std::string const& text)
    {
        auto config = std::make_unique<Config>();
        config->loadFromString(text);
        return config;
    }
};

}  // namespace test
}  // namespace collat

#endif
