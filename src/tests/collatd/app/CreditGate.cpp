#include <collatd/app/misc/CreditGate.h>
#include <collatd/app/misc/InMemoryAssets.h>
#include <collatd/ledger/LedgerStore.h>

#include <doctest/doctest.h>

using namespace collat;

TEST_SUITE_BEGIN("CreditGate");

namespace {

struct GateFixture
{
    Journal const j{Journal::getNullSink()};
    std::shared_ptr<MemoryScoreOracle> oracle =
        std::make_shared<MemoryScoreOracle>();
    LedgerStore store{j};
    CreditGate gate{oracle, j};
    AccountID const alice{"alice"};
};

// Counts the readings it hands out.
class CountingOracle : public ScoreOracle
{
public:
    std::int64_t score = 700;
    mutable int calls = 0;

    std::optional<OracleReading>
    latestReading(AccountID const&) const override
    {
        ++calls;
        OracleReading r;
        r.roundID = static_cast<std::uint64_t>(calls);
        r.answer = score;
        r.answeredInRound = r.roundID;
        return r;
    }
};

}  // namespace

TEST_CASE_FIXTURE(GateFixture, "verified with a good score")
{
    store.setVerified(alice, true);
    oracle->setScore(alice, 700);
    CHECK(gate.checkEligible(store, alice) == tesSUCCESS);
    CHECK(gate.isEligible(store, alice));
}

TEST_CASE_FIXTURE(GateFixture, "unverified")
{
    oracle->setScore(alice, 900);
    CHECK(gate.checkEligible(store, alice) == tecNO_AUTH);
    CHECK_FALSE(gate.isEligible(store, alice));
}

TEST_CASE_FIXTURE(GateFixture, "score threshold is exclusive")
{
    store.setVerified(alice, true);

    oracle->setScore(alice, 600);
    CHECK(gate.checkEligible(store, alice) == tecINSUFFICIENT_SCORE);

    oracle->setScore(alice, 601);
    CHECK(gate.checkEligible(store, alice) == tesSUCCESS);

    oracle->setScore(alice, -5);
    CHECK(gate.checkEligible(store, alice) == tecINSUFFICIENT_SCORE);
}

TEST_CASE_FIXTURE(GateFixture, "no reading")
{
    store.setVerified(alice, true);
    CHECK(gate.checkEligible(store, alice) == tecORACLE_FAILURE);

    oracle->setScore(alice, 800);
    oracle->clearScore(alice);
    CHECK(gate.checkEligible(store, alice) == tecORACLE_FAILURE);
}

TEST_CASE("score is read on every check")
{
    Journal const j{Journal::getNullSink()};
    auto const oracle = std::make_shared<CountingOracle>();
    LedgerStore store{j};
    CreditGate gate{oracle, j};
    AccountID const alice{"alice"};
    store.setVerified(alice, true);

    CHECK(gate.isEligible(store, alice));
    oracle->score = 550;
    CHECK_FALSE(gate.isEligible(store, alice));
    oracle->score = 650;
    CHECK(gate.isEligible(store, alice));
    CHECK(oracle->calls == 3);
}

TEST_SUITE_END();
