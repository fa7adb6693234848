#include <tests/collatd/Env.h>

#include <collatd/app/misc/LendingHelpers.h>

#include <doctest/doctest.h>

#include <atomic>
#include <functional>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace collat;
using namespace collat::test;

TEST_SUITE_BEGIN("LoanStateMachine");

namespace {

NetClock::duration const hour{3600};

// An asset contract whose transfers can be made to fail.
class FlakyNonFungibleToken : public MemoryNonFungibleToken
{
public:
    using MemoryNonFungibleToken::MemoryNonFungibleToken;

    // Consulted before every transfer; returning false refuses it.
    std::function<bool(AccountID const& from, AccountID const& to)> hook;

    bool throwNext = false;

    bool
    transferFrom(AccountID const& from, AccountID const& to, TokenID tokenID)
        override
    {
        if (throwNext)
        {
            throwNext = false;
            throw std::runtime_error("asset contract unavailable");
        }
        if (hook && !hook(from, to))
            return false;
        return MemoryNonFungibleToken::transferFrom(from, to, tokenID);
    }
};

struct LoanFixture : Env
{
    AccountID const alice{"alice"};
    AccountID const bob{"bob"};

    LoanFixture()
    {
        token.mint(reserve, 100000);
    }

    LoanID
    openLoan(AccountID const& borrower, TokenID tokenID, std::uint64_t amount)
    {
        auto const id = lsm.request(borrower, amount, hour, collateral(tokenID));
        REQUIRE(id);
        return *id;
    }
};

}  // namespace

TEST_CASE_FIXTURE(LoanFixture, "request, approve and repay")
{
    borrower(alice, 700, 7);
    recorder->clear();

    auto const id = lsm.request(alice, 1000, hour, collateral(7));
    REQUIRE(id);
    CHECK(*id == 1);
    CHECK(ownerOf(7) == vaultAccount);

    auto loan = lsm.getLoan(1);
    REQUIRE(loan);
    CHECK(loan->borrower == alice);
    CHECK(loan->principal == 1000);
    CHECK(loan->interestRate == 5);
    CHECK(loan->duration == hour);
    CHECK(loan->collateral == collateral(7));
    CHECK(loan->issuedTime == Env::start);
    CHECK(loan->status == LoanStatus::requested);
    CHECK_FALSE(loan->disbursed);
    CHECK(vault.find(loan->collateralLock)->custody ==
          CollateralVault::Custody::lockedByVault);

    CHECK(lsm.approve(admin, 1) == tesSUCCESS);
    CHECK(balance(alice) == 1000);
    CHECK(balance(reserve) == 99000);
    CHECK(lsm.getLoan(1)->disbursed);

    // The borrower needs the interest on top of the principal.
    token.mint(alice, 50);
    CHECK(*lsm.repaymentDue(1) == 1050);

    CHECK(lsm.repay(alice, 1) == tesSUCCESS);
    CHECK(balance(alice) == 0);
    CHECK(balance(reserve) == 100050);
    CHECK(ownerOf(7) == alice);
    CHECK(lsm.getLoan(1)->status == LoanStatus::repaid);
    CHECK(vault.activeLocks() == 0);

    CHECK(lsm.repay(alice, 1) == tecLOAN_FINALIZED);
    CHECK(lsm.checkDefault(bob, 1) == tecLOAN_FINALIZED);
    clock.advance(hour * 2);
    CHECK(lsm.checkDefault(bob, 1) == tecLOAN_FINALIZED);
    CHECK(lendingError(lsm.repay(alice, 1)) == LendingError::alreadyFinalized);

    std::vector<LoanEvent> const expected{
        {LoanEvent::requested, 1, alice, 1000},
        {LoanEvent::approved, 1, alice, 1000},
        {LoanEvent::repaid, 1, alice, std::nullopt},
    };
    CHECK(recorder->events() == expected);
}

TEST_CASE_FIXTURE(LoanFixture, "unknown loans")
{
    borrower(alice, 700, 7);
    openLoan(alice, 7, 100);

    for (LoanID const id : {LoanID{0}, LoanID{2}, LoanID{77}})
    {
        CAPTURE(id);
        CHECK(lsm.getLoan(id).error() == tecNO_ENTRY);
        CHECK(lsm.approve(admin, id) == tecNO_ENTRY);
        CHECK(lsm.repay(alice, id) == tecNO_ENTRY);
        CHECK(lsm.checkDefault(alice, id) == tecNO_ENTRY);
        CHECK(lsm.repaymentDue(id).error() == tecNO_ENTRY);
        CHECK_FALSE(lsm.isDue(id));
        CHECK(lendingError(lsm.getLoan(id).error()) == LendingError::notFound);
    }
}

TEST_CASE_FIXTURE(LoanFixture, "ineligible borrowers")
{
    REQUIRE(nft->mint(alice, 7));
    oracle->setScore(alice, 900);

    SUBCASE("unverified")
    {
        auto const id = lsm.request(alice, 1000, hour, collateral(7));
        REQUIRE_FALSE(id);
        CHECK(id.error() == tecNO_AUTH);
        CHECK(lendingError(id.error()) == LendingError::preconditionFailed);
    }

    SUBCASE("score at the threshold")
    {
        REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
        oracle->setScore(alice, 600);
        auto const id = lsm.request(alice, 1000, hour, collateral(7));
        REQUIRE_FALSE(id);
        CHECK(id.error() == tecINSUFFICIENT_SCORE);
        CHECK(lendingError(id.error()) == LendingError::preconditionFailed);
    }

    SUBCASE("no oracle reading")
    {
        REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
        oracle->clearScore(alice);
        auto const id = lsm.request(alice, 1000, hour, collateral(7));
        REQUIRE_FALSE(id);
        CHECK(id.error() == tecORACLE_FAILURE);
    }

    SUBCASE("verification revoked")
    {
        REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
        REQUIRE(lsm.verifyUser(admin, alice, false) == tesSUCCESS);
        CHECK_FALSE(lsm.isEligible(alice));
        auto const id = lsm.request(alice, 1000, hour, collateral(7));
        REQUIRE_FALSE(id);
        CHECK(id.error() == tecNO_AUTH);
    }

    CHECK(ownerOf(7) == alice);
    CHECK(store.size() == 0);
    CHECK(store.nextLoanID() == 1);
}

TEST_CASE_FIXTURE(LoanFixture, "score is evaluated on every request")
{
    borrower(alice, 700, 7);
    REQUIRE(nft->mint(alice, 8));

    CHECK(lsm.isEligible(alice));
    openLoan(alice, 7, 100);

    oracle->setScore(alice, 500);
    CHECK_FALSE(lsm.isEligible(alice));
    auto const second = lsm.request(alice, 100, hour, collateral(8));
    REQUIRE_FALSE(second);
    CHECK(second.error() == tecINSUFFICIENT_SCORE);
    CHECK(ownerOf(8) == alice);
}

TEST_CASE_FIXTURE(LoanFixture, "only the administrator verifies")
{
    CHECK(lsm.verifyUser(alice, alice, true) == tecNO_PERMISSION);
    CHECK(lendingError(lsm.verifyUser(bob, alice, true)) ==
          LendingError::unauthorized);
    CHECK_FALSE(store.isVerified(alice));

    CHECK(lsm.verifyUser(admin, AccountID{}, true) == temINVALID);
    CHECK(lsm.verifyUser(AccountID{}, alice, true) == temBAD_SRC_ACCOUNT);

    CHECK(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
    CHECK(store.isVerified(alice));
}

TEST_CASE_FIXTURE(LoanFixture, "malformed requests")
{
    borrower(alice, 700, 7);

    auto check = [&](std::uint64_t amount,
                     NetClock::duration duration,
                     CollateralRef const& ref,
                     TER expected) {
        auto const id = lsm.request(alice, amount, duration, ref);
        REQUIRE_FALSE(id);
        CHECK(id.error() == expected);
    };

    check(0, hour, collateral(7), temBAD_AMOUNT);
    check(Lending::maxPrincipal + 1, hour, collateral(7), temBAD_AMOUNT);
    check(100, hour, CollateralRef{}, temMALFORMED);
    check(
        100,
        NetClock::duration{std::numeric_limits<NetClock::rep>::max()},
        collateral(7),
        tecKILLED);
    check(100, hour, CollateralRef{AccountID{"assetB"}, 7}, tecNO_ISSUER);
    check(100, hour, collateral(8), tecCOLLATERAL_TRANSFER);

    auto const anonymous = lsm.request(AccountID{}, 100, hour, collateral(7));
    REQUIRE_FALSE(anonymous);
    CHECK(anonymous.error() == temBAD_SRC_ACCOUNT);

    CHECK(ownerOf(7) == alice);
    CHECK(store.size() == 0);
}

TEST_CASE_FIXTURE(LoanFixture, "collateral secures one loan")
{
    borrower(alice, 700, 7);
    borrower(bob, 700, 8);
    openLoan(alice, 7, 100);

    // Even the vault's own token can not be pledged twice.
    auto const id = lsm.request(bob, 100, hour, collateral(7));
    REQUIRE_FALSE(id);
    CHECK(id.error() == tecDUPLICATE);
}

TEST_CASE_FIXTURE(LoanFixture, "ids increase")
{
    borrower(alice, 700, 1);
    borrower(bob, 700, 2);
    REQUIRE(nft->mint(alice, 3));

    CHECK(openLoan(alice, 1, 10) == 1);
    CHECK(openLoan(bob, 2, 10) == 2);

    // A failed request does not consume an id.
    CHECK_FALSE(lsm.request(bob, 10, hour, collateral(3)));
    CHECK(openLoan(alice, 3, 10) == 3);
    CHECK((store.loansOf(alice) == std::vector<LoanID>{1, 3}));
}

TEST_CASE_FIXTURE(LoanFixture, "approval")
{
    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 1000);

    CHECK(lsm.approve(alice, id) == tecNO_PERMISSION);
    CHECK(balance(alice) == 0);

    CHECK(lsm.approve(admin, id) == tesSUCCESS);
    CHECK(balance(alice) == 1000);

    // The principal is disbursed once.
    CHECK(lsm.approve(admin, id) == tecALREADY_DISBURSED);
    CHECK(balance(alice) == 1000);
    CHECK(lendingError(tecALREADY_DISBURSED) ==
          LendingError::preconditionFailed);

    token.mint(alice, 50);
    REQUIRE(lsm.repay(alice, id) == tesSUCCESS);
    CHECK(lsm.approve(admin, id) == tecLOAN_FINALIZED);
}

TEST_CASE_FIXTURE(LoanFixture, "refused disbursement changes nothing")
{
    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 200000);
    recorder->clear();

    CHECK(lsm.approve(admin, id) == tecUNFUNDED_PAYMENT);
    CHECK(balance(alice) == 0);
    CHECK(balance(reserve) == 100000);
    CHECK_FALSE(lsm.getLoan(id)->disbursed);
    CHECK(recorder->events().empty());

    token.mint(reserve, 100000);
    CHECK(lsm.approve(admin, id) == tesSUCCESS);
    CHECK(balance(alice) == 200000);
}

TEST_CASE_FIXTURE(LoanFixture, "repayment")
{
    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 1000);
    REQUIRE(lsm.approve(admin, id) == tesSUCCESS);
    recorder->clear();

    // Only the borrower repays.
    token.mint(bob, 5000);
    CHECK(lsm.repay(bob, id) == tecNO_PERMISSION);
    CHECK(balance(bob) == 5000);

    // Not enough to cover the interest.
    CHECK(lsm.repay(alice, id) == tecUNFUNDED_PAYMENT);
    CHECK(balance(alice) == 1000);
    CHECK(ownerOf(7) == vaultAccount);
    CHECK(lsm.getLoan(id)->status == LoanStatus::requested);
    CHECK(recorder->events().empty());

    token.mint(alice, 50);
    CHECK(lsm.repay(alice, id) == tesSUCCESS);
    CHECK(balance(alice) == 0);
    CHECK(ownerOf(7) == alice);
    CHECK(lsm.repaymentDue(id).error() == tecLOAN_FINALIZED);
}

TEST_CASE_FIXTURE(LoanFixture, "repayment without approval")
{
    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 1000);

    token.mint(alice, 1050);
    CHECK(lsm.repay(alice, id) == tesSUCCESS);
    CHECK(balance(reserve) == 101050);
    CHECK(ownerOf(7) == alice);
}

TEST_CASE_FIXTURE(LoanFixture, "default timing")
{
    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 1000);
    REQUIRE(lsm.approve(admin, id) == tesSUCCESS);
    recorder->clear();

    CHECK_FALSE(lsm.isDue(id));
    CHECK(lsm.checkDefault(bob, id) == tecTOO_SOON);

    // Exactly at the due time the loan is not yet in default.
    clock.advance(hour);
    CHECK_FALSE(lsm.isDue(id));
    CHECK(lsm.checkDefault(bob, id) == tecTOO_SOON);
    CHECK(lendingError(tecTOO_SOON) == LendingError::preconditionFailed);
    CHECK(ownerOf(7) == vaultAccount);

    clock.advance(NetClock::duration{1});
    CHECK(lsm.isDue(id));
    CHECK(lsm.checkDefault(bob, id) == tesSUCCESS);
    CHECK(ownerOf(7) == liquidator);
    CHECK(lsm.getLoan(id)->status == LoanStatus::defaulted);
    CHECK_FALSE(lsm.isDue(id));
    CHECK(vault.activeLocks() == 0);

    std::vector<LoanEvent> const expected{
        {LoanEvent::defaulted, id, alice, std::nullopt},
        {LoanEvent::collateralLiquidated, id, alice, std::nullopt},
    };
    CHECK(recorder->events() == expected);

    // A defaulted loan is final.
    CHECK(lsm.checkDefault(bob, id) == tecLOAN_FINALIZED);
    token.mint(alice, 50);
    CHECK(lsm.repay(alice, id) == tecLOAN_FINALIZED);
    CHECK(balance(alice) == 1050);
    CHECK(lsm.approve(admin, id) == tecLOAN_FINALIZED);
}

TEST_CASE("liquidator defaults to the administrator")
{
    Env env(
        "[lending]\n"
        "admin = ops\n"
        "reserve = treasury\n"
        "vault = vault\n");
    AccountID const alice{"alice"};

    env.borrower(alice, 700, 7);
    auto const id =
        env.lsm.request(alice, 10, NetClock::duration{0}, env.collateral(7));
    REQUIRE(id);

    env.clock.advance(NetClock::duration{1});
    CHECK(env.lsm.checkDefault(alice, *id) == tesSUCCESS);
    CHECK(env.ownerOf(7) == env.admin);
}

TEST_CASE_FIXTURE(LoanFixture, "failed release rolls back the repayment")
{
    AccountID const assetF{"assetF"};
    auto const flaky = std::make_shared<FlakyNonFungibleToken>(
        Journal{Journal::getNullSink()});
    vault.addAsset(assetF, flaky);

    REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
    oracle->setScore(alice, 700);
    REQUIRE(flaky->mint(alice, 1));

    auto const id = lsm.request(alice, 1000, hour, CollateralRef{assetF, 1});
    REQUIRE(id);
    token.mint(alice, 1050);
    recorder->clear();

    flaky->hook = [this](AccountID const& from, AccountID const&) {
        return from != vaultAccount;
    };

    CHECK(lsm.repay(alice, *id) == tecCOLLATERAL_TRANSFER);
    CHECK(balance(alice) == 1050);
    CHECK(balance(reserve) == 100000);
    CHECK(flaky->ownerOf(1) == vaultAccount);
    CHECK(lsm.getLoan(*id)->status == LoanStatus::requested);
    CHECK(recorder->events().empty());

    flaky->hook = nullptr;
    CHECK(lsm.repay(alice, *id) == tesSUCCESS);
    CHECK(flaky->ownerOf(1) == alice);
}

TEST_CASE_FIXTURE(LoanFixture, "exceptions roll back")
{
    AccountID const assetF{"assetF"};
    auto const flaky = std::make_shared<FlakyNonFungibleToken>(
        Journal{Journal::getNullSink()});
    vault.addAsset(assetF, flaky);

    REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
    oracle->setScore(alice, 700);
    REQUIRE(flaky->mint(alice, 1));

    flaky->throwNext = true;
    auto const failed =
        lsm.request(alice, 1000, hour, CollateralRef{assetF, 1});
    REQUIRE_FALSE(failed);
    CHECK(failed.error() == tefEXCEPTION);
    CHECK(lendingError(failed.error()) == LendingError::internal);
    CHECK(flaky->ownerOf(1) == alice);
    CHECK(store.size() == 0);

    auto const id = lsm.request(alice, 1000, hour, CollateralRef{assetF, 1});
    REQUIRE(id);
    token.mint(alice, 1050);

    flaky->throwNext = true;
    CHECK(lsm.repay(alice, *id) == tefEXCEPTION);
    CHECK(balance(alice) == 1050);
    CHECK(flaky->ownerOf(1) == vaultAccount);
    CHECK(lsm.getLoan(*id)->status == LoanStatus::requested);
}

TEST_CASE_FIXTURE(LoanFixture, "failed rollback is reported")
{
    AccountID const assetF{"assetF"};
    AccountID const thief{"thief"};
    auto const flaky = std::make_shared<FlakyNonFungibleToken>(
        Journal{Journal::getNullSink()});
    vault.addAsset(assetF, flaky);

    REQUIRE(lsm.verifyUser(admin, alice, true) == tesSUCCESS);
    oracle->setScore(alice, 700);
    REQUIRE(flaky->mint(alice, 1));

    auto const id = lsm.request(alice, 1000, hour, CollateralRef{assetF, 1});
    REQUIRE(id);
    token.mint(alice, 1050);

    // Refuse the release and empty the reserve so the refund fails too.
    flaky->hook = [this, &thief](AccountID const& from, AccountID const&) {
        if (from != vaultAccount)
            return true;
        REQUIRE(token.transferFrom(reserve, thief, balance(reserve)));
        return false;
    };

    auto const ter = lsm.repay(alice, *id);
    CHECK(ter == tefBAD_LEDGER);
    CHECK(lendingError(ter) == LendingError::internal);
    CHECK(lsm.getLoan(*id)->status == LoanStatus::requested);
}

TEST_CASE_FIXTURE(LoanFixture, "concurrent requests receive distinct ids")
{
    int const threads = 8;
    int const perThread = 10;

    for (int t = 0; t < threads; ++t)
    {
        AccountID const account{"user" + std::to_string(t)};
        REQUIRE(lsm.verifyUser(admin, account, true) == tesSUCCESS);
        oracle->setScore(account, 700);
        for (int i = 0; i < perThread; ++i)
            REQUIRE(nft->mint(account, t * perThread + i));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([&, t]() {
            AccountID const account{"user" + std::to_string(t)};
            for (int i = 0; i < perThread; ++i)
            {
                if (!lsm.request(account, 10, hour, collateral(t * perThread + i)))
                    ++failures;
            }
        });
    }
    for (auto& worker : workers)
        worker.join();

    CHECK(failures == 0);
    CHECK(store.size() == threads * perThread);
    CHECK(store.nextLoanID() == threads * perThread + 1);
    for (LoanID id = 1; id <= threads * perThread; ++id)
        CHECK(lsm.getLoan(id)->id == id);
    CHECK(recorder->events().size() ==
          static_cast<std::size_t>(threads * perThread));
}

TEST_CASE_FIXTURE(LoanFixture, "repay and default race to one outcome")
{
    int const loans = 20;
    borrower(alice, 700, 0);
    for (int i = 1; i < loans; ++i)
        REQUIRE(nft->mint(alice, i));

    std::vector<LoanID> ids;
    for (int i = 0; i < loans; ++i)
        ids.push_back(openLoan(alice, i, 100));
    token.mint(alice, 105 * loans);
    clock.advance(hour + NetClock::duration{1});

    std::vector<TER> repaid(loans);
    std::vector<TER> defaulted(loans);
    std::thread repayer([&]() {
        for (int i = 0; i < loans; ++i)
            repaid[i] = lsm.repay(alice, ids[i]);
    });
    std::thread defaulter([&]() {
        for (int i = loans - 1; i >= 0; --i)
            defaulted[i] = lsm.checkDefault(bob, ids[i]);
    });
    repayer.join();
    defaulter.join();

    for (int i = 0; i < loans; ++i)
    {
        CAPTURE(i);
        CHECK(isTesSuccess(repaid[i]) != isTesSuccess(defaulted[i]));
        auto const loan = lsm.getLoan(ids[i]);
        if (isTesSuccess(repaid[i]))
        {
            CHECK(defaulted[i] == tecLOAN_FINALIZED);
            CHECK(loan->status == LoanStatus::repaid);
            CHECK(ownerOf(i) == alice);
        }
        else
        {
            CHECK(repaid[i] == tecLOAN_FINALIZED);
            CHECK(loan->status == LoanStatus::defaulted);
            CHECK(ownerOf(i) == liquidator);
        }
    }
}

TEST_CASE_FIXTURE(LoanFixture, "credits that would overflow are refused")
{
    auto const max = std::numeric_limits<std::uint64_t>::max();

    borrower(alice, 700, 7);
    auto const id = openLoan(alice, 7, 1000);
    token.mint(alice, max - 10);
    recorder->clear();

    CHECK(lsm.approve(admin, id) == tecUNFUNDED_PAYMENT);
    CHECK(balance(alice) == max - 10);
    CHECK(balance(reserve) == 100000);
    CHECK_FALSE(lsm.getLoan(id)->disbursed);
    CHECK(recorder->events().empty());

    // The same guard protects the reserve on repayment.
    REQUIRE(token.transferFrom(alice, bob, max - 10));
    token.mint(alice, 1050);
    token.mint(reserve, max - 100000 - 10);
    CHECK(lsm.repay(alice, id) == tecUNFUNDED_PAYMENT);
    CHECK(balance(alice) == 1050);
    CHECK(balance(reserve) == max - 10);
    CHECK(ownerOf(7) == vaultAccount);
    CHECK(lsm.getLoan(id)->status == LoanStatus::requested);
}

namespace {

class ThrowingListener : public LoanEventListener
{
public:
    void
    onLoanEvent(LoanEvent const&) override
    {
        throw std::runtime_error("listener unavailable");
    }
};

}  // namespace

TEST_CASE_FIXTURE(LoanFixture, "listener failures do not hide a commit")
{
    auto const later = std::make_shared<EventRecorder>();
    lsm.subscribe(std::make_shared<ThrowingListener>());
    lsm.subscribe(later);

    borrower(alice, 700, 7);
    auto const id = lsm.request(alice, 1000, hour, collateral(7));
    REQUIRE(id);
    CHECK(*id == 1);
    CHECK(store.size() == 1);
    CHECK(ownerOf(7) == vaultAccount);

    CHECK(lsm.approve(admin, *id) == tesSUCCESS);
    CHECK(balance(alice) == 1000);

    std::vector<LoanEvent> const expected{
        {LoanEvent::requested, 1, alice, 1000},
        {LoanEvent::approved, 1, alice, 1000},
    };
    CHECK(recorder->events() == expected);
    CHECK(later->events() == expected);
}

TEST_SUITE_END();
