#include <collatd/app/main/ScriptRunner.h>
//
#include <collatd/app/misc/LendingHelpers.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <optional>
#include <type_traits>

namespace collat {

namespace {

class EventPrinter : public LoanEventListener
{
    std::ostream& out_;

public:
    explicit EventPrinter(std::ostream& out) : out_(out)
    {
    }

    void
    onLoanEvent(LoanEvent const& event) override
    {
        out_ << "event: " << event << '\n';
    }
};

template <class T>
std::optional<T>
parseNumber(std::string const& text)
{
    if (text.empty() || (std::is_unsigned_v<T> && text[0] == '-'))
        return std::nullopt;

    try
    {
        return boost::lexical_cast<T>(text);
    }
    catch (boost::bad_lexical_cast const&)
    {
        return std::nullopt;
    }
}

}  // namespace

ScriptRunner::ScriptRunner(
    Config const& config,
    Logs& logs,
    std::ostream& out,
    NetClock::time_point start)
    : out_(out)
    , j_(logs.journal("Script"))
    , store_(logs.journal("LedgerStore"))
    , timeKeeper_(start)
    , oracle_(std::make_shared<MemoryScoreOracle>())
    , token_(config.RESERVE_ACCOUNT, logs.journal("Token"))
    , gate_(oracle_, logs.journal("CreditGate"))
    , vault_(config.VAULT_ACCOUNT, logs.journal("CollateralVault"))
    , lsm_(config,
           store_,
           gate_,
           vault_,
           token_,
           timeKeeper_,
           logs.journal("LoanStateMachine"))
{
    lsm_.subscribe(std::make_shared<EventPrinter>(out_));
}

bool
ScriptRunner::run(std::istream& script)
{
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(script, line))
    {
        ++lineNumber;
        if (!execute(line))
        {
            out_ << "error: line " << lineNumber << ": " << line << '\n';
            return false;
        }
    }

    return true;
}

bool
ScriptRunner::execute(std::string const& line)
{
    auto text = line.substr(0, line.find('#'));
    boost::algorithm::trim(text);
    if (text.empty())
        return true;

    Args args;
    boost::algorithm::split(
        args,
        text,
        boost::algorithm::is_any_of(" \t"),
        boost::algorithm::token_compress_on);

    auto const& command = args.front();

    JLOG(j_.trace()) << "execute: " << text;

    if (command == "mint")
        return doMint(args);
    if (command == "fund")
        return doFund(args);
    if (command == "score")
        return doScore(args);
    if (command == "verify")
        return doVerify(args);
    if (command == "request")
        return doRequest(args);
    if (command == "approve" || command == "repay" || command == "default")
        return doLoanCommand(args);
    if (command == "advance")
        return doAdvance(args);
    if (command == "show")
        return doShow(args);
    if (command == "balance")
        return doBalance(args);
    if (command == "owner")
        return doOwner(args);
    if (command == "loans")
        return doLoans(args);
    if (command == "vault")
        return doVault(args);

    JLOG(j_.error()) << "Unknown command '" << command << "'";
    return false;
}

std::shared_ptr<MemoryNonFungibleToken>
ScriptRunner::asset(AccountID const& id) const
{
    auto const iter = assets_.find(id);
    if (iter == assets_.end())
        return nullptr;
    return iter->second;
}

bool
ScriptRunner::doMint(Args const& args)
{
    if (args.size() != 4)
        return false;

    auto const assetID = parseAccount(args[1]);
    auto const owner = parseAccount(args[2]);
    auto const tokenID = parseNumber<TokenID>(args[3]);
    if (!assetID || !owner || !tokenID)
        return false;

    auto nft = asset(*assetID);
    if (!nft)
    {
        nft = std::make_shared<MemoryNonFungibleToken>(j_);
        assets_.emplace(*assetID, nft);
        vault_.addAsset(*assetID, nft);
    }

    if (!nft->mint(*owner, *tokenID))
    {
        out_ << "mint: token " << *tokenID << " already exists\n";
        return false;
    }

    out_ << "mint: " << CollateralRef{*assetID, *tokenID} << " to " << *owner
         << '\n';
    return true;
}

bool
ScriptRunner::doFund(Args const& args)
{
    if (args.size() != 3)
        return false;

    auto const account = parseAccount(args[1]);
    auto const amount = parseNumber<std::uint64_t>(args[2]);
    if (!account || !amount)
        return false;

    token_.mint(*account, *amount);
    out_ << "fund: " << *account << " " << token_.balanceOf(*account) << '\n';
    return true;
}

bool
ScriptRunner::doScore(Args const& args)
{
    if (args.size() != 3)
        return false;

    auto const account = parseAccount(args[1]);
    if (!account)
        return false;

    if (args[2] == "none")
    {
        oracle_->clearScore(*account);
        out_ << "score: " << *account << " none\n";
        return true;
    }

    auto const score = parseNumber<std::int64_t>(args[2]);
    if (!score)
        return false;

    oracle_->setScore(*account, *score, timeKeeper_.now());
    out_ << "score: " << *account << " " << *score << '\n';
    return true;
}

bool
ScriptRunner::doVerify(Args const& args)
{
    if (args.size() != 3 && args.size() != 4)
        return false;

    auto const caller = parseAccount(args[1]);
    auto const account = parseAccount(args[2]);
    if (!caller || !account)
        return false;

    bool verified = true;
    if (args.size() == 4)
    {
        if (boost::iequals(args[3], "false"))
            verified = false;
        else if (!boost::iequals(args[3], "true"))
            return false;
    }

    out_ << "verify: " << lsm_.verifyUser(*caller, *account, verified)
         << '\n';
    return true;
}

bool
ScriptRunner::doRequest(Args const& args)
{
    if (args.size() != 6)
        return false;

    auto const borrower = parseAccount(args[1]);
    auto const amount = parseNumber<std::uint64_t>(args[2]);
    auto const seconds = parseNumber<NetClock::rep>(args[3]);
    auto const assetID = parseAccount(args[4]);
    auto const tokenID = parseNumber<TokenID>(args[5]);
    if (!borrower || !amount || !seconds || !assetID || !tokenID)
        return false;

    auto const id = lsm_.request(
        *borrower,
        *amount,
        NetClock::duration{*seconds},
        CollateralRef{*assetID, *tokenID});

    if (id)
        out_ << "request: " << tesSUCCESS << " loan " << *id << '\n';
    else
        out_ << "request: " << id.error() << '\n';
    return true;
}

bool
ScriptRunner::doLoanCommand(Args const& args)
{
    if (args.size() != 3)
        return false;

    auto const caller = parseAccount(args[1]);
    auto const id = parseNumber<LoanID>(args[2]);
    if (!caller || !id)
        return false;

    auto const& command = args[0];
    TER result;
    if (command == "approve")
        result = lsm_.approve(*caller, *id);
    else if (command == "repay")
        result = lsm_.repay(*caller, *id);
    else
        result = lsm_.checkDefault(*caller, *id);

    out_ << command << ": " << result << '\n';
    return true;
}

bool
ScriptRunner::doAdvance(Args const& args)
{
    if (args.size() != 2)
        return false;

    auto const seconds = parseNumber<NetClock::rep>(args[1]);
    if (!seconds)
        return false;

    auto const now = timeKeeper_.now();
    if (dueTimeOverflows(now, NetClock::duration{*seconds}))
        return false;

    timeKeeper_.advance(NetClock::duration{*seconds});
    out_ << "advance: " << to_string(timeKeeper_.now()) << '\n';
    return true;
}

bool
ScriptRunner::doShow(Args const& args)
{
    if (args.size() != 2)
        return false;

    auto const id = parseNumber<LoanID>(args[1]);
    if (!id)
        return false;

    auto const loan = lsm_.getLoan(*id);
    if (!loan)
    {
        out_ << "show: " << loan.error() << '\n';
        return true;
    }

    out_ << "loan " << loan->id << ": borrower=" << loan->borrower
         << " principal=" << loan->principal
         << " rate=" << loan->interestRate
         << " duration=" << loan->duration.count()
         << " collateral=" << loan->collateral
         << " issued=" << to_string(loan->issuedTime)
         << " status=" << to_string(loan->status)
         << " disbursed=" << (loan->disbursed ? "true" : "false");

    if (auto const due = lsm_.repaymentDue(*id))
        out_ << " due=" << *due;

    out_ << '\n';
    return true;
}

bool
ScriptRunner::doBalance(Args const& args)
{
    if (args.size() != 2)
        return false;

    auto const account = parseAccount(args[1]);
    if (!account)
        return false;

    out_ << "balance " << *account << ": " << token_.balanceOf(*account)
         << '\n';
    return true;
}

bool
ScriptRunner::doOwner(Args const& args)
{
    if (args.size() != 3)
        return false;

    auto const assetID = parseAccount(args[1]);
    auto const tokenID = parseNumber<TokenID>(args[2]);
    if (!assetID || !tokenID)
        return false;

    CollateralRef const ref{*assetID, *tokenID};

    auto const nft = asset(*assetID);
    auto const owner = nft ? nft->ownerOf(*tokenID) : std::nullopt;
    if (!owner)
    {
        out_ << "owner " << ref << ": none\n";
        return true;
    }

    out_ << "owner " << ref << ": " << *owner << '\n';
    return true;
}

bool
ScriptRunner::doLoans(Args const& args)
{
    if (args.size() != 2)
        return false;

    auto const borrower = parseAccount(args[1]);
    if (!borrower)
        return false;

    out_ << "loans " << *borrower << ":";
    auto const ids = store_.loansOf(*borrower);
    if (ids.empty())
        out_ << " none";
    for (auto const id : ids)
        out_ << " " << id;
    out_ << '\n';
    return true;
}

bool
ScriptRunner::doVault(Args const& args)
{
    if (args.size() != 1)
        return false;

    out_ << "vault: " << vault_.activeLocks() << " locked\n";
    return true;
}

}  // namespace collat
