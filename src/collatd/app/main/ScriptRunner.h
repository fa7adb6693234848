#ifndef COLLAT_APP_MAIN_SCRIPTRUNNER_H_INCLUDED
#define COLLAT_APP_MAIN_SCRIPTRUNNER_H_INCLUDED

#include <collatd/app/misc/CollateralVault.h>
#include <collatd/app/misc/CreditGate.h>
#include <collatd/app/misc/InMemoryAssets.h>
#include <collatd/app/misc/LoanStateMachine.h>
#include <collatd/core/Config.h>
#include <collatd/core/TimeKeeper.h>
#include <collatd/ledger/LedgerStore.h>

#include <collat/basics/Log.h>

#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace collat {

/** Runs a lending script against in-memory collaborators.

    A script has one command per line. Blank lines and text following a
    `#` are ignored. Commands:

        mint <asset> <owner> <tokenID>
        fund <account> <amount>
        score <account> <score>|none
        verify <caller> <account> [true|false]
        request <borrower> <amount> <seconds> <asset> <tokenID>
        approve <caller> <loanID>
        repay <caller> <loanID>
        default <caller> <loanID>
        advance <seconds>
        show <loanID>
        balance <account>
        owner <asset> <tokenID>
        loans <borrower>
        vault

    Lending commands print the transaction result. A refused transaction
    does not stop the script; a malformed or unknown command does.
*/
class ScriptRunner
{
private:
    std::ostream& out_;
    Journal const j_;

    LedgerStore store_;
    ManualTimeKeeper timeKeeper_;
    std::shared_ptr<MemoryScoreOracle> oracle_;
    MemoryFungibleToken token_;
    std::map<AccountID, std::shared_ptr<MemoryNonFungibleToken>> assets_;
    CreditGate gate_;
    CollateralVault vault_;
    LoanStateMachine lsm_;

public:
    ScriptRunner(
        Config const& config,
        Logs& logs,
        std::ostream& out,
        NetClock::time_point start);

    /** Execute every command of a script.
        @return `false` at the first command that could not be executed.
    */
    bool
    run(std::istream& script);

    /** Execute a single line. */
    bool
    execute(std::string const& line);

    LoanStateMachine&
    stateMachine()
    {
        return lsm_;
    }

private:
    using Args = std::vector<std::string>;

    bool
    doMint(Args const& args);

    bool
    doFund(Args const& args);

    bool
    doScore(Args const& args);

    bool
    doVerify(Args const& args);

    bool
    doRequest(Args const& args);

    bool
    doLoanCommand(Args const& args);

    bool
    doAdvance(Args const& args);

    bool
    doShow(Args const& args);

    bool
    doBalance(Args const& args);

    bool
    doOwner(Args const& args);

    bool
    doLoans(Args const& args);

    bool
    doVault(Args const& args);

    std::shared_ptr<MemoryNonFungibleToken>
    asset(AccountID const& id) const;
};

}  // namespace collat

#endif
