#ifndef COLLAT_PROTOCOL_LENDINGTX_H_INCLUDED
#define COLLAT_PROTOCOL_LENDINGTX_H_INCLUDED

#include <collat/basics/chrono.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>

#include <cstdint>
#include <string>
#include <utility>

namespace collat {

/** Transaction types understood by the lending engine. */
enum TxType : std::uint16_t {
    ttACCOUNT_VERIFY = 1,
    ttLOAN_REQUEST = 2,
    ttLOAN_APPROVE = 3,
    ttLOAN_REPAY = 4,
    ttLOAN_DEFAULT = 5,
};

std::string
to_string(TxType type);

/** A lending transaction.

    Every transaction names the submitting account. The remaining fields
    are meaningful only for the transaction types that use them:

    ttACCOUNT_VERIFY  subject, verified
    ttLOAN_REQUEST    amount, duration, collateral
    ttLOAN_APPROVE    loanID
    ttLOAN_REPAY      loanID
    ttLOAN_DEFAULT    loanID
*/
struct LendingTx
{
    TxType type;
    AccountID account;

    LoanID loanID = 0;
    std::uint64_t amount = 0;
    NetClock::duration duration{0};
    CollateralRef collateral;

    AccountID subject;
    bool verified = false;

    static LendingTx
    makeAccountVerify(AccountID account, AccountID subject, bool verified)
    {
        LendingTx tx{ttACCOUNT_VERIFY, std::move(account)};
        tx.subject = std::move(subject);
        tx.verified = verified;
        return tx;
    }

    static LendingTx
    makeLoanRequest(
        AccountID account,
        std::uint64_t amount,
        NetClock::duration duration,
        CollateralRef collateral)
    {
        LendingTx tx{ttLOAN_REQUEST, std::move(account)};
        tx.amount = amount;
        tx.duration = duration;
        tx.collateral = std::move(collateral);
        return tx;
    }

    static LendingTx
    makeLoanApprove(AccountID account, LoanID loanID)
    {
        LendingTx tx{ttLOAN_APPROVE, std::move(account)};
        tx.loanID = loanID;
        return tx;
    }

    static LendingTx
    makeLoanRepay(AccountID account, LoanID loanID)
    {
        LendingTx tx{ttLOAN_REPAY, std::move(account)};
        tx.loanID = loanID;
        return tx;
    }

    static LendingTx
    makeLoanDefault(AccountID account, LoanID loanID)
    {
        LendingTx tx{ttLOAN_DEFAULT, std::move(account)};
        tx.loanID = loanID;
        return tx;
    }
};

}  // namespace collat

#endif
