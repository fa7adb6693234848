#ifndef COLLAT_PROTOCOL_LOAN_H_INCLUDED
#define COLLAT_PROTOCOL_LOAN_H_INCLUDED

#include <collat/basics/chrono.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/TER.h>

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>

namespace collat {

/** Identifies a loan. Zero denotes "no loan". */
using LoanID = std::uint64_t;

/** Identifies a token within a non-fungible asset contract. */
using TokenID = std::uint64_t;

/** Identifies a collateral lock held by the vault. Zero is never issued. */
using LockHandle = std::uint64_t;

/** Lifecycle status of a loan.

    Repaid and Defaulted are terminal: once reached the status never changes
    again.
*/
enum class LoanStatus : std::uint8_t { requested, repaid, defaulted };

std::string
to_string(LoanStatus status);

/** A non-fungible asset: the asset contract identity plus the token id. */
struct CollateralRef
{
    AccountID asset;
    TokenID tokenID = 0;

    auto
    operator<=>(CollateralRef const&) const = default;
};

std::string
to_string(CollateralRef const& collateral);

std::ostream&
operator<<(std::ostream& os, CollateralRef const& collateral);

/** The ledger record of one loan. */
struct Loan
{
    LoanID id = 0;
    AccountID borrower;
    std::uint64_t principal = 0;

    // Percent, fixed at issuance.
    std::uint32_t interestRate = 0;

    NetClock::duration duration{0};
    CollateralRef collateral;
    LockHandle collateralLock = 0;
    NetClock::time_point issuedTime{};

    LoanStatus status = LoanStatus::requested;

    // Set once the principal has been sent to the borrower.
    bool disbursed = false;

    bool
    isTerminal() const
    {
        return status != LoanStatus::requested;
    }

    /** The last instant at which the loan is not yet in default. */
    NetClock::time_point
    dueTime() const
    {
        return issuedTime + duration;
    }
};

/** Move a loan to a terminal status.

    @return tecLOAN_FINALIZED if the loan already is terminal, otherwise
            tesSUCCESS with the status updated.
*/
TER
finalizeLoan(Loan& loan, LoanStatus status);

/** Record the disbursement of the principal.

    @return tecLOAN_FINALIZED for a terminal loan, tecALREADY_DISBURSED if
            the principal was already sent, otherwise tesSUCCESS.
*/
TER
disburseLoan(Loan& loan);

}  // namespace collat

#endif
