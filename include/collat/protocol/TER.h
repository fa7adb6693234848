//------------------------------------------------------------------------------
/*
    This file is part of collatd
    Copyright (c) 2024 Ripple Labs Inc.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#ifndef COLLAT_PROTOCOL_TER_H_INCLUDED
#define COLLAT_PROTOCOL_TER_H_INCLUDED

#include <optional>
#include <ostream>
#include <string>

namespace collat {

// Transaction engine results.
//
// Note: Ranges are stable. Every code is explicitly numbered so that a value
//       never changes meaning once it has been reported to a caller.
//
enum TER : int  // aka TransactionEngineResult
{
    // -299 .. -200: M Malformed
    // Causes:
    // - The transaction is malformed.
    // Implications:
    // - Not applied
    // - Can not succeed in any imagined ledger.
    temMALFORMED = -299,
    temBAD_AMOUNT = -298,
    temBAD_SRC_ACCOUNT = -297,
    temINVALID = -296,
    temUNKNOWN = -295,

    // -199 .. -100: F Failure
    // Causes:
    // - Unexpected ledger state.
    // - C++ exception.
    // Implications:
    // - Not applied
    // - The ledger and an external collaborator may disagree.
    tefFAILURE = -199,
    tefBAD_LEDGER = -198,
    tefEXCEPTION = -197,
    tefINTERNAL = -196,

    // 0: S Success
    // Implications:
    // - Applied
    tesSUCCESS = 0,

    // 100 .. 199 C Claim
    // Causes:
    // - The ledger state does not allow the transaction.
    // Implications:
    // - Not applied
    // - Could succeed once the precondition is corrected.
    tecNO_PERMISSION = 139,
    tecNO_ENTRY = 140,
    tecNO_AUTH = 134,
    tecNO_ISSUER = 133,
    tecDUPLICATE = 149,
    tecKILLED = 150,
    tecDIR_FULL = 121,
    tecUNFUNDED_PAYMENT = 104,
    tecTOO_SOON = 186,
    tecLOAN_FINALIZED = 190,
    tecALREADY_DISBURSED = 191,
    tecINSUFFICIENT_SCORE = 192,
    tecORACLE_FAILURE = 193,
    tecCOLLATERAL_TRANSFER = 194,
    tecINVALID_LOCK = 195,
};

inline bool
isTemMalformed(TER x)
{
    return (x >= temMALFORMED && x < tefFAILURE);
}

inline bool
isTefFailure(TER x)
{
    return (x >= tefFAILURE && x < tesSUCCESS);
}

inline bool
isTesSuccess(TER x)
{
    return (x == tesSUCCESS);
}

inline bool
isTecClaim(TER x)
{
    return (x >= 100 && x < 200);
}

/** The caller-facing classification of a lending failure. */
enum class LendingError {
    none,
    unauthorized,        // caller lacks the required role or identity
    notFound,            // the referenced loan id was never assigned
    alreadyFinalized,    // the loan already reached a terminal status
    preconditionFailed,  // ineligible borrower, loan not due, transfer refused
    invalidLock,         // the vault holds no active lock for the handle
    internal             // ledger and collaborators are inconsistent
};

/** Map a result code onto the caller-facing classification. */
LendingError
lendingError(TER code);

std::string
to_string(LendingError e);

/** Returns the symbolic name and human description of a result. */
bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

inline std::ostream&
operator<<(std::ostream& os, TER code)
{
    return os << transToken(code);
}

}  // namespace collat

#endif
