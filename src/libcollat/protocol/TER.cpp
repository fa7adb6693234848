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

#include <collat/protocol/TER.h>

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range_core.hpp>

#include <type_traits>
#include <unordered_map>

namespace collat {

namespace detail {

static std::unordered_map<
    std::underlying_type_t<TER>,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macros are used here in order to increase readability.

#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        std::underlying_type_t<TER>,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(temMALFORMED,           "Malformed transaction."),
        MAKE_ERROR(temBAD_AMOUNT,          "Malformed: Bad amount."),
        MAKE_ERROR(temBAD_SRC_ACCOUNT,     "Malformed: Bad source account."),
        MAKE_ERROR(temINVALID,             "The transaction is ill-formed."),
        MAKE_ERROR(temUNKNOWN,             "The transaction requires logic that is not implemented yet."),

        MAKE_ERROR(tefFAILURE,             "Failed to apply."),
        MAKE_ERROR(tefBAD_LEDGER,          "Ledger and external custody are in an unexpected state."),
        MAKE_ERROR(tefEXCEPTION,           "Unexpected program state."),
        MAKE_ERROR(tefINTERNAL,            "Internal error."),

        MAKE_ERROR(tesSUCCESS,             "The transaction was applied."),

        MAKE_ERROR(tecNO_PERMISSION,       "No permission to perform requested operation."),
        MAKE_ERROR(tecNO_ENTRY,            "No matching loan found."),
        MAKE_ERROR(tecNO_AUTH,             "Borrower is not verified."),
        MAKE_ERROR(tecNO_ISSUER,           "Collateral asset contract is not known to the vault."),
        MAKE_ERROR(tecDUPLICATE,           "Collateral is already locked."),
        MAKE_ERROR(tecKILLED,              "Loan due time exceeds protocol time limit."),
        MAKE_ERROR(tecDIR_FULL,            "Loan identifiers are exhausted."),
        MAKE_ERROR(tecUNFUNDED_PAYMENT,    "Value transfer was refused."),
        MAKE_ERROR(tecTOO_SOON,            "Loan is not yet due."),
        MAKE_ERROR(tecLOAN_FINALIZED,      "Loan is already repaid or defaulted."),
        MAKE_ERROR(tecALREADY_DISBURSED,   "Loan principal was already disbursed."),
        MAKE_ERROR(tecINSUFFICIENT_SCORE,  "Borrower credit score is too low."),
        MAKE_ERROR(tecORACLE_FAILURE,      "Credit score oracle returned no reading."),
        MAKE_ERROR(tecCOLLATERAL_TRANSFER, "Collateral transfer was refused."),
        MAKE_ERROR(tecINVALID_LOCK,        "Collateral lock is not active."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

}  // namespace detail

LendingError
lendingError(TER code)
{
    switch (code)
    {
        case tesSUCCESS:
            return LendingError::none;
        case tecNO_PERMISSION:
            return LendingError::unauthorized;
        case tecNO_ENTRY:
            return LendingError::notFound;
        case tecLOAN_FINALIZED:
            return LendingError::alreadyFinalized;
        case tecINVALID_LOCK:
            return LendingError::invalidLock;
        default:
            break;
    }

    if (isTefFailure(code))
        return LendingError::internal;

    return LendingError::preconditionFailed;
}

std::string
to_string(LendingError e)
{
    switch (e)
    {
        case LendingError::none:
            return "none";
        case LendingError::unauthorized:
            return "Unauthorized";
        case LendingError::notFound:
            return "NotFound";
        case LendingError::alreadyFinalized:
            return "AlreadyFinalized";
        case LendingError::preconditionFailed:
            return "PreconditionFailed";
        case LendingError::invalidLock:
            return "InvalidLock";
        case LendingError::internal:
            return "Internal";
    }
    return "unknown";
}

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = detail::transResults();

    auto const r = results.find(static_cast<std::underlying_type_t<TER>>(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = detail::transResults();
        auto range = boost::make_iterator_range(byTer.begin(), byTer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(r.second.first, r.first);
        });
        std::unordered_map<std::string, std::underlying_type_t<TER>> const
            byToken(tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return static_cast<TER>(r->second);
}

}  // namespace collat
