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

#include <doctest/doctest.h>

#include <sstream>

using namespace collat;

TEST_SUITE_BEGIN("TER");

TEST_CASE("ranges")
{
    CHECK(isTemMalformed(temBAD_AMOUNT));
    CHECK_FALSE(isTemMalformed(tefFAILURE));
    CHECK(isTefFailure(tefBAD_LEDGER));
    CHECK(isTesSuccess(tesSUCCESS));
    CHECK(isTecClaim(tecNO_ENTRY));
    CHECK(isTecClaim(tecINVALID_LOCK));
    CHECK_FALSE(isTecClaim(tesSUCCESS));
}

TEST_CASE("tokens")
{
    CHECK(transToken(tesSUCCESS) == "tesSUCCESS");
    CHECK(transToken(tecLOAN_FINALIZED) == "tecLOAN_FINALIZED");
    CHECK(transHuman(tecTOO_SOON) == "Loan is not yet due.");
    CHECK(transToken(static_cast<TER>(17)) == "-");

    CHECK(transCode("tecNO_AUTH") == tecNO_AUTH);
    CHECK(transCode("temBAD_AMOUNT") == temBAD_AMOUNT);
    CHECK_FALSE(transCode("tecBOGUS").has_value());

    std::ostringstream ss;
    ss << tecDUPLICATE;
    CHECK(ss.str() == "tecDUPLICATE");
}

TEST_CASE("error categories")
{
    CHECK(lendingError(tesSUCCESS) == LendingError::none);
    CHECK(lendingError(tecNO_PERMISSION) == LendingError::unauthorized);
    CHECK(lendingError(tecNO_ENTRY) == LendingError::notFound);
    CHECK(lendingError(tecLOAN_FINALIZED) == LendingError::alreadyFinalized);
    CHECK(lendingError(tecINVALID_LOCK) == LendingError::invalidLock);

    for (auto const ter :
         {tecNO_AUTH,
          tecINSUFFICIENT_SCORE,
          tecORACLE_FAILURE,
          tecTOO_SOON,
          tecUNFUNDED_PAYMENT,
          tecALREADY_DISBURSED,
          tecNO_ISSUER,
          tecDUPLICATE,
          tecCOLLATERAL_TRANSFER,
          tecKILLED,
          tecDIR_FULL,
          temBAD_AMOUNT,
          temMALFORMED})
    {
        CAPTURE(transToken(ter));
        CHECK(lendingError(ter) == LendingError::preconditionFailed);
    }

    CHECK(lendingError(tefBAD_LEDGER) == LendingError::internal);
    CHECK(lendingError(tefEXCEPTION) == LendingError::internal);

    CHECK(to_string(LendingError::alreadyFinalized) == "AlreadyFinalized");
    CHECK(to_string(LendingError::preconditionFailed) == "PreconditionFailed");
}

TEST_SUITE_END();
