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

#include <collat/basics/Log.h>

#include <doctest/doctest.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <iterator>
#include <string>

using namespace collat;

TEST_SUITE_BEGIN("Log");

TEST_CASE("severity names")
{
    using namespace severities;

    CHECK(Logs::fromString("trace") == kTrace);
    CHECK(Logs::fromString("DEBUG") == kDebug);
    CHECK(Logs::fromString("info") == kInfo);
    CHECK(Logs::fromString("Warning") == kWarning);
    CHECK(Logs::fromString("warn") == kWarning);
    CHECK(Logs::fromString("error") == kError);
    CHECK(Logs::fromString("fatal") == kFatal);
    CHECK_FALSE(Logs::fromString("loud").has_value());

    CHECK(Logs::toString(kWarning) == "Warning");
    CHECK(Logs::toString(kFatal) == "Fatal");
}

TEST_CASE("thresholds")
{
    using namespace severities;

    Logs logs(kWarning);
    logs.silent(true);

    auto const j = logs.journal("Lending");
    CHECK_FALSE(j.active(kInfo));
    CHECK(j.active(kWarning));
    CHECK(j.active(kError));

    logs.threshold(kTrace);
    CHECK(j.active(kTrace));
    CHECK(logs.threshold() == kTrace);

    logs.journal("Vault");
    auto const partitions = logs.partition_severities();
    REQUIRE(partitions.size() == 2);
    CHECK(partitions[0].first == "Lending");
    CHECK(partitions[0].second == "Trace");
    CHECK(partitions[1].first == "Vault");
}

TEST_CASE("log file")
{
    using namespace severities;

    auto const path = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path("collat-log-%%%%-%%%%.txt");

    {
        Logs logs(kInfo);
        logs.silent(true);
        REQUIRE(logs.open(path));

        auto const j = logs.journal("Lending");
        JLOG(j.debug()) << "hidden";
        JLOG(j.warn()) << "loan " << 7 << " is overdue";
    }

    std::string contents;
    {
        boost::filesystem::ifstream ifs(path);
        REQUIRE(ifs);
        contents.assign(
            std::istreambuf_iterator<char>(ifs),
            std::istreambuf_iterator<char>());
    }
    boost::filesystem::remove(path);

    CHECK(contents.find("Lending:WRN loan 7 is overdue") != std::string::npos);
    CHECK(contents.find("hidden") == std::string::npos);
}

TEST_SUITE_END();
