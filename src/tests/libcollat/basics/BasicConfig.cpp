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

#include <collat/basics/BasicConfig.h>

#include <doctest/doctest.h>

#include <sstream>
#include <string>

using namespace collat;

TEST_SUITE_BEGIN("BasicConfig");

namespace {

struct TestConfig : BasicConfig
{
    TestConfig() = default;

    explicit TestConfig(std::string const& text)
    {
        build(parseIniFile(text, true));
    }
};

}  // namespace

TEST_CASE("parse sections")
{
    TestConfig const c(
        "# leading comment\n"
        "[lending]\n"
        "admin = ops\n"
        "reserve=treasury   \n"
        "\n"
        "[log_level]\n"
        "  debug  \n");

    CHECK(c.exists("lending"));
    CHECK(c.exists("LENDING"));
    CHECK(c.exists("log_level"));
    CHECK_FALSE(c.exists("missing"));

    auto const& lending = c["lending"];
    CHECK(lending.get("admin") == "ops");
    CHECK(lending.get("reserve") == "treasury");
    CHECK_FALSE(lending.get("vault").has_value());
    CHECK(lending.lines().size() == 2);
    CHECK(lending.values().empty());

    CHECK(c.legacy("log_level") == "debug");
    CHECK(c.legacy("missing").empty());
}

TEST_CASE("typed values")
{
    TestConfig const c(
        "[limits]\n"
        "count = 42\n"
        "name = forty two\n");

    auto const& limits = c["limits"];
    CHECK(limits.get<int>("count") == 42);
    CHECK(limits.value_or<int>("other", 7) == 7);

    int count = 0;
    CHECK(set(count, "count", limits));
    CHECK(count == 42);

    int bad = 5;
    CHECK_FALSE(set(bad, "name", limits));
    CHECK(bad == 5);
    CHECK_FALSE(set(bad, 9, "name", limits));
    CHECK(bad == 9);
}

TEST_CASE("comments")
{
    TestConfig const c(
        "[section]\n"
        "key = value # trailing\n"
        "escaped = a\\#b\n"
        "# whole line\n");

    auto const& s = c["section"];
    CHECK(s.get("key") == "value");
    CHECK(s.get("escaped") == "a#b");
    CHECK(c.had_trailing_comments());
}

TEST_CASE("legacy with several lines")
{
    TestConfig const c(
        "[log_level]\n"
        "debug\n"
        "info\n");

    CHECK_THROWS_AS(c.legacy("log_level"), std::runtime_error);
}

TEST_CASE("overwrite")
{
    TestConfig c;
    c.overwrite("a", "k", "1");
    c.overwrite("a", "k", "2");
    c.overwrite("b", "x", "y");
    CHECK(c["a"].get("k") == "2");
    CHECK(c["b"].get("x") == "y");

    std::ostringstream ss;
    ss << c;
    CHECK(ss.str() == "[a]\nk=2\n[b]\nx=y\n");
}

TEST_CASE("line endings")
{
    TestConfig const c("[a]\r\nk = 1\r\n[b]\rv = 2\r");
    CHECK(c["a"].get("k") == "1");
    CHECK(c["b"].get("v") == "2");
}

TEST_SUITE_END();
