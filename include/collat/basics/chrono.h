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

#ifndef COLLAT_BASICS_CHRONO_H_INCLUDED
#define COLLAT_BASICS_CHRONO_H_INCLUDED

#include <chrono>
#include <cstdint>
#include <string>

namespace collat {

// A few handy aliases

using days = std::chrono::duration<
    int,
    std::ratio_multiply<std::chrono::hours::period, std::ratio<24>>>;

using weeks = std::chrono::
    duration<int, std::ratio_multiply<days::period, std::ratio<7>>>;

/** Clock for measuring the ledger's notion of time.

    Time is measured in whole seconds since the epoch 2000-01-01 00:00:00 UTC.
    The representation is 32 bits wide, so any sum of a time point and a
    duration must be checked against NetClock::time_point::max().
*/
class NetClock
{
public:
    explicit NetClock() = default;

    using rep = std::uint32_t;
    using period = std::ratio<1>;
    using duration = std::chrono::duration<rep, period>;
    using time_point = std::chrono::time_point<NetClock>;

    static bool const is_steady = false;
};

/** Seconds between the Unix epoch and the NetClock epoch. */
static constexpr std::chrono::seconds epoch_offset =
    days{10957};  // 2000-01-01

std::string
to_string(NetClock::time_point tp);

}  // namespace collat

#endif
