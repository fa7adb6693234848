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

#include <collat/basics/contract.h>
#include <collat/protocol/AccountID.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace collat {

AccountID::AccountID(std::string name) : name_(std::move(name))
{
    if (!isValidAccountName(name_))
        Throw<std::invalid_argument>("Invalid account name: '" + name_ + "'");
}

bool
isValidAccountName(std::string const& name)
{
    if (name.empty() || name.size() > AccountID::maxNameLength)
        return false;

    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

std::optional<AccountID>
parseAccount(std::string const& name)
{
    if (!isValidAccountName(name))
        return std::nullopt;
    return AccountID{name};
}

std::string
to_string(AccountID const& account)
{
    if (account.isZero())
        return "<none>";
    return account.name();
}

std::ostream&
operator<<(std::ostream& os, AccountID const& account)
{
    return os << to_string(account);
}

}  // namespace collat
