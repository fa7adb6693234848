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

#ifndef COLLAT_PROTOCOL_ACCOUNTID_H_INCLUDED
#define COLLAT_PROTOCOL_ACCOUNTID_H_INCLUDED

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace collat {

/** Identity of a principal: a borrower, an operator, the reserve, the vault
    or an asset contract.

    A default constructed AccountID is the zero account, which never names a
    real principal.
*/
class AccountID
{
private:
    std::string name_;

public:
    static std::size_t constexpr maxNameLength = 64;

    AccountID() = default;

    /** Construct from a name.
        Throws std::invalid_argument if the name is not well formed.
    */
    explicit AccountID(std::string name);

    std::string const&
    name() const
    {
        return name_;
    }

    bool
    isZero() const
    {
        return name_.empty();
    }

    auto
    operator<=>(AccountID const&) const = default;
};

/** Returns `true` if the text is a well formed account name. */
bool
isValidAccountName(std::string const& name);

/** Parse an account name. Returns nullopt if the name is not well formed. */
std::optional<AccountID>
parseAccount(std::string const& name);

std::string
to_string(AccountID const& account);

std::ostream&
operator<<(std::ostream& os, AccountID const& account);

inline std::size_t
hash_value(AccountID const& account)
{
    return boost::hash<std::string>{}(account.name());
}

}  // namespace collat

namespace std {

template <>
struct hash<collat::AccountID>
{
    std::size_t
    operator()(collat::AccountID const& account) const
    {
        return collat::hash_value(account);
    }
};

}  // namespace std

#endif
