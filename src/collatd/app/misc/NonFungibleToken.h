#ifndef COLLAT_APP_MISC_NONFUNGIBLETOKEN_H_INCLUDED
#define COLLAT_APP_MISC_NONFUNGIBLETOKEN_H_INCLUDED

#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>

namespace collat {

/** An asset contract whose tokens can be pledged as collateral. */
class NonFungibleToken
{
public:
    virtual ~NonFungibleToken() = default;

    /** Move a token. Returns `false` if the transfer was refused. */
    virtual bool
    transferFrom(
        AccountID const& from,
        AccountID const& to,
        TokenID tokenID) = 0;
};

}  // namespace collat

#endif
