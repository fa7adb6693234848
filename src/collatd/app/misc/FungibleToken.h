#ifndef COLLAT_APP_MISC_FUNGIBLETOKEN_H_INCLUDED
#define COLLAT_APP_MISC_FUNGIBLETOKEN_H_INCLUDED

#include <collat/protocol/AccountID.h>

#include <cstdint>

namespace collat {

/** The stable value token loans are denominated in.

    Both transfer primitives report refusal by returning `false`. A refused
    transfer moves nothing.
*/
class FungibleToken
{
public:
    virtual ~FungibleToken() = default;

    /** Send value from the system reserve. */
    virtual bool
    transfer(AccountID const& to, std::uint64_t amount) = 0;

    /** Move value between two accounts. */
    virtual bool
    transferFrom(
        AccountID const& from,
        AccountID const& to,
        std::uint64_t amount) = 0;
};

}  // namespace collat

#endif
