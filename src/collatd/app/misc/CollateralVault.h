#ifndef COLLAT_APP_MISC_COLLATERALVAULT_H_INCLUDED
#define COLLAT_APP_MISC_COLLATERALVAULT_H_INCLUDED

#include <collatd/app/misc/NonFungibleToken.h>

#include <collat/basics/Expected.h>
#include <collat/basics/Journal.h>
#include <collat/protocol/AccountID.h>
#include <collat/protocol/Loan.h>
#include <collat/protocol/TER.h>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace collat {

/** Custody of pledged non-fungible assets.

    Each successful lock moves a token from its depositor into the vault
    account and yields a handle. The token then leaves the vault exactly
    once, either released back or seized. Every custody change goes through
    the asset contract's transfer primitive; a refused transfer leaves the
    vault unchanged.

    unlock undoes a lock. It exists so that a lending transaction that
    fails after pledging a token can give the token back.
*/
class CollateralVault
{
public:
    enum class Custody { lockedByVault, released, seized };

    struct Lock
    {
        LockHandle handle;
        CollateralRef collateral;
        AccountID depositor;
        Custody custody;

        // The vault while locked, otherwise the recipient.
        AccountID holder;
    };

private:
    AccountID const account_;
    Journal const j_;

    std::mutex mutable mutex_;

    std::map<AccountID, std::shared_ptr<NonFungibleToken>> assets_;
    std::map<LockHandle, Lock> locks_;
    std::map<CollateralRef, LockHandle> active_;
    LockHandle nextHandle_ = 1;

public:
    CollateralVault(AccountID account, Journal journal);

    CollateralVault(CollateralVault const&) = delete;
    CollateralVault&
    operator=(CollateralVault const&) = delete;

    /** The account that holds locked tokens. */
    AccountID const&
    account() const
    {
        return account_;
    }

    /** Accept tokens of the given asset contract as collateral. */
    void
    addAsset(AccountID const& asset, std::shared_ptr<NonFungibleToken> token);

    bool
    hasAsset(AccountID const& asset) const;

    /** Take custody of a token.

        @return the lock handle, or tecNO_ISSUER for an unknown asset
                contract, tecDUPLICATE if the token already is locked,
                tecCOLLATERAL_TRANSFER if the transfer was refused.
    */
    Expected<LockHandle, TER>
    lock(CollateralRef const& collateral, AccountID const& from);

    /** Return a locked token to `to`.

        @return tecINVALID_LOCK if the handle is not an active lock,
                tecCOLLATERAL_TRANSFER if the transfer was refused.
    */
    TER
    release(LockHandle handle, AccountID const& to);

    /** Forfeit a locked token to `to`. Errors as for release. */
    TER
    seize(LockHandle handle, AccountID const& to);

    /** Undo a lock: the token goes back to the depositor and the handle
        is forgotten.
    */
    TER
    unlock(LockHandle handle);

    std::optional<Lock>
    find(LockHandle handle) const;

    bool
    isLocked(CollateralRef const& collateral) const;

    std::size_t
    activeLocks() const;

private:
    NonFungibleToken*
    token(AccountID const& asset) const;

    TER
    transferOut(LockHandle handle, AccountID const& to, Custody custody);
};

std::string
to_string(CollateralVault::Custody custody);

}  // namespace collat

#endif
