#include <collatd/app/misc/CollateralVault.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

namespace collat {

CollateralVault::CollateralVault(AccountID account, Journal journal)
    : account_(std::move(account)), j_(journal)
{
    if (account_.isZero())
        LogicError("CollateralVault : no vault account");
}

void
CollateralVault::addAsset(
    AccountID const& asset,
    std::shared_ptr<NonFungibleToken> token)
{
    if (asset.isZero() || !token)
        LogicError("CollateralVault::addAsset : invalid asset");

    std::lock_guard sl(mutex_);
    assets_[asset] = std::move(token);
}

bool
CollateralVault::hasAsset(AccountID const& asset) const
{
    std::lock_guard sl(mutex_);
    return assets_.count(asset) != 0;
}

NonFungibleToken*
CollateralVault::token(AccountID const& asset) const
{
    auto const iter = assets_.find(asset);
    if (iter == assets_.end())
        return nullptr;
    return iter->second.get();
}

Expected<LockHandle, TER>
CollateralVault::lock(CollateralRef const& collateral, AccountID const& from)
{
    std::lock_guard sl(mutex_);

    auto const nft = token(collateral.asset);
    if (!nft)
    {
        JLOG(j_.warn()) << "Unknown asset contract " << collateral.asset;
        return Unexpected(tecNO_ISSUER);
    }

    if (active_.count(collateral) != 0)
    {
        JLOG(j_.warn()) << "Collateral " << collateral << " already locked";
        return Unexpected(tecDUPLICATE);
    }

    if (!nft->transferFrom(from, account_, collateral.tokenID))
    {
        JLOG(j_.warn()) << "Transfer of " << collateral << " from " << from
                        << " to the vault was refused";
        return Unexpected(tecCOLLATERAL_TRANSFER);
    }

    LockHandle const handle = nextHandle_++;
    locks_.emplace(
        handle,
        Lock{handle, collateral, from, Custody::lockedByVault, account_});
    active_.emplace(collateral, handle);

    JLOG(j_.debug()) << "Locked " << collateral << " from " << from
                     << " as " << handle;
    return handle;
}

TER
CollateralVault::transferOut(
    LockHandle handle,
    AccountID const& to,
    Custody custody)
{
    std::lock_guard sl(mutex_);

    auto const iter = locks_.find(handle);
    if (iter == locks_.end() || iter->second.custody != Custody::lockedByVault)
    {
        JLOG(j_.warn()) << "No active lock " << handle;
        return tecINVALID_LOCK;
    }

    auto& l = iter->second;
    auto const nft = token(l.collateral.asset);
    if (!nft)
        return tefINTERNAL;  // assets are never removed

    if (!nft->transferFrom(account_, to, l.collateral.tokenID))
    {
        JLOG(j_.warn()) << "Transfer of " << l.collateral << " to " << to
                        << " was refused";
        return tecCOLLATERAL_TRANSFER;
    }

    l.custody = custody;
    l.holder = to;
    active_.erase(l.collateral);

    JLOG(j_.debug()) << "Lock " << handle << " " << to_string(custody)
                     << " to " << to;
    return tesSUCCESS;
}

TER
CollateralVault::release(LockHandle handle, AccountID const& to)
{
    return transferOut(handle, to, Custody::released);
}

TER
CollateralVault::seize(LockHandle handle, AccountID const& to)
{
    return transferOut(handle, to, Custody::seized);
}

TER
CollateralVault::unlock(LockHandle handle)
{
    std::lock_guard sl(mutex_);

    auto const iter = locks_.find(handle);
    if (iter == locks_.end() || iter->second.custody != Custody::lockedByVault)
        return tecINVALID_LOCK;

    auto const& l = iter->second;
    auto const nft = token(l.collateral.asset);
    if (!nft)
        return tefINTERNAL;

    if (!nft->transferFrom(account_, l.depositor, l.collateral.tokenID))
    {
        JLOG(j_.error()) << "Unable to return " << l.collateral << " to "
                         << l.depositor;
        return tecCOLLATERAL_TRANSFER;
    }

    active_.erase(l.collateral);
    locks_.erase(iter);
    return tesSUCCESS;
}

std::optional<CollateralVault::Lock>
CollateralVault::find(LockHandle handle) const
{
    std::lock_guard sl(mutex_);
    auto const iter = locks_.find(handle);
    if (iter == locks_.end())
        return std::nullopt;
    return iter->second;
}

bool
CollateralVault::isLocked(CollateralRef const& collateral) const
{
    std::lock_guard sl(mutex_);
    return active_.count(collateral) != 0;
}

std::size_t
CollateralVault::activeLocks() const
{
    std::lock_guard sl(mutex_);
    return active_.size();
}

std::string
to_string(CollateralVault::Custody custody)
{
    switch (custody)
    {
        case CollateralVault::Custody::lockedByVault:
            return "locked";
        case CollateralVault::Custody::released:
            return "released";
        case CollateralVault::Custody::seized:
            return "seized";
    }
    return "unknown";
}

}  // namespace collat
