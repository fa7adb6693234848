#ifndef COLLAT_CORE_SERVICEREGISTRY_H_INCLUDED
#define COLLAT_CORE_SERVICEREGISTRY_H_INCLUDED

namespace collat {

class CollateralVault;
class Config;
class CreditGate;
class FungibleToken;
class TimeKeeper;

/** The collaborators a lending transaction may use. */
struct ServiceRegistry
{
    Config const& config;
    CreditGate const& gate;
    CollateralVault& vault;
    FungibleToken& token;
    TimeKeeper const& timeKeeper;
};

}  // namespace collat

#endif
