#ifndef COLLAT_CORE_CONFIG_H_INCLUDED
#define COLLAT_CORE_CONFIG_H_INCLUDED

#include <collat/basics/BasicConfig.h>
#include <collat/basics/Journal.h>
#include <collat/protocol/AccountID.h>

#include <boost/filesystem.hpp>

#include <string>

namespace collat {

// Section names
#define SECTION_LENDING "lending"
#define SECTION_LOG_LEVEL "log_level"
#define SECTION_DEBUG_LOGFILE "debug_logfile"

class Config : public BasicConfig
{
public:
    // Settings related to the configuration file location and directories
    static char const* const configFileName;

    // The principal allowed to verify accounts and approve loans.
    AccountID ADMIN_ACCOUNT;

    // Source of disbursements and destination of repayments.
    AccountID RESERVE_ACCOUNT;

    // Holds pledged collateral.
    AccountID VAULT_ACCOUNT;

    // Receives seized collateral. Defaults to ADMIN_ACCOUNT.
    AccountID LIQUIDATION_ACCOUNT;

    boost::filesystem::path DEBUG_LOGFILE;
    severities::Severity LOG_LEVEL = severities::kWarning;

public:
    Config() = default;

    /** Load the configuration from a file.
        Throws std::runtime_error if the file cannot be read or a setting
        is missing or invalid.
    */
    void
    setup(std::string const& strConf);

    /** Load the configuration from the text of an ini file. */
    void
    loadFromString(std::string const& fileContents);

private:
    void
    load(std::string const& strConf);
};

}  // namespace collat

#endif
