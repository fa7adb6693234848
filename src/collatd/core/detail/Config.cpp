#include <collatd/core/Config.h>

#include <collat/basics/Log.h>
#include <collat/basics/contract.h>

#include <boost/filesystem/fstream.hpp>

#include <iterator>
#include <stdexcept>

namespace collat {

char const* const Config::configFileName = "collatd.cfg";

static AccountID
getAccount(Section const& section, std::string const& key, bool required)
{
    auto const value = section.get(key);
    if (!value)
    {
        if (required)
            Throw<std::runtime_error>(
                "Missing setting '" + key + "' in [" + section.name() + "]");
        return AccountID{};
    }

    auto account = parseAccount(*value);
    if (!account)
        Throw<std::runtime_error>(
            "Invalid account '" + *value + "' for '" + key + "' in [" +
            section.name() + "]");

    return *account;
}

void
Config::setup(std::string const& strConf)
{
    boost::filesystem::path const path(strConf);
    boost::system::error_code ec;

    if (!boost::filesystem::exists(path, ec))
        Throw<std::runtime_error>(
            "The configuration file '" + path.string() + "' does not exist");

    boost::filesystem::ifstream ifs(path);
    if (!ifs)
        Throw<std::runtime_error>(
            "Unable to read the configuration file '" + path.string() + "'");

    std::string const fileContents(
        (std::istreambuf_iterator<char>(ifs)),
        std::istreambuf_iterator<char>());

    load(fileContents);

    // A relative log file lives beside the configuration file.
    if (!DEBUG_LOGFILE.empty() && DEBUG_LOGFILE.is_relative())
        DEBUG_LOGFILE = path.parent_path() / DEBUG_LOGFILE;
}

void
Config::loadFromString(std::string const& fileContents)
{
    load(fileContents);
}

void
Config::load(std::string const& fileContents)
{
    IniFileSections const secConfig = parseIniFile(fileContents, true);
    build(secConfig);

    if (!exists(SECTION_LENDING))
        Throw<std::runtime_error>(
            "Missing [" SECTION_LENDING "] section in configuration");

    auto const& lending = section(SECTION_LENDING);

    ADMIN_ACCOUNT = getAccount(lending, "admin", true);
    RESERVE_ACCOUNT = getAccount(lending, "reserve", true);
    VAULT_ACCOUNT = getAccount(lending, "vault", true);
    LIQUIDATION_ACCOUNT = getAccount(lending, "liquidator", false);
    if (LIQUIDATION_ACCOUNT.isZero())
        LIQUIDATION_ACCOUNT = ADMIN_ACCOUNT;

    if (VAULT_ACCOUNT == RESERVE_ACCOUNT)
        Throw<std::runtime_error>(
            "The vault and reserve accounts must differ");

    // Seized collateral must leave the vault.
    if (LIQUIDATION_ACCOUNT == VAULT_ACCOUNT)
        Throw<std::runtime_error>(
            "The vault and liquidation accounts must differ");

    if (exists(SECTION_LOG_LEVEL))
    {
        auto const name = legacy(SECTION_LOG_LEVEL);
        auto const level = Logs::fromString(name);
        if (!level)
            Throw<std::runtime_error>(
                "Invalid [" SECTION_LOG_LEVEL "] '" + name + "'");
        LOG_LEVEL = *level;
    }

    if (exists(SECTION_DEBUG_LOGFILE))
    {
        auto const file = legacy(SECTION_DEBUG_LOGFILE);
        if (!file.empty())
            DEBUG_LOGFILE = file;
    }
}

}  // namespace collat
