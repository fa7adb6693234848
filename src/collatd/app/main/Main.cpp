#include <collatd/app/main/ScriptRunner.h>
#include <collatd/core/Config.h>
#include <collatd/core/TimeKeeper.h>

#include <collat/basics/Log.h>
#include <collat/protocol/BuildInfo.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/program_options.hpp>

#include <exception>
#include <iostream>
#include <memory>

namespace po = boost::program_options;

namespace collat {

void
printHelp(po::options_description const& desc)
{
    std::cerr << "collatd [options] <script>\n"
              << desc << std::endl
              << "Script commands: \n"
                 "     approve <caller> <loan_id>\n"
                 "     advance <seconds>\n"
                 "     balance <account>\n"
                 "     default <caller> <loan_id>\n"
                 "     fund <account> <amount>\n"
                 "     mint <asset> <owner> <token_id>\n"
                 "     owner <asset> <token_id>\n"
                 "     repay <caller> <loan_id>\n"
                 "     request <borrower> <amount> <seconds> <asset> "
                 "<token_id>\n"
                 "     score <account> <score>|none\n"
                 "     show <loan_id>\n"
                 "     verify <caller> <account> [true|false]\n";
}

//------------------------------------------------------------------------------

int
run(int argc, char** argv)
{
    po::variables_map vm;

    // Set up option parsing.
    //
    po::options_description desc("General Options");
    // clang-format off
    desc.add_options()
    ("help,h", "Display this message.")
    ("conf", po::value<std::string>(), "Specify the configuration file.")
    ("script", po::value<std::string>(),
        "Read commands from the file instead of standard input.")
    ("quiet,q", "Reduce diagnostics.")
    ("version", "Display the build version.")
    ;
    // clang-format on

    po::positional_options_description p;
    p.add("script", 1);

    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)     // Parse options.
                .positional(p)     // Remainder as the script.
                .run(),
            vm);
        po::notify(vm);  // Invoke option notify functions.
    }
    catch (std::exception const& ex)
    {
        std::cerr << "collatd: " << ex.what() << std::endl;
        std::cerr << "Try 'collatd --help' for a list of options." << std::endl;
        return 1;
    }

    if (vm.count("help"))
    {
        printHelp(desc);
        return 0;
    }

    if (vm.count("version"))
    {
        std::cout << "collatd version " << BuildInfo::getVersionString()
                  << std::endl;
        return 0;
    }

    auto config = std::make_unique<Config>();
    try
    {
        config->setup(
            vm.count("conf") ? vm["conf"].as<std::string>()
                             : Config::configFileName);
    }
    catch (std::exception const& ex)
    {
        std::cerr << "collatd: " << ex.what() << std::endl;
        return 1;
    }

    auto logs = std::make_unique<Logs>(config->LOG_LEVEL);
    if (vm.count("quiet"))
        logs->silent(true);

    if (!config->DEBUG_LOGFILE.empty() && !logs->open(config->DEBUG_LOGFILE))
    {
        std::cerr << "Can't open log file " << config->DEBUG_LOGFILE
                  << std::endl;
        return 1;
    }

    auto const j = logs->journal("Application");
    JLOG(j.info()) << "Starting " << BuildInfo::getFullVersionString();

    ScriptRunner runner(*config, *logs, std::cout, SystemTimeKeeper().now());

    if (vm.count("script"))
    {
        boost::filesystem::ifstream script(vm["script"].as<std::string>());
        if (!script)
        {
            std::cerr << "Can't open script " << vm["script"].as<std::string>()
                      << std::endl;
            return 1;
        }
        return runner.run(script) ? 0 : 1;
    }

    return runner.run(std::cin) ? 0 : 1;
}

}  // namespace collat

// Must be outside the namespace for obvious reasons
//
int
main(int argc, char** argv)
{
    return collat::run(argc, argv);
}
