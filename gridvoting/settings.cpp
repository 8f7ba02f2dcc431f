#include "settings.h"
#include "helper.h"

#include <iostream>
#include <fstream>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

// ================================================================

namespace po = boost::program_options;

po::variables_map vm;

// ================================================================

bool
Settings::ParseArguments(int argc, char** argv)
{
    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
            ("help", "produce help message")
            ("data-dir,d", po::value<std::string>(),
             "path to the data directory (default ~/.gridvoting)");

    // Declare a group of options that will be
    // allowed both on command line and in
    // config file
    po::options_description config("Configuration");
    config.add_options()
            ("principal,p", po::value<std::string>(),
             "identity the poll engine acts as (default gridvoting.core)")
            ("key-bits,k", po::value<int>(),
             "modulus size of the generated paillier key (default 1024)")
            ("script,s", po::value<std::string>(),
             "read shell commands from the given file instead of stdin")
            ("log-cli", po::value<bool>(),
             "if application should log to console (default yes)")
            ("log-file", po::value<bool>(),
             "if application should log to log file (default yes)");

    // assemble options
    po::options_description cmdline_options;
    cmdline_options.add(generic).add(config);

    po::options_description config_file_options;
    config_file_options.add(config);

    // actual parsing
    po::store(po::command_line_parser(argc, argv).
              options(cmdline_options).run(), vm);
    po::notify(vm);

    // print help if requested
    if (vm.count("help"))
    {
        std::cout << cmdline_options << std::endl;
        return false;
    }

    boost::filesystem::path configDir = Helper::GetDataDir();
    Log::i("(Settings) Directory: \t\t%s", configDir.string().c_str());

    std::string configFile = configDir.string() + "/config.cfg";

    // check for the presence of a config file
    std::ifstream ifs(configFile.c_str());
    if (ifs)
    {
        po::store(parse_config_file(ifs, config_file_options), vm);
        po::notify(vm);
    }
    else
    {
        Log::i("(Settings) -> No config file found...");
    }

    if (Settings::GetKeyBits() < Settings::PAILLIER_MIN_BITS)
        throw std::invalid_argument("key-bits must be at least " + std::to_string(Settings::PAILLIER_MIN_BITS));

    Log::i("(Settings) Principal: \t\t%s", Settings::GetPrincipal().c_str());
    Log::i("(Settings) Key Bits: \t\t%d", Settings::GetKeyBits());
    Log::i("(Settings) Log to File: \t\t%d", Settings::GetPrintToFile());

    return true;
}

// ----------------------------------------------------------------

std::string
Settings::GetDirectory()
{
    if (vm.count("data-dir"))
        return vm["data-dir"].as<std::string>();

    return Helper::GetHomeDir().string() + "/" + Settings::defaultDirectory;
}

// ----------------------------------------------------------------

std::string
Settings::GetPrincipal()
{
    if (vm.count("principal"))
        return vm["principal"].as<std::string>();

    return Settings::defaultPrincipal;
}

// ----------------------------------------------------------------

int
Settings::GetKeyBits()
{
    if (vm.count("key-bits"))
        return vm["key-bits"].as<int>();

    return Settings::defaultKeyBits;
}

// ----------------------------------------------------------------

std::string
Settings::GetScript()
{
    if (vm.count("script"))
        return vm["script"].as<std::string>();

    return std::string();
}

// ----------------------------------------------------------------

bool
Settings::GetPrintToConsole()
{
    if (vm.count("log-cli"))
        return vm["log-cli"].as<bool>();

    return Settings::defaultLogToConsole;
}

// ----------------------------------------------------------------

bool
Settings::GetPrintToFile()
{
    if (vm.count("log-file"))
        return vm["log-file"].as<bool>();

    return Settings::defaultLogToFile;
}
