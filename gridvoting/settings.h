/*=============================================================================

This class is for providing global settings as well as reading command-line
arguments and parameters from given config files.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_SETTINGS_H
#define GRIDVOTING_SETTINGS_H

#include <cstddef>
#include <string>

// ==========================================================================

/* Major version */
#define CLIENT_VERSION_MAJOR    0

/* Minor version */
#define CLIENT_VERSION_MINOR    1

/* Build revision */
#define CLIENT_VERSION_REVISION 0

namespace Settings
{
    // ----------------------------------------------------------------
    // Constants

    // Bounds for the number of options of a poll
    const size_t POLL_MIN_OPTIONS = 2;
    const size_t POLL_MAX_OPTIONS = 4;

    // Smallest paillier modulus accepted for key generation
    const int PAILLIER_MIN_BITS = 128;

    // ----------------------------------------------------------------
    // CLI/Config default arguments

    const std::string defaultDirectory = ".gridvoting";
    const std::string defaultPrincipal = "gridvoting.core";
    const int defaultKeyBits = 1024;
    const bool defaultLogToConsole = true;
    const bool defaultLogToFile = true;

    // ----------------------------------------------------------------

    // Parse CLI & Config arguments
    bool ParseArguments(int, char**);

    // ----------------------------------------------------------------
    // Getter for CLI / Config arguments:

    std::string GetDirectory();
    std::string GetPrincipal();
    int GetKeyBits();
    std::string GetScript();
    bool GetPrintToConsole();
    bool GetPrintToFile();
}

#endif // GRIDVOTING_SETTINGS_H
