/*=============================================================================

Gridvoting Main

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#include "helper.h"
#include "settings.h"
#include "clock.h"
#include "pollcontroller.h"
#include "shell.h"
#include "fhe/paillierservice.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/exceptions.hpp>

// ==========================================================================
// Notifications of the controller end up in the log

void LogPollEvent(const PollEvent& event)
{
    switch (event.type)
    {
        case PollEventType::PE_CREATED:
            Log::i("(Main) PollCreated: #%llu \"%s\" [%lld, %lld) with %u options",
                   (unsigned long long) event.pollId, event.name.c_str(),
                   (long long) event.start, (long long) event.end, (unsigned int) event.optionCount);
            break;
        case PollEventType::PE_VOTE_CAST:
            Log::i("(Main) VoteCast: #%llu by %s", (unsigned long long) event.pollId, event.voter.c_str());
            break;
        case PollEventType::PE_FINALIZED:
            Log::i("(Main) PollFinalized: #%llu", (unsigned long long) event.pollId);
            break;
    }
}

// ==========================================================================
// Main entry point:

int main(int argc, char* argv[])
{
    try
    {
        // parse arguments from command line and config file
        if (!Settings::ParseArguments(argc, argv))
            return 1;
    }
    catch (const std::exception& e)
    {
        Log::e("(Main) Could not parse arguments: %s", e.what());
        return 1;
    }

    // initialize data directory
    const boost::filesystem::path &dataDir = Helper::GetDataDir();
    const std::string dataDirStr = dataDir.string();

    if (!boost::filesystem::is_directory(dataDir))
    {
        Log::e("(Main) Specified data directory \"%s\" does not exist.", dataDirStr.c_str());
        return 1;
    }

    // make sure only a single process is using the data directory.
    boost::filesystem::path pathLockFile = dataDir / ".lock";
    FILE* file = fopen(pathLockFile.string().c_str(), "a"); // empty lock file; created if it doesn't exist.
    if (file) fclose(file);

    try
    {
        static boost::interprocess::file_lock lock(pathLockFile.string().c_str());
        if (!lock.try_lock())
        {
            Log::e("(Main) Cannot obtain a lock on data directory %s. Application is probably already running.", dataDirStr.c_str());
            return 1;
        }
    }
    catch(const boost::interprocess::interprocess_exception& e)
    {
        Log::e("(Main) Cannot obtain a lock on data directory %s. Application is probably already running.\n%s", dataDirStr.c_str(), e.what());
        return 1;
    }

    Log::i("(Main) Gridvoting %d.%d.%d", CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);

    try
    {
        Log::i("(Main) Initializing encrypted arithmetic service...");
        PaillierService service(Settings::GetKeyBits());

        SystemClock clock;
        PollController controller(service, clock, Settings::GetPrincipal());

        controller.SetCallback(PollEventType::PE_CREATED, &LogPollEvent);
        controller.SetCallback(PollEventType::PE_VOTE_CAST, &LogPollEvent);
        controller.SetCallback(PollEventType::PE_FINALIZED, &LogPollEvent);

        Shell shell(controller, service, clock, Settings::GetPrincipal(), dataDir);

        std::string script = Settings::GetScript();
        if (!script.empty())
        {
            std::ifstream in(script.c_str());
            if (!in)
            {
                Log::e("(Main) Could not open script %s", script.c_str());
                return 1;
            }

            Log::i("(Main) Executing script %s", script.c_str());
            shell.Run(in, std::cout, false);
        }
        else
        {
            shell.Run(std::cin, std::cout, isatty(STDIN_FILENO));
        }

        Log::i("(Main) Goodbye!");
        return 0;
    }
    catch (const std::exception& e)
    {
        Log::e("(Main) Critical Exception: %s", e.what());
        return 1;
    }
}
