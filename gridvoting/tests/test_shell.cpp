#include "tests/test_shell.h"

#include "clock.h"
#include "helper.h"
#include "pollcontroller.h"
#include "shell.h"
#include "fhe/paillierservice.h"
#include "tests/test_service.h"

#include <cassert>
#include <limits>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

// Check if the output contains the given text
bool outputContains(const std::ostringstream& out, const std::string& text)
{
    return out.str().find(text) != std::string::npos;
}

// ----------------------------------------------------------------

void testShellParsing()
{
    // ----- Tokenize -----
    std::vector<std::string> tokens = Shell::Tokenize("create \"Launch Plan\"  +5 +3600 \"A, B,C\"");
    assert(tokens.size() == 5);
    assert(tokens[0] == "create");
    assert(tokens[1] == "Launch Plan");
    assert(tokens[2] == "+5");
    assert(tokens[3] == "+3600");
    assert(tokens[4] == "A, B,C");

    // ----- Options -----
    Options options = Shell::ParseOptions(" Yes , ,No,  Maybe ,");
    assert(options.size() == 3);
    assert(options[0] == "Yes");
    assert(options[1] == "No");
    assert(options[2] == "Maybe");

    assert(Shell::ParseOptions(" , ").empty());

    // ----- Time -----
    assert(Shell::ParseTime("+5", 100) == 105);
    assert(Shell::ParseTime("+0", 100) == 100);
    assert(Shell::ParseTime("42", 100) == 42);

    bool thrown = false;
    try
    {
        Shell::ParseTime("soon", 100);
    }
    catch (const boost::bad_lexical_cast&)
    {
        thrown = true;
    }
    assert(thrown);

    // ----- Time offsets beyond int64 -----
    const int64_t latest = std::numeric_limits<int64_t>::max();
    const int64_t earliest = std::numeric_limits<int64_t>::min();

    assert(Shell::ParseTime("+9223372036854775807", 0) == latest);
    assert(Shell::ParseTime("+1", latest - 1) == latest);
    assert(Shell::ParseTime("+-5", 100) == 95);

    thrown = false;
    try
    {
        Shell::ParseTime("+9223372036854775807", 1000);
    }
    catch (const std::out_of_range&)
    {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try
    {
        Shell::ParseTime("+-1", earliest);
    }
    catch (const std::out_of_range&)
    {
        thrown = true;
    }
    assert(thrown);
}

// ----------------------------------------------------------------

void testShellSession()
{
    PaillierService service(TEST_KEY_BITS);
    ManualClock clock(1000000);
    PollController controller(service, clock, TEST_CORE);

    boost::filesystem::path exportDir = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("gridvoting-%%%%-%%%%");
    boost::filesystem::create_directories(exportDir);

    Shell shell(controller, service, clock, "creator", exportDir);

    // ----- Creation -----
    std::ostringstream out;
    assert(shell.Execute("create \"Launch Plan\" +5 +3600 Alpha,Beta,Gamma", out));
    assert(outputContains(out, "Created poll #0"));

    out.str("");
    assert(shell.Execute("create Broken +5 +3600 Alpha", out));
    assert(outputContains(out, "InvalidOptionCount"));

    // start or end past the largest timestamp
    out.str("");
    assert(shell.Execute("create Overflow +9223372036854775807 +1 Alpha,Beta", out));
    assert(outputContains(out, "Error"));

    out.str("");
    assert(shell.Execute("create Overflow 9223372036854775000 +3600 Alpha,Beta", out));
    assert(outputContains(out, "Error"));
    assert(controller.getPollCount() == 1);

    // ----- Comments, blanks and mistakes -----
    out.str("");
    assert(shell.Execute("", out));
    assert(shell.Execute("   # just a comment", out));
    assert(out.str().empty());

    assert(shell.Execute("frobnicate", out));
    assert(outputContains(out, "Unknown command"));

    out.str("");
    assert(shell.Execute("vote 0 alice", out));
    assert(outputContains(out, "Wrong number of arguments"));

    out.str("");
    assert(shell.Execute("finalize zero", out));
    assert(outputContains(out, "Could not parse"));

    // ----- Voting -----
    out.str("");
    assert(shell.Execute("vote 0 voter1 1", out));
    assert(outputContains(out, "NotStarted"));

    clock.Advance(5);

    std::istringstream script(
            "vote 0 voter1 1\n"
            "vote 0 voter2 2\n"
            "vote 0 voter1 0\n"
            "voted 0 voter1\n"
            "finalize 0\n"
            "results 0\n");

    out.str("");
    shell.Run(script, out, false);
    assert(outputContains(out, "OK"));
    assert(outputContains(out, "AlreadyVoted"));
    assert(outputContains(out, "voter1 has voted"));
    assert(outputContains(out, "PollStillActive"));
    assert(outputContains(out, "NotFinalized"));

    // ----- Listing -----
    out.str("");
    assert(shell.Execute("list", out));
    assert(outputContains(out, "[Active] Launch Plan"));

    out.str("");
    assert(shell.Execute("options 0", out));
    assert(outputContains(out, "2: Gamma"));

    out.str("");
    assert(shell.Execute("show 7", out));
    assert(outputContains(out, "UnknownPoll"));

    // ----- Results -----
    clock.Advance(3600);

    out.str("");
    assert(shell.Execute("finalize 0", out));
    assert(outputContains(out, "OK"));

    out.str("");
    assert(shell.Execute("show 0", out));
    assert(outputContains(out, "Finalized: yes"));

    out.str("");
    assert(shell.Execute("decrypt 0", out));
    assert(outputContains(out, "Alpha: 0"));
    assert(outputContains(out, "Beta: 1"));
    assert(outputContains(out, "Gamma: 1"));

    // ----- Export -----
    out.str("");
    assert(shell.Execute("export 0", out));
    assert(outputContains(out, "Exported to"));

    PollExport record;
    Helper::LoadFromFile((exportDir / "poll_0.txt").string(), record);
    assert(record.id == 0);
    assert(record.name == "Launch Plan");
    assert(record.end - record.start == 3600);
    assert(record.creator == "creator");
    assert(record.options.size() == 3);
    assert(record.handles.size() == 3);
    assert(record.tallies.size() == 3);
    assert(record.tallies[0] == 0);
    assert(record.tallies[1] == 1);
    assert(record.tallies[2] == 1);

    // ----- Quit -----
    out.str("");
    assert(!shell.Execute("quit", out));

    boost::filesystem::remove_all(exportDir);
}

// ================================================================

void test_shell()
{
    Log::i("(Test) # Test: Shell");

    testShellParsing();
    testShellSession();
}
