/*=============================================================================

Line oriented command interpreter connecting a user (or a script) with the
poll controller. Also plays the client role: choices are encrypted for the
voter before they are cast.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_SHELL_H
#define GRIDVOTING_SHELL_H

#include "clock.h"
#include "pollcontroller.h"
#include "fhe/encryptedservice.h"

#include <iostream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

// ==========================================================================

class Shell
{
public:

    Shell(PollController&, EncryptedService&, const Clock&,
          const Principal& creator, const boost::filesystem::path& exportDir);

    Shell(Shell const&)             = delete;
    void operator=(Shell const&)    = delete;

    // Execute a single command line, returns false once quit was requested
    bool Execute(const std::string& line, std::ostream& out);

    // Execute commands from the given stream until it ends or quit was requested
    void Run(std::istream& in, std::ostream& out, bool prompt);

    // Split a command line into arguments, double quotes group words
    static std::vector<std::string> Tokenize(const std::string& line);

    // Split a comma separated option list, empty labels are dropped
    static Options ParseOptions(const std::string& value);

    // Parse a timestamp, "+N" is relative to the given base
    static int64_t ParseTime(const std::string& value, int64_t base);

private:

    PollController& controller;
    EncryptedService& service;
    const Clock& clock;

    // Identity polls are created as
    Principal creator;

    // Where exported polls are written to
    boost::filesystem::path exportDir;

    // ----------------------------------------------------------------
    // Commands

    void Create(const std::vector<std::string>&, std::ostream&);
    void Vote(const std::vector<std::string>&, std::ostream&);
    void Finalize(const std::vector<std::string>&, std::ostream&);
    void List(std::ostream&);
    void Show(const std::vector<std::string>&, std::ostream&);
    void ShowOptions(const std::vector<std::string>&, std::ostream&);
    void Voted(const std::vector<std::string>&, std::ostream&);
    void Results(const std::vector<std::string>&, std::ostream&);
    void Decrypt(const std::vector<std::string>&, std::ostream&);
    void Export(const std::vector<std::string>&, std::ostream&);
    void Help(std::ostream&);

    // ----------------------------------------------------------------

    // Decrypt the tallies of a finalized poll
    PollResult decryptPoll(uint64_t pollId, std::vector<CounterHandle>& handles, std::vector<uint64_t>& tallies);

    // Print the outcome of an operation
    static void report(std::ostream&, PollResult);
};

#endif // GRIDVOTING_SHELL_H
