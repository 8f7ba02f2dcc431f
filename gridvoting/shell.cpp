#include "shell.h"

#include "helper.h"
#include "poll.h"

#include <limits>
#include <map>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

// ================================================================

static const char* TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

// ================================================================

Shell::Shell(PollController& controller, EncryptedService& service, const Clock& clock,
             const Principal& creator, const boost::filesystem::path& exportDir):
    controller(controller),
    service(service),
    clock(clock),
    creator(creator),
    exportDir(exportDir)
{
}

// ================================================================

bool
Shell::Execute(const std::string& line, std::ostream& out)
{
    std::string trimmed = boost::trim_copy(line);

    // skip empty lines and comments
    if (trimmed.empty() || trimmed[0] == '#')
        return true;

    try
    {
        std::vector<std::string> args = Shell::Tokenize(trimmed);
        if (args.empty())
            return true;

        const std::string& command = args[0];

        // number of arguments required, command included
        static std::map<std::string, size_t> arity;
        if (arity.empty())
        {
            arity["create"] = 5;
            arity["vote"] = 4;
            arity["finalize"] = 2;
            arity["list"] = 1;
            arity["show"] = 2;
            arity["options"] = 2;
            arity["voted"] = 3;
            arity["results"] = 2;
            arity["decrypt"] = 2;
            arity["export"] = 2;
            arity["help"] = 1;
            arity["quit"] = 1;
            arity["exit"] = 1;
        }

        std::map<std::string, size_t>::const_iterator iter = arity.find(command);
        if (iter == arity.end())
        {
            out << "Unknown command '" << command << "', type 'help' for a list of commands" << std::endl;
            return true;
        }

        if (args.size() != iter->second)
        {
            out << "Wrong number of arguments for '" << command << "', type 'help' for usage" << std::endl;
            return true;
        }

        if (command == "quit" || command == "exit")
            return false;

        if (command == "create")        this->Create(args, out);
        else if (command == "vote")     this->Vote(args, out);
        else if (command == "finalize") this->Finalize(args, out);
        else if (command == "list")     this->List(out);
        else if (command == "show")     this->Show(args, out);
        else if (command == "options")  this->ShowOptions(args, out);
        else if (command == "voted")    this->Voted(args, out);
        else if (command == "results")  this->Results(args, out);
        else if (command == "decrypt")  this->Decrypt(args, out);
        else if (command == "export")   this->Export(args, out);
        else                            this->Help(out);
    }
    catch (const boost::bad_lexical_cast&)
    {
        out << "Could not parse a numeric argument" << std::endl;
    }
    catch (const std::exception& e)
    {
        Log::e("(Shell) Command '%s' failed: %s", trimmed.c_str(), e.what());
        out << "Error: " << e.what() << std::endl;
    }

    return true;
}

// ----------------------------------------------------------------

void
Shell::Run(std::istream& in, std::ostream& out, bool prompt)
{
    std::string line;

    if (prompt)
        out << "> " << std::flush;

    while (std::getline(in, line))
    {
        if (!this->Execute(line, out))
            break;

        if (prompt)
            out << "> " << std::flush;
    }
}

// ================================================================

std::vector<std::string>
Shell::Tokenize(const std::string& line)
{
    typedef boost::tokenizer<boost::escaped_list_separator<char>> Tokenizer;

    boost::escaped_list_separator<char> separator('\\', ' ', '\"');
    Tokenizer tokens(line, separator);

    std::vector<std::string> result;
    BOOST_FOREACH(const std::string& token, tokens)
    {
        // consecutive blanks yield empty tokens
        if (!token.empty())
            result.push_back(token);
    }

    return result;
}

// ----------------------------------------------------------------

Options
Shell::ParseOptions(const std::string& value)
{
    std::vector<std::string> parts;
    boost::split(parts, value, boost::is_any_of(","));

    Options options;
    BOOST_FOREACH(std::string part, parts)
    {
        boost::trim(part);
        if (!part.empty())
            options.push_back(part);
    }

    return options;
}

// ----------------------------------------------------------------

int64_t
Shell::ParseTime(const std::string& value, int64_t base)
{
    if (value.empty() || value[0] != '+')
        return boost::lexical_cast<int64_t>(value);

    int64_t offset = boost::lexical_cast<int64_t>(value.substr(1));
    if ((offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) ||
            (offset < 0 && base < std::numeric_limits<int64_t>::min() - offset))
        throw std::out_of_range("Time offset " + value + " is out of range");

    return base + offset;
}

// ================================================================

void
Shell::Create(const std::vector<std::string>& args, std::ostream& out)
{
    int64_t start = Shell::ParseTime(args[2], this->clock.Now());
    int64_t end = Shell::ParseTime(args[3], start);
    Options options = Shell::ParseOptions(args[4]);

    uint64_t pollId = 0;
    PollResult result = this->controller.createPoll(args[1], options, start, end, this->creator, pollId);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    out << "Created poll #" << pollId << " (" << Helper::FormatTime(TIME_FORMAT, start)
        << " - " << Helper::FormatTime(TIME_FORMAT, end) << ")" << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Vote(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);
    const Principal& voter = args[2];
    uint32_t choice = boost::lexical_cast<uint32_t>(args[3]);

    // client side: encrypt the choice for the voter
    ExternalInput input = this->service.encryptInput(choice, this->controller.getPrincipal(), voter);

    Shell::report(out, this->controller.castVote(pollId, input, voter));
}

// ----------------------------------------------------------------

void
Shell::Finalize(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);
    Shell::report(out, this->controller.finalizePoll(pollId));
}

// ----------------------------------------------------------------

void
Shell::List(std::ostream& out)
{
    uint64_t count = this->controller.getPollCount();
    if (count == 0)
    {
        out << "No polls" << std::endl;
        return;
    }

    for (uint64_t i = 0; i < count; i++)
    {
        PollMetadata metadata;
        PollPhase phase;

        if (this->controller.getPollMetadata(i, metadata) != PollResult::PR_OK ||
            this->controller.getPollPhase(i, phase) != PollResult::PR_OK)
            continue;

        out << "#" << i << " [" << printPollPhase(phase) << "] " << metadata.name
            << " (" << metadata.optionCount << " options, "
            << Helper::FormatTime(TIME_FORMAT, metadata.start) << " - "
            << Helper::FormatTime(TIME_FORMAT, metadata.end) << ", by "
            << metadata.creator << ")" << std::endl;
    }
}

// ----------------------------------------------------------------

void
Shell::Show(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    PollMetadata metadata;
    PollResult result = this->controller.getPollMetadata(pollId, metadata);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    PollPhase phase;
    result = this->controller.getPollPhase(pollId, phase);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    out << "Name:      " << metadata.name << std::endl;
    out << "Status:    " << printPollPhase(phase) << std::endl;
    out << "Start:     " << Helper::FormatTime(TIME_FORMAT, metadata.start) << std::endl;
    out << "End:       " << Helper::FormatTime(TIME_FORMAT, metadata.end) << std::endl;
    out << "Creator:   " << metadata.creator << std::endl;
    out << "Options:   " << metadata.optionCount << std::endl;
    out << "Finalized: " << (metadata.finalized ? "yes" : "no") << std::endl;
}

// ----------------------------------------------------------------

void
Shell::ShowOptions(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    Options options;
    PollResult result = this->controller.getOptions(pollId, options);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    for (size_t i = 0; i < options.size(); i++)
        out << i << ": " << options[i] << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Voted(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    bool voted = false;
    PollResult result = this->controller.hasVoted(pollId, args[2], voted);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    out << args[2] << (voted ? " has voted" : " has not voted") << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Results(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    std::vector<CounterHandle> handles;
    PollResult result = this->controller.getEncryptedResults(pollId, handles);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    for (size_t i = 0; i < handles.size(); i++)
        out << i << ": " << handles[i].GetHex() << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Decrypt(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    Options options;
    PollResult result = this->controller.getOptions(pollId, options);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    std::vector<CounterHandle> handles;
    std::vector<uint64_t> tallies;
    result = this->decryptPoll(pollId, handles, tallies);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    for (size_t i = 0; i < options.size() && i < tallies.size(); i++)
        out << options[i] << ": " << tallies[i] << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Export(const std::vector<std::string>& args, std::ostream& out)
{
    uint64_t pollId = boost::lexical_cast<uint64_t>(args[1]);

    PollMetadata metadata;
    PollResult result = this->controller.getPollMetadata(pollId, metadata);
    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    PollExport record;
    record.id = pollId;
    record.name = metadata.name;
    record.start = metadata.start;
    record.end = metadata.end;
    record.creator = metadata.creator;

    result = this->controller.getOptions(pollId, record.options);
    if (result == PollResult::PR_OK)
        result = this->decryptPoll(pollId, record.handles, record.tallies);

    if (result != PollResult::PR_OK)
    {
        Shell::report(out, result);
        return;
    }

    boost::filesystem::path file = this->exportDir / ("poll_" + boost::lexical_cast<std::string>(pollId) + ".txt");
    Helper::SaveToFile(record, file.string());

    Log::i("(Shell) Exported poll %llu to %s", (unsigned long long) pollId, file.string().c_str());
    out << "Exported to " << file.string() << std::endl;
}

// ----------------------------------------------------------------

void
Shell::Help(std::ostream& out)
{
    out << "Commands:" << std::endl
        << "  create <name> <start> <end> <opt1,opt2,..>   create a poll (\"+N\": start N sec from now, end N sec after start)" << std::endl
        << "  vote <poll> <voter> <choice>                encrypt the choice for the voter and cast it" << std::endl
        << "  finalize <poll>                             make the tallies of an ended poll public" << std::endl
        << "  list                                        list all polls" << std::endl
        << "  show <poll>                                 show poll details" << std::endl
        << "  options <poll>                              show option labels" << std::endl
        << "  voted <poll> <identity>                     check whether the identity voted" << std::endl
        << "  results <poll>                              show encrypted result handles" << std::endl
        << "  decrypt <poll>                              decrypt the results of a finalized poll" << std::endl
        << "  export <poll>                               write the decrypted poll to the data directory" << std::endl
        << "  help                                        show this text" << std::endl
        << "  quit                                        leave" << std::endl;
}

// ================================================================

PollResult
Shell::decryptPoll(uint64_t pollId, std::vector<CounterHandle>& handles, std::vector<uint64_t>& tallies)
{
    PollResult result = this->controller.getEncryptedResults(pollId, handles);
    if (result != PollResult::PR_OK)
        return result;

    std::map<Handle, uint64_t> plaintexts = this->service.publicDecrypt(handles);

    tallies.clear();
    BOOST_FOREACH(const CounterHandle& handle, handles)
    {
        tallies.push_back(plaintexts.at(handle));
    }

    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

void
Shell::report(std::ostream& out, PollResult result)
{
    if (result == PollResult::PR_OK)
    {
        out << "OK" << std::endl;
        return;
    }

    out << "Failed: " << getPollResultName(result) << " (" << printPollResult(result) << ")" << std::endl;
}
