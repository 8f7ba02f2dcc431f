#include "helper.h"
#include "settings.h"

#include <stdio.h>
#include <sys/time.h>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>

#include <openssl/rand.h>

#include <boost/date_time/posix_time/posix_time.hpp>

// ================================================================

static boost::filesystem::path logPath;

void
Log::log_(LogCategory c, const char* s, va_list args)
{
    // format arguments into buffer
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), s, args);

    // print to console
    if (Settings::GetPrintToConsole())
    {
        // set target stream
        FILE* target = stdout;
        if (c == LogCategory::ERROR)
            target = stderr;

        Log::print(target, c, buffer);
    }

    // print to log file
    if (!Settings::GetPrintToFile())
        return;

    if (logPath.empty())
    {
        logPath = Settings::GetDirectory();
        logPath /= "log.txt";
    }

    // open log file
    FILE* logFile = fopen(logPath.string().c_str(), "a");

    if (!logFile)
        return;

    setbuf(logFile, NULL); // unbuffered

    Log::print(logFile, c, buffer);

    fclose(logFile);
}

// ----------------------------------------------------------------

void
Log::print(FILE* target, LogCategory c, const char* s)
{
    // print header, data and new line
    fprintf(target, "%s %s\n", Log::getHeader(c).c_str(), s);
}

// ----------------------------------------------------------------

std::string
Log::getHeader(LogCategory c)
{
    // format category and current time
    return ("[" + Log::getCategoryString(c) + "] " + Helper::FormatTime("%Y-%m-%d %H:%M:%S", time(NULL)));
}

// ----------------------------------------------------------------

std::string
Log::getCategoryString(LogCategory c)
{
    switch (c)
    {
        case INFO: return "INF";
        case WARNING: return "WRN";
        case ERROR: return "ERR";
        default: break;
    }

    return "---";
}

// ================================================================

std::string
Helper::FormatTime(const char* pszFormat, int64_t nTime)
{
    // std::locale takes ownership of the pointer
    std::locale loc(std::locale::classic(), new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(nTime);
    return ss.str();
}

// ----------------------------------------------------------------

static boost::filesystem::path pathCached;

const boost::filesystem::path&
Helper::GetDataDir()
{
    boost::filesystem::path &path = pathCached;

    // check if path is already cached
    if (!path.empty())
        return path;

    path = Settings::GetDirectory();

    // create directory if necessary
    Helper::CreateDirectories(path);

    return path;
}

// ----------------------------------------------------------------

const boost::filesystem::path
Helper::GetHomeDir()
{
    // determine user home directory
    char* pszHome = getenv("HOME");
    if (pszHome == NULL || strlen(pszHome) == 0)
        return boost::filesystem::path("/");
    else
        return boost::filesystem::path(pszHome);
}

// ----------------------------------------------------------------

long long
Helper::GetUNIXTimestamp()
{
    struct timeval tp;
    gettimeofday(&tp, NULL);
    return (long long) tp.tv_sec * 1000 + tp.tv_usec / 1000;
}

// ----------------------------------------------------------------

bool
Helper::CreateDirectories(const boost::filesystem::path& p)
{
    try
    {
        return boost::filesystem::create_directories(p);
    }
    catch (const boost::filesystem::filesystem_error&)
    {
        if (!boost::filesystem::exists(p) || !boost::filesystem::is_directory(p))
            throw;
    }

    // create_directory didn't create the directory, it had to have existed already
    return false;
}

// ----------------------------------------------------------------

void
Helper::GenerateRandomBytes(unsigned char* buffer, size_t length)
{
    if (RAND_bytes(buffer, (int) length) != 1)
        throw std::runtime_error("OpenSSL could not provide random bytes");
}

// ----------------------------------------------------------------

std::string
Helper::ToHex(const unsigned char* data, size_t length)
{
    static const char digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; i++)
    {
        result.push_back(digits[data[i] >> 4]);
        result.push_back(digits[data[i] & 0x0f]);
    }

    return result;
}
