/*=============================================================================

Provides helper and logging functionalities.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_HELPER_H
#define GRIDVOTING_HELPER_H

#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>

// ==========================================================================

enum LogCategory
{
    UNKNOWN,
    INFO,
    WARNING,
    ERROR
};

// ==========================================================================

class Log
{
public:
    // Wrapper for logging INFO
    static inline void i(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(LogCategory::INFO, s, args);
        va_end(args);
    }

    // Wrapper for logging WARNING
    static inline void w(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(LogCategory::WARNING, s, args);
        va_end(args);
    }

    // Wrapper for logging ERROR
    static inline void e(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(LogCategory::ERROR, s, args);
        va_end(args);
    }

private:
    // Internal logging helper method
    static void log_(LogCategory, const char*, va_list);

    // Print log to the given stream
    static void print(FILE*, LogCategory, const char*);

    // Get logging header
    static std::string getHeader(LogCategory);

    // Get category as string
    static std::string getCategoryString(LogCategory);
};

// ================================================================

class Helper
{
public:
    // Format time in the given format
    static std::string FormatTime(const char*, int64_t);

    // Obtain the data directory for gridvoting
    static const boost::filesystem::path& GetDataDir();

    // Obtain user's home directory
    static const boost::filesystem::path GetHomeDir();

    // Get current UNIX timestamp (msec)
    static long long GetUNIXTimestamp();

    // Recursively create given directory
    static bool CreateDirectories(const boost::filesystem::path&);

    // Fill the given buffer with cryptographically strong random bytes
    static void GenerateRandomBytes(unsigned char*, size_t);

    // Encode bytes as lowercase hex
    static std::string ToHex(const unsigned char*, size_t);

    // Serialize a given object to file
    template<typename T>
    static void SaveToFile(const T&, std::string);

    // Deserialize a given file to a specific object
    template<typename T>
    static void LoadFromFile(std::string, T&);
};

// ==========================================================================
// These need to be defined here in the header!

template<typename T>
void
Helper::SaveToFile(const T& data, std::string file)
{
    std::ofstream ofs(file.c_str());
    if (!ofs)
        throw std::runtime_error("Could not open " + file + " for writing");

    // serialize to text
    boost::archive::text_oarchive oa(ofs);
    oa << data;
}

// ----------------------------------------------------------------

template<typename T>
void
Helper::LoadFromFile(std::string file, T& data)
{
    std::ifstream ifs(file.c_str());
    if (!ifs)
        throw std::runtime_error("Could not open " + file + " for reading");

    // parse from text
    boost::archive::text_iarchive ia(ifs);
    ia >> data;
}

#endif // GRIDVOTING_HELPER_H
