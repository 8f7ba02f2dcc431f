/*=============================================================================

This class represents a poll with all its attributes.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_POLL_H
#define GRIDVOTING_POLL_H

#include "fhe/encryptedservice.h"
#include "fhe/handle.h"

#include <stdint.h>
#include <string>
#include <vector>

#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

// ----------------------------------------------------------------
// Option labels of a poll, order is significant
typedef std::vector<std::string> Options;

// ----------------------------------------------------------------
enum PollPhase
{
    PP_PENDING,     // now < start
    PP_ACTIVE,      // start <= now < end
    PP_ENDED,       // now >= end, not finalized
    PP_FINALIZED    // terminal
};

// Derive the phase of a poll, never stored
PollPhase GetPollPhase(int64_t now, int64_t start, int64_t end, bool finalized);

// Return string naming the given phase
std::string printPollPhase(const PollPhase phase);

// ----------------------------------------------------------------
class Poll
{
public:

    // Display name
    std::string name;

    // Option labels, fixed at creation
    Options options;

    // Voting window [start, end)
    int64_t start = 0;
    int64_t end = 0;

    // Set once after the window closed, never reverts
    bool finalized = false;

    // Identity that created the poll
    Principal creator;

    // One encrypted counter per option, same order as options
    std::vector<CounterHandle> encryptedCounts;

    // ----------------------------------------------------------------

    Poll() {}

    Poll(std::string name, Options options, int64_t start, int64_t end, Principal creator):
        name(name),
        options(options),
        start(start),
        end(end),
        creator(creator) {}

    // ----------------------------------------------------------------

    inline PollPhase getPhase(int64_t now) const
    {
        return GetPollPhase(now, this->start, this->end, this->finalized);
    }
};

// ----------------------------------------------------------------
typedef struct PollMetadata_t
{
    std::string name;
    int64_t start = 0;
    int64_t end = 0;
    bool finalized = false;
    Principal creator;
    size_t optionCount = 0;
} PollMetadata;

// ----------------------------------------------------------------
// Decrypted outcome of a finalized poll, written on export
typedef struct PollExport_t
{
    uint64_t id = 0;
    std::string name;
    Options options;
    int64_t start = 0;
    int64_t end = 0;
    Principal creator;

    // Publicly decryptable counters and their decryption, per option
    std::vector<CounterHandle> handles;
    std::vector<uint64_t> tallies;

    // ----------------------------------------------------------------

    inline bool operator==(const PollExport_t& other) const
    {
        return (id == other.id &&
                name == other.name &&
                options == other.options &&
                start == other.start &&
                end == other.end &&
                creator == other.creator &&
                handles == other.handles &&
                tallies == other.tallies);
    }

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->id;
        a & this->name;
        a & this->options;
        a & this->start;
        a & this->end;
        a & this->creator;
        a & this->handles;
        a & this->tallies;
    }
} PollExport;

#endif // GRIDVOTING_POLL_H
