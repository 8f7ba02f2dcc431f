/*=============================================================================

This class validates and executes all poll operations (create, vote,
finalize and the read-only queries). It is the only writer of the poll
registry and the vote ledger.

Whether an operation is legal is decided against the clock on every call;
apart from the finalized flag no phase is stored. Mutations are serialized
and only become visible once every encrypted operation succeeded, read
queries see a consistent snapshot.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_POLLCONTROLLER_H
#define GRIDVOTING_POLLCONTROLLER_H

#include "clock.h"
#include "poll.h"
#include "pollregistry.h"
#include "pollresult.h"
#include "tallyaccumulator.h"
#include "voteledger.h"
#include "fhe/encryptedservice.h"
#include "fhe/handle.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/thread/shared_mutex.hpp>

// ==========================================================================

enum PollEventType
{
    PE_CREATED,     // poll was created
    PE_VOTE_CAST,   // a vote was accepted
    PE_FINALIZED    // poll was finalized
};

// ----------------------------------------------------------------
// Notification about a state change, never carries a choice
typedef struct PollEvent_t
{
    PollEventType type = PollEventType::PE_CREATED;
    uint64_t pollId = 0;

    // [Created]
    std::string name;
    int64_t start = 0;
    int64_t end = 0;
    size_t optionCount = 0;

    // [VoteCast]
    Principal voter;
} PollEvent;

// ==========================================================================

class PollController
{
public:

    PollController(EncryptedService&, const Clock&, const Principal& self);

    PollController(PollController const&)   = delete;
    void operator=(PollController const&)   = delete;

    // ----- Commands -----

    // Create a new poll, the id is returned on success
    PollResult createPoll(const std::string& name, const Options&, int64_t start, int64_t end,
                          const Principal& creator, uint64_t& idOut);

    // Add an encrypted choice of the voter to the poll's tallies
    PollResult castVote(uint64_t pollId, const ExternalInput& encryptedChoice, const Principal& voter);

    // Make the tallies of an ended poll publicly decryptable
    PollResult finalizePoll(uint64_t pollId);

    // ----- Queries -----

    uint64_t getPollCount() const;

    PollResult getPollMetadata(uint64_t, PollMetadata&) const;

    PollResult getOptions(uint64_t, Options&) const;

    PollResult hasVoted(uint64_t, const Principal&, bool&) const;

    // Only available once the poll is finalized
    PollResult getEncryptedResults(uint64_t, std::vector<CounterHandle>&) const;

    PollResult getPollPhase(uint64_t, PollPhase&) const;

    // Identity the controller acts as towards the service
    inline const Principal& getPrincipal() const
    {
        return this->self;
    }

    // ----- Notifications -----

    // Register a callback for a given event type
    void SetCallback(PollEventType type, boost::function<void (const PollEvent&)> callback);

private:

    EncryptedService& service;
    const Clock& clock;
    Principal self;

    PollRegistry registry;
    VoteLedger ledger;
    TallyAccumulator accumulator;

    // exclusive for commands, shared for queries
    mutable boost::shared_mutex mutex;

    // Stores the callbacks for events
    std::map<PollEventType, boost::function<void (const PollEvent&)>> callbacks;

    // ----------------------------------------------------------------

    // Drops the controller's allowances on counters it no longer references
    void Release(const std::vector<CounterHandle>&);

    // Delegates the event to the appropriate callback
    void Distribute(const PollEvent&);
};

#endif // GRIDVOTING_POLLCONTROLLER_H
