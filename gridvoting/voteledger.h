/*=============================================================================

Register of all identities that have voted, per poll. An identity is
recorded at most once per poll and is never removed again.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_VOTELEDGER_H
#define GRIDVOTING_VOTELEDGER_H

#include "fhe/encryptedservice.h"
#include "pollresult.h"

#include <map>
#include <set>
#include <stdint.h>

// ==========================================================================

class VoteLedger
{
public:

    VoteLedger() {}

    VoteLedger(VoteLedger const&)           = delete;
    void operator=(VoteLedger const&)       = delete;

    // ----------------------------------------------------------------

    // Check if the identity already voted on the given poll
    bool HasVoted(uint64_t, const Principal&) const;

    // Register a vote of the identity on the given poll
    PollResult RecordVote(uint64_t, const Principal&);

private:
    // Poll id -> identities that voted
    std::map<uint64_t, std::set<Principal>> votesRegistered;
};

#endif // GRIDVOTING_VOTELEDGER_H
