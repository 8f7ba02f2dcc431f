#include "voteledger.h"

// ================================================================

bool
VoteLedger::HasVoted(uint64_t pollId, const Principal& identity) const
{
    std::map<uint64_t, std::set<Principal>>::const_iterator iter = this->votesRegistered.find(pollId);
    if (iter == this->votesRegistered.end())
        return false;

    return iter->second.count(identity) > 0;
}

// ----------------------------------------------------------------

PollResult
VoteLedger::RecordVote(uint64_t pollId, const Principal& identity)
{
    if (!this->votesRegistered[pollId].insert(identity).second)
        return PollResult::PR_ALREADY_VOTED;

    return PollResult::PR_OK;
}
