#include "pollregistry.h"

// ================================================================

uint64_t
PollRegistry::Append(const Poll& poll)
{
    this->polls.push_back(poll);
    return this->polls.size() - 1;
}

// ----------------------------------------------------------------

PollResult
PollRegistry::Get(uint64_t id, Poll** pollOut)
{
    if (id >= this->polls.size())
        return PollResult::PR_UNKNOWN_POLL;

    *pollOut = &this->polls[id];
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollRegistry::Get(uint64_t id, const Poll** pollOut) const
{
    if (id >= this->polls.size())
        return PollResult::PR_UNKNOWN_POLL;

    *pollOut = &this->polls[id];
    return PollResult::PR_OK;
}
