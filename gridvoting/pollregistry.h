/*=============================================================================

Append-only collection of all polls. A poll's id is its position; ids are
never reused and polls are never removed or reordered.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_POLLREGISTRY_H
#define GRIDVOTING_POLLREGISTRY_H

#include "poll.h"
#include "pollresult.h"

#include <deque>
#include <stdint.h>

// ==========================================================================

class PollRegistry
{
public:

    PollRegistry() {}

    PollRegistry(PollRegistry const&)       = delete;
    void operator=(PollRegistry const&)     = delete;

    // ----------------------------------------------------------------

    // Store a new poll and return its id
    uint64_t Append(const Poll&);

    // Obtain the poll with the given id
    PollResult Get(uint64_t, Poll**);
    PollResult Get(uint64_t, const Poll**) const;

    // Number of polls created so far
    inline uint64_t Count() const
    {
        return this->polls.size();
    }

private:
    // deque keeps references stable while growing
    std::deque<Poll> polls;
};

#endif // GRIDVOTING_POLLREGISTRY_H
