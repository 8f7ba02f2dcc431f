#include "poll.h"

// ================================================================

PollPhase GetPollPhase(int64_t now, int64_t start, int64_t end, bool finalized)
{
    if (finalized)
        return PollPhase::PP_FINALIZED;

    if (now < start)
        return PollPhase::PP_PENDING;

    if (now < end)
        return PollPhase::PP_ACTIVE;

    return PollPhase::PP_ENDED;
}

// ----------------------------------------------------------------

std::string printPollPhase(const PollPhase phase)
{
    switch(phase)
    {
    case PollPhase::PP_PENDING:
        return "Upcoming";
    case PollPhase::PP_ACTIVE:
        return "Active";
    case PollPhase::PP_ENDED:
        return "Ended";
    case PollPhase::PP_FINALIZED:
        return "Finalized";
    default:
        return "Unknown";
    }
}
