#include "pollresult.h"

// ================================================================

std::string printPollResult(const PollResult result)
{
    switch(result)
    {
    case PollResult::PR_OK:
        return "Operation was successful";
    case PollResult::PR_INVALID_OPTION_COUNT:
        return "Provide between 2 and 4 options";
    case PollResult::PR_INVALID_WINDOW:
        return "Invalid time window";
    case PollResult::PR_EMPTY_NAME:
        return "Poll name required";
    case PollResult::PR_UNKNOWN_POLL:
        return "Poll does not exist";
    case PollResult::PR_NOT_STARTED:
        return "Poll not started";
    case PollResult::PR_WINDOW_CLOSED:
        return "Poll ended";
    case PollResult::PR_ALREADY_VOTED:
        return "Address already voted";
    case PollResult::PR_INVALID_CIPHERTEXT:
        return "Encrypted input could not be verified";
    case PollResult::PR_POLL_STILL_ACTIVE:
        return "Poll still active";
    case PollResult::PR_ALREADY_FINALIZED:
        return "Poll already finalized";
    case PollResult::PR_NOT_FINALIZED:
        return "Poll not finalized";
    case PollResult::PR_SERVICE_FAILURE:
        return "Encrypted arithmetic service failed";
    default:
        return "Unknown result";
    }
}

// ----------------------------------------------------------------

std::string getPollResultName(const PollResult result)
{
    switch(result)
    {
    case PollResult::PR_OK:                     return "Ok";
    case PollResult::PR_INVALID_OPTION_COUNT:   return "InvalidOptionCount";
    case PollResult::PR_INVALID_WINDOW:         return "InvalidWindow";
    case PollResult::PR_EMPTY_NAME:             return "EmptyName";
    case PollResult::PR_UNKNOWN_POLL:           return "UnknownPoll";
    case PollResult::PR_NOT_STARTED:            return "NotStarted";
    case PollResult::PR_WINDOW_CLOSED:          return "WindowClosed";
    case PollResult::PR_ALREADY_VOTED:          return "AlreadyVoted";
    case PollResult::PR_INVALID_CIPHERTEXT:     return "InvalidCiphertext";
    case PollResult::PR_POLL_STILL_ACTIVE:      return "PollStillActive";
    case PollResult::PR_ALREADY_FINALIZED:      return "AlreadyFinalized";
    case PollResult::PR_NOT_FINALIZED:          return "NotFinalized";
    case PollResult::PR_SERVICE_FAILURE:        return "ServiceFailure";
    default: break;
    }

    return "---";
}
