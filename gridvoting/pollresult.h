/*=============================================================================

Outcome of every poll operation. Each failure is a precondition violation
detected before any state was touched.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_POLLRESULT_H
#define GRIDVOTING_POLLRESULT_H

#include <string>

// ----------------------------------------------------------------
enum PollResult
{
    PR_OK,                      // everything is fine
    PR_INVALID_OPTION_COUNT,    // [Create] less than 2 or more than 4 options
    PR_INVALID_WINDOW,          // [Create] end <= start or start in the past
    PR_EMPTY_NAME,              // [Create] poll name missing
    PR_UNKNOWN_POLL,            // poll id out of range
    PR_NOT_STARTED,             // [Vote] voting window not open yet
    PR_WINDOW_CLOSED,           // [Vote] voting window already closed
    PR_ALREADY_VOTED,           // [Vote] identity voted on this poll before
    PR_INVALID_CIPHERTEXT,      // [Vote] input proof rejected
    PR_POLL_STILL_ACTIVE,       // [Finalize] voting window not closed yet
    PR_ALREADY_FINALIZED,       // [Finalize] poll was finalized before
    PR_NOT_FINALIZED,           // [Results] poll not finalized yet
    PR_SERVICE_FAILURE          // encrypted arithmetic service failed
};

// ----------------------------------------------------------------
// Return string describing the given result
std::string printPollResult(const PollResult result);

// Return the short name of the given result
std::string getPollResultName(const PollResult result);

#endif // GRIDVOTING_POLLRESULT_H
