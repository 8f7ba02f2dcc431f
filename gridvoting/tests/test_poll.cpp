#include "tests/test_poll.h"

#include "helper.h"
#include "poll.h"
#include "pollregistry.h"
#include "pollresult.h"
#include "voteledger.h"

#include <cassert>

// ----------------------------------------------------------------

void testPollPhase()
{
    // window [100, 200)
    assert(GetPollPhase(0, 100, 200, false) == PollPhase::PP_PENDING);
    assert(GetPollPhase(99, 100, 200, false) == PollPhase::PP_PENDING);
    assert(GetPollPhase(100, 100, 200, false) == PollPhase::PP_ACTIVE);
    assert(GetPollPhase(199, 100, 200, false) == PollPhase::PP_ACTIVE);
    assert(GetPollPhase(200, 100, 200, false) == PollPhase::PP_ENDED);
    assert(GetPollPhase(5000, 100, 200, false) == PollPhase::PP_ENDED);

    // finalized wins over everything
    assert(GetPollPhase(5000, 100, 200, true) == PollPhase::PP_FINALIZED);

    Options options;
    options.push_back("Yes");
    options.push_back("No");

    Poll poll("Budget", options, 100, 200, "alice");
    assert(poll.getPhase(150) == PollPhase::PP_ACTIVE);
    poll.finalized = true;
    assert(poll.getPhase(250) == PollPhase::PP_FINALIZED);

    assert(printPollPhase(PollPhase::PP_PENDING) == "Upcoming");
    assert(printPollPhase(PollPhase::PP_ACTIVE) == "Active");
    assert(printPollPhase(PollPhase::PP_ENDED) == "Ended");
    assert(printPollPhase(PollPhase::PP_FINALIZED) == "Finalized");
}

// ----------------------------------------------------------------

void testPollRegistry()
{
    PollRegistry registry;
    assert(registry.Count() == 0);

    Options options;
    options.push_back("A");
    options.push_back("B");

    uint64_t first = registry.Append(Poll("First", options, 10, 20, "alice"));
    uint64_t second = registry.Append(Poll("Second", options, 10, 20, "bob"));
    uint64_t third = registry.Append(Poll("Third", options, 10, 20, "carol"));

    // ids are positions
    assert(first == 0);
    assert(second == 1);
    assert(third == 2);
    assert(registry.Count() == 3);

    Poll* poll = NULL;
    assert(registry.Get(1, &poll) == PollResult::PR_OK);
    assert(poll != NULL);
    assert(poll->name == "Second");
    assert(poll->creator == "bob");

    // references stay valid while the registry grows
    registry.Append(Poll("Fourth", options, 10, 20, "dave"));
    assert(poll->name == "Second");

    const PollRegistry& readOnly = registry;
    const Poll* constPoll = NULL;
    assert(readOnly.Get(3, &constPoll) == PollResult::PR_OK);
    assert(constPoll->name == "Fourth");

    assert(registry.Get(4, &poll) == PollResult::PR_UNKNOWN_POLL);
    assert(readOnly.Get(1000, &constPoll) == PollResult::PR_UNKNOWN_POLL);
}

// ----------------------------------------------------------------

void testVoteLedger()
{
    VoteLedger ledger;

    assert(!ledger.HasVoted(0, "alice"));
    assert(ledger.RecordVote(0, "alice") == PollResult::PR_OK);
    assert(ledger.HasVoted(0, "alice"));

    // per poll
    assert(!ledger.HasVoted(1, "alice"));
    assert(ledger.RecordVote(1, "alice") == PollResult::PR_OK);

    // per identity
    assert(!ledger.HasVoted(0, "bob"));

    assert(ledger.RecordVote(0, "alice") == PollResult::PR_ALREADY_VOTED);
    assert(ledger.HasVoted(0, "alice"));
}

// ----------------------------------------------------------------

void testPollResultNames()
{
    assert(getPollResultName(PollResult::PR_OK) == "Ok");
    assert(getPollResultName(PollResult::PR_ALREADY_VOTED) == "AlreadyVoted");
    assert(printPollResult(PollResult::PR_ALREADY_VOTED) == "Address already voted");
    assert(printPollResult(PollResult::PR_POLL_STILL_ACTIVE) == "Poll still active");
}

// ================================================================

void test_poll()
{
    Log::i("(Test) # Test: Poll, Registry and Ledger");

    testPollPhase();
    testPollRegistry();
    testVoteLedger();
    testPollResultNames();
}
