#include "pollcontroller.h"

#include "helper.h"
#include "settings.h"

#include <exception>

#include <boost/foreach.hpp>
#include <boost/thread/locks.hpp>

// ================================================================

// Drops the transient allowances of one operation when leaving scope
class TransientAccessScope
{
public:
    TransientAccessScope(EncryptedService& service):
        service(service) {}

    ~TransientAccessScope()
    {
        this->service.clearTransientAccess();
    }

private:
    EncryptedService& service;
};

// ================================================================

PollController::PollController(EncryptedService& service, const Clock& clock, const Principal& self):
    service(service),
    clock(clock),
    self(self),
    accumulator(service, self)
{
}

// ================================================================

PollResult
PollController::createPoll(const std::string& name, const Options& options, int64_t start, int64_t end,
                           const Principal& creator, uint64_t& idOut)
{
    PollEvent event;

    {
        boost::unique_lock<boost::shared_mutex> lock(this->mutex);

        if (options.size() < Settings::POLL_MIN_OPTIONS || options.size() > Settings::POLL_MAX_OPTIONS)
            return PollResult::PR_INVALID_OPTION_COUNT;

        if (end <= start || start < this->clock.Now())
            return PollResult::PR_INVALID_WINDOW;

        if (name.empty())
            return PollResult::PR_EMPTY_NAME;

        Poll poll(name, options, start, end, creator);

        TransientAccessScope scope(this->service);
        try
        {
            // one encrypted zero per option, kept usable for later votes
            for (size_t i = 0; i < options.size(); i++)
            {
                CounterHandle counter = this->service.encryptZero(this->self);
                this->service.grantPersistentAccess(counter, this->self, this->self);
                poll.encryptedCounts.push_back(counter);
            }
        }
        catch (const std::exception& e)
        {
            Log::e("(PollController) Could not initialize counters: %s", e.what());
            this->Release(poll.encryptedCounts);
            return PollResult::PR_SERVICE_FAILURE;
        }

        idOut = this->registry.Append(poll);

        Log::i("(PollController) Poll %llu created (%s, %u options)",
               (unsigned long long) idOut, name.c_str(), (unsigned int) options.size());

        event.type = PollEventType::PE_CREATED;
        event.pollId = idOut;
        event.name = name;
        event.start = start;
        event.end = end;
        event.optionCount = options.size();
    }

    this->Distribute(event);
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::castVote(uint64_t pollId, const ExternalInput& encryptedChoice, const Principal& voter)
{
    PollEvent event;

    {
        boost::unique_lock<boost::shared_mutex> lock(this->mutex);

        Poll* poll = NULL;
        PollResult result = this->registry.Get(pollId, &poll);
        if (result != PollResult::PR_OK)
            return result;

        int64_t now = this->clock.Now();
        if (now < poll->start)
            return PollResult::PR_NOT_STARTED;

        if (now >= poll->end)
            return PollResult::PR_WINDOW_CLOSED;

        if (this->ledger.HasVoted(pollId, voter))
            return PollResult::PR_ALREADY_VOTED;

        TransientAccessScope scope(this->service);
        std::vector<CounterHandle> updated;
        try
        {
            ChoiceHandle choice;
            if (!this->service.fromExternalCiphertext(encryptedChoice, this->self, voter, choice))
                return PollResult::PR_INVALID_CIPHERTEXT;

            updated = this->accumulator.Accumulate(choice, poll->encryptedCounts, poll->options.size());
        }
        catch (const std::exception& e)
        {
            Log::e("(PollController) Could not accumulate vote on poll %llu: %s",
                   (unsigned long long) pollId, e.what());
            return PollResult::PR_SERVICE_FAILURE;
        }

        // commit
        result = this->ledger.RecordVote(pollId, voter);
        if (result != PollResult::PR_OK)
        {
            this->Release(updated);
            return result;
        }

        // the superseded counters are not referenced anymore
        poll->encryptedCounts.swap(updated);
        this->Release(updated);

        Log::i("(PollController) Vote on poll %llu accepted (voter: %s)",
               (unsigned long long) pollId, voter.c_str());

        event.type = PollEventType::PE_VOTE_CAST;
        event.pollId = pollId;
        event.voter = voter;
    }

    this->Distribute(event);
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::finalizePoll(uint64_t pollId)
{
    PollEvent event;

    {
        boost::unique_lock<boost::shared_mutex> lock(this->mutex);

        Poll* poll = NULL;
        PollResult result = this->registry.Get(pollId, &poll);
        if (result != PollResult::PR_OK)
            return result;

        if (this->clock.Now() < poll->end)
            return PollResult::PR_POLL_STILL_ACTIVE;

        if (poll->finalized)
            return PollResult::PR_ALREADY_FINALIZED;

        TransientAccessScope scope(this->service);
        std::vector<CounterHandle> revealed;
        try
        {
            // the private counters stay untouched until every public copy exists
            BOOST_FOREACH(const CounterHandle& counter, poll->encryptedCounts)
            {
                CounterHandle publicCounter = this->service.markPubliclyDecryptable(counter, this->self);
                this->service.grantPersistentAccess(publicCounter, this->self, this->self);
                revealed.push_back(publicCounter);
            }
        }
        catch (const std::exception& e)
        {
            Log::e("(PollController) Could not finalize poll %llu: %s",
                   (unsigned long long) pollId, e.what());
            this->Release(revealed);
            return PollResult::PR_SERVICE_FAILURE;
        }

        poll->encryptedCounts.swap(revealed);
        poll->finalized = true;
        this->Release(revealed);

        Log::i("(PollController) Poll %llu finalized", (unsigned long long) pollId);

        event.type = PollEventType::PE_FINALIZED;
        event.pollId = pollId;
    }

    this->Distribute(event);
    return PollResult::PR_OK;
}

// ================================================================

uint64_t
PollController::getPollCount() const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);
    return this->registry.Count();
}

// ----------------------------------------------------------------

PollResult
PollController::getPollMetadata(uint64_t pollId, PollMetadata& metadataOut) const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);

    const Poll* poll = NULL;
    PollResult result = this->registry.Get(pollId, &poll);
    if (result != PollResult::PR_OK)
        return result;

    metadataOut.name = poll->name;
    metadataOut.start = poll->start;
    metadataOut.end = poll->end;
    metadataOut.finalized = poll->finalized;
    metadataOut.creator = poll->creator;
    metadataOut.optionCount = poll->options.size();

    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::getOptions(uint64_t pollId, Options& optionsOut) const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);

    const Poll* poll = NULL;
    PollResult result = this->registry.Get(pollId, &poll);
    if (result != PollResult::PR_OK)
        return result;

    optionsOut = poll->options;
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::hasVoted(uint64_t pollId, const Principal& identity, bool& votedOut) const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);

    const Poll* poll = NULL;
    PollResult result = this->registry.Get(pollId, &poll);
    if (result != PollResult::PR_OK)
        return result;

    votedOut = this->ledger.HasVoted(pollId, identity);
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::getEncryptedResults(uint64_t pollId, std::vector<CounterHandle>& resultsOut) const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);

    const Poll* poll = NULL;
    PollResult result = this->registry.Get(pollId, &poll);
    if (result != PollResult::PR_OK)
        return result;

    if (!poll->finalized)
        return PollResult::PR_NOT_FINALIZED;

    resultsOut = poll->encryptedCounts;
    return PollResult::PR_OK;
}

// ----------------------------------------------------------------

PollResult
PollController::getPollPhase(uint64_t pollId, PollPhase& phaseOut) const
{
    boost::shared_lock<boost::shared_mutex> lock(this->mutex);

    const Poll* poll = NULL;
    PollResult result = this->registry.Get(pollId, &poll);
    if (result != PollResult::PR_OK)
        return result;

    phaseOut = poll->getPhase(this->clock.Now());
    return PollResult::PR_OK;
}

// ================================================================

void
PollController::SetCallback(PollEventType type, boost::function<void (const PollEvent&)> callback)
{
    boost::unique_lock<boost::shared_mutex> lock(this->mutex);
    this->callbacks[type] = callback;
}

// ================================================================

void
PollController::Release(const std::vector<CounterHandle>& counters)
{
    BOOST_FOREACH(const CounterHandle& counter, counters)
    {
        try
        {
            this->service.releaseAccess(counter, this->self);
        }
        catch (const std::exception& e)
        {
            Log::w("(PollController) Could not release counter %s: %s", counter.GetHex().c_str(), e.what());
        }
    }
}

// ----------------------------------------------------------------

void
PollController::Distribute(const PollEvent& event)
{
    boost::function<void (const PollEvent&)> callback;

    {
        boost::shared_lock<boost::shared_mutex> lock(this->mutex);

        std::map<PollEventType, boost::function<void (const PollEvent&)>>::const_iterator iter =
                this->callbacks.find(event.type);

        if (iter == this->callbacks.end())
            return;

        callback = iter->second;
    }

    // invoked unlocked, the callback may query the controller
    if (callback)
        callback(event);
}
