#include "tallyaccumulator.h"

#include <exception>
#include <stdexcept>

#include <boost/foreach.hpp>

// ================================================================

std::vector<CounterHandle>
TallyAccumulator::Accumulate(const ChoiceHandle& choice, const std::vector<CounterHandle>& counters, size_t optionCount)
{
    if (counters.size() != optionCount)
        throw std::invalid_argument("Counter vector does not match the option count");

    CounterHandle one = this->service.encryptOne(this->owner);
    CounterHandle zero = this->service.encryptZero(this->owner);

    std::vector<CounterHandle> result;
    result.reserve(optionCount);

    try
    {
        for (size_t i = 0; i < optionCount; i++)
        {
            BoolHandle match = this->service.equals(choice, (uint32_t) i, this->owner);
            CounterHandle increment = this->service.select(match, one, zero, this->owner);
            CounterHandle updated = this->service.add(counters[i], increment, this->owner);

            // keep the counter usable beyond this operation
            this->service.grantPersistentAccess(updated, this->owner, this->owner);

            result.push_back(updated);
        }
    }
    catch (const std::exception&)
    {
        // counters of a partial vote are never used
        BOOST_FOREACH(const CounterHandle& updated, result)
        {
            this->service.releaseAccess(updated, this->owner);
        }
        throw;
    }

    return result;
}
