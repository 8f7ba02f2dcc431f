/*=============================================================================

Adds one encrypted vote to the encrypted counters of a poll.

For every option i the accumulator computes
    match_i     = equals(choice, i)
    increment_i = select(match_i, E(1), E(0))
    counter_i   = add(counter_i, increment_i)
so the same sequence of ciphertext operations runs for every vote and no
branch ever depends on the choice. A choice outside [0, optionCount) matches
no option and adds zero everywhere.

The stored counters are not touched; the caller receives a new vector (every
handle replaced, persistent access granted to the owner) and commits it once
all service calls succeeded. If a call fails, the counters granted so far
are released again before the error propagates.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_TALLYACCUMULATOR_H
#define GRIDVOTING_TALLYACCUMULATOR_H

#include "fhe/encryptedservice.h"
#include "fhe/handle.h"

#include <vector>

// ==========================================================================

class TallyAccumulator
{
public:

    TallyAccumulator(EncryptedService& service, const Principal& owner):
        service(service),
        owner(owner) {}

    // ----------------------------------------------------------------

    // Compute the counters after adding the one-hot encoding of the choice
    std::vector<CounterHandle> Accumulate(const ChoiceHandle&, const std::vector<CounterHandle>&, size_t optionCount);

private:

    EncryptedService& service;

    // Principal performing the operations and holding the counters
    Principal owner;
};

#endif // GRIDVOTING_TALLYACCUMULATOR_H
