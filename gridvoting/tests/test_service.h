#ifndef TEST_SERVICE_H
#define TEST_SERVICE_H

#include "fhe/encryptedservice.h"

#include <map>
#include <string>
#include <vector>

// small keys keep key generation fast
const int TEST_KEY_BITS = 256;

const Principal TEST_CORE = "test.core";

// ============================================================================
// Forwards to another service, counts calls and fails on request

class InstrumentedService : public EncryptedService
{
public:

    InstrumentedService(EncryptedService& inner):
        inner(inner) {}

    // Calls per operation name
    std::map<std::string, unsigned int> calls;

    // Operation to fail once it was called failAfter times (empty: never)
    std::string failOperation;
    unsigned int failAfter = 0;

    // Handles returned by markPubliclyDecryptable
    std::vector<CounterHandle> markedHandles;

    // ----------------------------------------------------------------

    CounterHandle encryptZero(const Principal& caller)
    {
        this->count("encryptZero");
        return this->inner.encryptZero(caller);
    }

    CounterHandle encryptOne(const Principal& caller)
    {
        this->count("encryptOne");
        return this->inner.encryptOne(caller);
    }

    bool fromExternalCiphertext(const ExternalInput& input, const Principal& caller,
                                const Principal& user, ChoiceHandle& handleOut)
    {
        this->count("fromExternalCiphertext");
        return this->inner.fromExternalCiphertext(input, caller, user, handleOut);
    }

    BoolHandle equals(const ChoiceHandle& choice, uint32_t index, const Principal& caller)
    {
        this->count("equals");
        return this->inner.equals(choice, index, caller);
    }

    CounterHandle select(const BoolHandle& condition, const CounterHandle& ifTrue,
                         const CounterHandle& ifFalse, const Principal& caller)
    {
        this->count("select");
        return this->inner.select(condition, ifTrue, ifFalse, caller);
    }

    CounterHandle add(const CounterHandle& a, const CounterHandle& b, const Principal& caller)
    {
        this->count("add");
        return this->inner.add(a, b, caller);
    }

    void grantPersistentAccess(const Handle& handle, const Principal& grantee, const Principal& caller)
    {
        this->count("grantPersistentAccess");
        this->inner.grantPersistentAccess(handle, grantee, caller);
    }

    CounterHandle markPubliclyDecryptable(const CounterHandle& handle, const Principal& caller)
    {
        this->count("markPubliclyDecryptable");
        CounterHandle revealed = this->inner.markPubliclyDecryptable(handle, caller);
        this->markedHandles.push_back(revealed);
        return revealed;
    }

    void releaseAccess(const Handle& handle, const Principal& principal)
    {
        this->count("releaseAccess");
        this->inner.releaseAccess(handle, principal);
    }

    void clearTransientAccess()
    {
        this->calls["clearTransientAccess"]++;
        this->inner.clearTransientAccess();
    }

    std::map<Handle, uint64_t> publicDecrypt(const std::vector<CounterHandle>& handles)
    {
        this->count("publicDecrypt");
        return this->inner.publicDecrypt(handles);
    }

    uint64_t userDecrypt(const Handle& handle, const Principal& principal)
    {
        this->count("userDecrypt");
        return this->inner.userDecrypt(handle, principal);
    }

    ExternalInput encryptInput(uint32_t value, const Principal& consumer, const Principal& user)
    {
        this->count("encryptInput");
        return this->inner.encryptInput(value, consumer, user);
    }

    // ----------------------------------------------------------------

    void Reset()
    {
        this->calls.clear();
        this->failOperation.clear();
        this->failAfter = 0;
        this->markedHandles.clear();
    }

private:

    EncryptedService& inner;

    void count(const std::string& operation)
    {
        unsigned int previous = this->calls[operation]++;

        if (operation == this->failOperation && previous >= this->failAfter)
            throw EncryptedServiceError("Injected failure in " + operation);
    }
};

#endif // TEST_SERVICE_H
