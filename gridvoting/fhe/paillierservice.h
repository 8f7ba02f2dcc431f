/*=============================================================================

Encrypted arithmetic service backed by the Paillier cryptosystem.

The service acts as a trusted co-processor: it owns the key pair and a store
of ciphertexts addressed by handles. Additions are homomorphic (ciphertext
multiplication mod n^2). Equality tests and selections cannot be expressed
with an additively homomorphic scheme alone, so the co-processor evaluates
them internally and only ever returns freshly re-randomized ciphertexts;
plaintexts never leave the service except through publicDecrypt() or
userDecrypt().

Input proofs are HMAC-SHA256 attestations over (ciphertext, consumer, user)
under a key only the service knows.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_FHE_PAILLIERSERVICE_H
#define GRIDVOTING_FHE_PAILLIERSERVICE_H

#include "fhe/encryptedservice.h"
#include "fhe/handle.h"
#include "fhe/paillierlib.h"
#include "settings.h"

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

// ==========================================================================

class PaillierService : public EncryptedService
{
public:

    PaillierService(int modulusBits = Settings::defaultKeyBits);
    ~PaillierService();

    PaillierService(PaillierService const&)     = delete;
    void operator=(PaillierService const&)      = delete;

    // ----------------------------------------------------------------

    CounterHandle encryptZero(const Principal& caller);
    CounterHandle encryptOne(const Principal& caller);

    bool fromExternalCiphertext(const ExternalInput&, const Principal& caller,
                                const Principal& user, ChoiceHandle& handleOut);

    BoolHandle equals(const ChoiceHandle&, uint32_t index, const Principal& caller);

    CounterHandle select(const BoolHandle& condition, const CounterHandle& ifTrue,
                         const CounterHandle& ifFalse, const Principal& caller);

    CounterHandle add(const CounterHandle&, const CounterHandle&, const Principal& caller);

    void grantPersistentAccess(const Handle&, const Principal& grantee, const Principal& caller);

    void releaseAccess(const Handle&, const Principal& principal);

    CounterHandle markPubliclyDecryptable(const CounterHandle&, const Principal& caller);

    void clearTransientAccess();

    std::map<Handle, uint64_t> publicDecrypt(const std::vector<CounterHandle>&);

    uint64_t userDecrypt(const Handle&, const Principal&);

    ExternalInput encryptInput(uint32_t value, const Principal& consumer, const Principal& user);

    // ----------------------------------------------------------------

    // Number of ciphertexts held by the store
    size_t GetCiphertextCount() const;

    // Check if the principal may currently use the handle
    bool IsAllowed(const Handle&, const Principal&) const;

    // Check if the handle was marked publicly decryptable
    bool IsPubliclyDecryptable(const Handle&) const;

private:

    typedef boost::shared_ptr<paillier_ciphertext_t> Ciphertext;

    // Ciphertext plus its access control state
    struct Entry
    {
        Ciphertext cipher;
        std::set<Principal> persistent;
        std::set<Principal> transient;
        bool publiclyDecryptable = false;
    };

    // ----------------------------------------------------------------

    // Store a new ciphertext, transiently allowed to the caller
    Handle store(HandleType, Ciphertext, const Principal&);

    // Fetch an entry, checking type and access of the caller
    Entry& lookup(const Handle&, HandleType, const Principal&);

    // Fetch an entry without any checks
    Entry& find(const Handle&);

    // Encrypt a small plaintext under the public key
    Ciphertext encrypt(unsigned long);

    // Multiply with a fresh encryption of zero
    Ciphertext rerandomize(const Ciphertext&);

    // Decrypt to an unsigned integer, values outside 64 bit are rejected
    uint64_t decrypt(const Ciphertext&) const;

    // Compare the decryption with a plaintext index
    bool decryptsTo(const Ciphertext&, unsigned long) const;

    // HMAC binding a raw ciphertext to consumer and user
    std::string attest(const std::string&, const Principal&, const Principal&) const;

    // ----------------------------------------------------------------

    paillier_pubkey_t* pubKey = NULL;
    paillier_prvkey_t* prvKey = NULL;

    // Key for input proofs
    unsigned char attestationKey[32];

    // Handle -> ciphertext
    std::map<Handle, Entry> ciphertexts;

    mutable boost::mutex mutex;
};

#endif // GRIDVOTING_FHE_PAILLIERSERVICE_H
