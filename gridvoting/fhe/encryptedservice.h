/*=============================================================================

Interface of the encrypted arithmetic service. The poll engine only ever
works on handles through this interface; plaintext vote values are visible
to the service alone.

Every operation is performed on behalf of a calling principal, which must be
allowed to use all input handles. Results are transiently allowed to the
caller until clearTransientAccess() is called; grantPersistentAccess() makes
an allowance survive that. A ciphertext nobody holds a persistent allowance
for is gone after clearTransientAccess().

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_FHE_ENCRYPTEDSERVICE_H
#define GRIDVOTING_FHE_ENCRYPTEDSERVICE_H

#include "fhe/handle.h"

#include <map>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

// ----------------------------------------------------------------
// Identity of a party (voter, creator, the poll engine itself)
typedef std::string Principal;

// ----------------------------------------------------------------
// Misuse of the service (unknown handle, wrong type, missing access)
class EncryptedServiceError : public std::runtime_error
{
public:
    explicit EncryptedServiceError(const std::string& msg):
        std::runtime_error(msg) {}
};

// ----------------------------------------------------------------
// Client side encryption of a value together with the proof that binds it
// to the consuming principal and the submitting user
typedef struct ExternalInput_t
{
    // Raw ciphertext (hex)
    std::string ciphertext;

    // Input proof (hex)
    std::string proof;
} ExternalInput;

// ----------------------------------------------------------------
class EncryptedService
{
public:
    virtual ~EncryptedService() {}

    // ----- Encryption -----

    virtual CounterHandle encryptZero(const Principal& caller) = 0;
    virtual CounterHandle encryptOne(const Principal& caller) = 0;

    // Verify the input proof and import the ciphertext as a choice,
    // returns false if the proof is rejected
    virtual bool fromExternalCiphertext(const ExternalInput&, const Principal& caller,
                                        const Principal& user, ChoiceHandle& handleOut) = 0;

    // ----- Homomorphic operations -----

    // Encrypted test choice == index
    virtual BoolHandle equals(const ChoiceHandle&, uint32_t index, const Principal& caller) = 0;

    // Encrypted condition ? ifTrue : ifFalse
    virtual CounterHandle select(const BoolHandle& condition, const CounterHandle& ifTrue,
                                 const CounterHandle& ifFalse, const Principal& caller) = 0;

    // Encrypted sum
    virtual CounterHandle add(const CounterHandle&, const CounterHandle&, const Principal& caller) = 0;

    // ----- Access control -----

    virtual void grantPersistentAccess(const Handle&, const Principal& grantee, const Principal& caller) = 0;

    // Drop every allowance the principal holds on the handle
    virtual void releaseAccess(const Handle&, const Principal& principal) = 0;

    // Publicly decryptable copy of the counter under a new handle,
    // the given counter itself stays private
    virtual CounterHandle markPubliclyDecryptable(const CounterHandle&, const Principal& caller) = 0;

    // Drop all allowances handed out for the current operation
    virtual void clearTransientAccess() = 0;

    // ----- Decryption -----

    // Decrypt publicly decryptable handles, usable by anyone
    virtual std::map<Handle, uint64_t> publicDecrypt(const std::vector<CounterHandle>&) = 0;

    // Decrypt a handle the given principal holds a persistent allowance for
    virtual uint64_t userDecrypt(const Handle&, const Principal&) = 0;

    // ----- Client side -----

    // Encrypt a choice for the given user, to be consumed by the given principal
    virtual ExternalInput encryptInput(uint32_t value, const Principal& consumer, const Principal& user) = 0;
};

#endif // GRIDVOTING_FHE_ENCRYPTEDSERVICE_H
