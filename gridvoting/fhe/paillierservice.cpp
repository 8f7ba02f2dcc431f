#include "fhe/paillierservice.h"

#include "helper.h"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <boost/foreach.hpp>

// ================================================================

PaillierService::PaillierService(int modulusBits)
{
    if (modulusBits < Settings::PAILLIER_MIN_BITS)
        throw std::invalid_argument("Paillier modulus of " + std::to_string(modulusBits) + " bits is too small");

    Log::i("(Paillier) Generating %d bit key pair", modulusBits);
    paillier_keygen(modulusBits, &this->pubKey, &this->prvKey, paillier_get_rand_devurandom);

    Helper::GenerateRandomBytes(this->attestationKey, sizeof(this->attestationKey));
}

// ----------------------------------------------------------------

PaillierService::~PaillierService()
{
    this->ciphertexts.clear();

    paillier_freeprvkey(this->prvKey);
    paillier_freepubkey(this->pubKey);
}

// ================================================================

CounterHandle
PaillierService::encryptZero(const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->store(HandleType::HT_COUNTER, this->encrypt(0), caller);
}

// ----------------------------------------------------------------

CounterHandle
PaillierService::encryptOne(const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->store(HandleType::HT_COUNTER, this->encrypt(1), caller);
}

// ----------------------------------------------------------------

bool
PaillierService::fromExternalCiphertext(const ExternalInput& input, const Principal& caller,
                                        const Principal& user, ChoiceHandle& handleOut)
{
    boost::mutex::scoped_lock lock(this->mutex);

    // the proof has to be issued for exactly this ciphertext, consumer and user
    std::string expected = this->attest(input.ciphertext, caller, user);
    if (input.proof.size() != expected.size() ||
            CRYPTO_memcmp(input.proof.data(), expected.data(), expected.size()) != 0)
    {
        Log::w("(Paillier) Input proof rejected (user: %s)", user.c_str());
        return false;
    }

    Ciphertext cipher(paillier_create_enc_zero(), paillier_freeciphertext);
    if (!mpz_from_hex(cipher->c, input.ciphertext))
    {
        Log::w("(Paillier) Malformed ciphertext (user: %s)", user.c_str());
        return false;
    }

    // a valid ciphertext is a unit of Z*_{n^2}
    mpz_t gcd;
    mpz_init(gcd);
    mpz_gcd(gcd, cipher->c, this->pubKey->n);
    bool valid = (mpz_sgn(cipher->c) > 0 &&
                  mpz_cmp(cipher->c, this->pubKey->n_squared) < 0 &&
                  mpz_cmp_ui(gcd, 1) == 0);
    mpz_clear(gcd);

    if (!valid)
    {
        Log::w("(Paillier) Ciphertext out of range (user: %s)", user.c_str());
        return false;
    }

    handleOut = this->store(HandleType::HT_CHOICE, cipher, caller);
    return true;
}

// ================================================================

BoolHandle
PaillierService::equals(const ChoiceHandle& choice, uint32_t index, const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    const Entry& entry = this->lookup(choice, HandleType::HT_CHOICE, caller);
    bool match = this->decryptsTo(entry.cipher, index);

    return this->store(HandleType::HT_BOOL, this->encrypt(match ? 1 : 0), caller);
}

// ----------------------------------------------------------------

CounterHandle
PaillierService::select(const BoolHandle& condition, const CounterHandle& ifTrue,
                        const CounterHandle& ifFalse, const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    const Entry& cond = this->lookup(condition, HandleType::HT_BOOL, caller);
    const Entry& first = this->lookup(ifTrue, HandleType::HT_COUNTER, caller);
    const Entry& second = this->lookup(ifFalse, HandleType::HT_COUNTER, caller);

    // never hand out the chosen ciphertext itself, it would be linkable
    const Ciphertext& chosen = this->decryptsTo(cond.cipher, 1) ? first.cipher : second.cipher;

    return this->store(HandleType::HT_COUNTER, this->rerandomize(chosen), caller);
}

// ----------------------------------------------------------------

CounterHandle
PaillierService::add(const CounterHandle& left, const CounterHandle& right, const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    const Entry& a = this->lookup(left, HandleType::HT_COUNTER, caller);
    const Entry& b = this->lookup(right, HandleType::HT_COUNTER, caller);

    // E(a) * E(b) = E(a + b)
    Ciphertext sum(paillier_create_enc_zero(), paillier_freeciphertext);
    paillier_mul(this->pubKey, sum.get(), a.cipher.get(), b.cipher.get());

    return this->store(HandleType::HT_COUNTER, sum, caller);
}

// ================================================================

void
PaillierService::grantPersistentAccess(const Handle& handle, const Principal& grantee, const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    Entry& entry = this->lookup(handle, handle.GetType(), caller);
    entry.persistent.insert(grantee);
}

// ----------------------------------------------------------------

void
PaillierService::releaseAccess(const Handle& handle, const Principal& principal)
{
    boost::mutex::scoped_lock lock(this->mutex);

    Entry& entry = this->find(handle);
    entry.persistent.erase(principal);
    entry.transient.erase(principal);
}

// ----------------------------------------------------------------

CounterHandle
PaillierService::markPubliclyDecryptable(const CounterHandle& handle, const Principal& caller)
{
    boost::mutex::scoped_lock lock(this->mutex);

    Ciphertext cipher = this->lookup(handle, HandleType::HT_COUNTER, caller).cipher;

    CounterHandle result = this->store(HandleType::HT_COUNTER, this->rerandomize(cipher), caller);
    this->ciphertexts[result].publiclyDecryptable = true;

    return result;
}

// ----------------------------------------------------------------

void
PaillierService::clearTransientAccess()
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<Handle, Entry>::iterator iter = this->ciphertexts.begin();
    while (iter != this->ciphertexts.end())
    {
        iter->second.transient.clear();

        // nobody holds this ciphertext anymore
        if (iter->second.persistent.empty())
            this->ciphertexts.erase(iter++);
        else
            ++iter;
    }
}

// ================================================================

std::map<Handle, uint64_t>
PaillierService::publicDecrypt(const std::vector<CounterHandle>& handles)
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<Handle, uint64_t> result;
    BOOST_FOREACH(const CounterHandle& handle, handles)
    {
        const Entry& entry = this->find(handle);
        if (!entry.publiclyDecryptable)
            throw EncryptedServiceError("Handle " + handle.GetHex() + " is not publicly decryptable");

        result[handle] = this->decrypt(entry.cipher);
    }

    return result;
}

// ----------------------------------------------------------------

uint64_t
PaillierService::userDecrypt(const Handle& handle, const Principal& principal)
{
    boost::mutex::scoped_lock lock(this->mutex);

    const Entry& entry = this->find(handle);
    if (!entry.persistent.count(principal))
        throw EncryptedServiceError(principal + " may not decrypt handle " + handle.GetHex());

    return this->decrypt(entry.cipher);
}

// ----------------------------------------------------------------

ExternalInput
PaillierService::encryptInput(uint32_t value, const Principal& consumer, const Principal& user)
{
    boost::mutex::scoped_lock lock(this->mutex);

    Ciphertext cipher = this->encrypt(value);

    ExternalInput input;
    input.ciphertext = mpz_to_hex(cipher->c);
    input.proof = this->attest(input.ciphertext, consumer, user);

    return input;
}

// ================================================================

size_t
PaillierService::GetCiphertextCount() const
{
    boost::mutex::scoped_lock lock(this->mutex);
    return this->ciphertexts.size();
}

// ----------------------------------------------------------------

bool
PaillierService::IsAllowed(const Handle& handle, const Principal& principal) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<Handle, Entry>::const_iterator iter = this->ciphertexts.find(handle);
    if (iter == this->ciphertexts.end())
        return false;

    return (iter->second.persistent.count(principal) > 0 ||
            iter->second.transient.count(principal) > 0);
}

// ----------------------------------------------------------------

bool
PaillierService::IsPubliclyDecryptable(const Handle& handle) const
{
    boost::mutex::scoped_lock lock(this->mutex);

    std::map<Handle, Entry>::const_iterator iter = this->ciphertexts.find(handle);
    return (iter != this->ciphertexts.end() && iter->second.publiclyDecryptable);
}

// ================================================================

Handle
PaillierService::store(HandleType type, Ciphertext cipher, const Principal& caller)
{
    Handle handle = Handle::Generate(type);

    Entry& entry = this->ciphertexts[handle];
    entry.cipher = cipher;
    entry.transient.insert(caller);

    return handle;
}

// ----------------------------------------------------------------

PaillierService::Entry&
PaillierService::lookup(const Handle& handle, HandleType type, const Principal& caller)
{
    if (handle.GetType() != type)
        throw EncryptedServiceError("Handle " + handle.GetHex() + " is a " + printHandleType(handle.GetType()) +
                                    " handle, expected " + printHandleType(type));

    Entry& entry = this->find(handle);
    if (!entry.persistent.count(caller) && !entry.transient.count(caller))
        throw EncryptedServiceError(caller + " is not allowed to use handle " + handle.GetHex());

    return entry;
}

// ----------------------------------------------------------------

PaillierService::Entry&
PaillierService::find(const Handle& handle)
{
    std::map<Handle, Entry>::iterator iter = this->ciphertexts.find(handle);
    if (iter == this->ciphertexts.end())
        throw EncryptedServiceError("Unknown handle " + handle.GetHex());

    return iter->second;
}

// ----------------------------------------------------------------

PaillierService::Ciphertext
PaillierService::encrypt(unsigned long value)
{
    paillier_plaintext_t* plain = paillier_plaintext_from_ui(value);
    paillier_ciphertext_t* cipher = paillier_enc(NULL, this->pubKey, plain, paillier_get_rand_devurandom);
    paillier_freeplaintext(plain);

    return Ciphertext(cipher, paillier_freeciphertext);
}

// ----------------------------------------------------------------

PaillierService::Ciphertext
PaillierService::rerandomize(const Ciphertext& cipher)
{
    Ciphertext zero = this->encrypt(0);

    Ciphertext result(paillier_create_enc_zero(), paillier_freeciphertext);
    paillier_mul(this->pubKey, result.get(), cipher.get(), zero.get());

    return result;
}

// ----------------------------------------------------------------

uint64_t
PaillierService::decrypt(const Ciphertext& cipher) const
{
    paillier_plaintext_t* plain = paillier_dec(NULL, this->pubKey, this->prvKey, cipher.get());

    if (mpz_sizeinbase(plain->m, 2) > 64)
    {
        paillier_freeplaintext(plain);
        throw EncryptedServiceError("Plaintext does not fit into 64 bit");
    }

    uint64_t value = mpz_get_ui(plain->m);
    paillier_freeplaintext(plain);

    return value;
}

// ----------------------------------------------------------------

bool
PaillierService::decryptsTo(const Ciphertext& cipher, unsigned long value) const
{
    paillier_plaintext_t* plain = paillier_dec(NULL, this->pubKey, this->prvKey, cipher.get());
    bool result = (mpz_cmp_ui(plain->m, value) == 0);
    paillier_freeplaintext(plain);

    return result;
}

// ----------------------------------------------------------------

std::string
PaillierService::attest(const std::string& ciphertext, const Principal& consumer, const Principal& user) const
{
    // NUL separated fields
    std::string message = ciphertext;
    message.push_back('\0');
    message += consumer;
    message.push_back('\0');
    message += user;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (HMAC(EVP_sha256(), this->attestationKey, sizeof(this->attestationKey),
             (const unsigned char*) message.data(), message.size(), digest, &length) == NULL)
        throw EncryptedServiceError("Could not compute input proof");

    return Helper::ToHex(digest, length);
}
