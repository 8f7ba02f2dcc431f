#include "tests/test_serialization.h"

#include "poll.h"
#include "fhe/handle.h"
#include "fhe/paillierservice.h"
#include "tests/test_service.h"

#include <cassert>
#include <map>
#include <vector>

// ----------------------------------------------------------------

void testSerializeHandle()
{
    PaillierService service(TEST_KEY_BITS);

    CounterHandle original = service.encryptOne(TEST_CORE);
    service.grantPersistentAccess(original, TEST_CORE, TEST_CORE);

    serialize(original);

    CounterHandle restored;
    assert(restored.IsNull());
    deserialize(restored);

    assert(restored == original);
    assert(restored.GetType() == HandleType::HT_COUNTER);
    assert(restored.GetHex() == original.GetHex());
    assert(restored.GetHex().size() == 2 * Handle::WIDTH);

    // still addresses the same ciphertext
    assert(service.userDecrypt(restored, TEST_CORE) == 1);
}

// ----------------------------------------------------------------

void testSerializePollExport()
{
    PaillierService service(TEST_KEY_BITS);

    PollExport original;
    original.id = 3;
    original.name = "Launch Plan";
    original.options.push_back("Alpha");
    original.options.push_back("Beta");
    original.start = 1000;
    original.end = 4600;
    original.creator = "creator";

    for (uint64_t i = 0; i < 2; i++)
    {
        CounterHandle counter = service.encryptZero(TEST_CORE);
        service.grantPersistentAccess(counter, TEST_CORE, TEST_CORE);
        CounterHandle revealed = service.markPubliclyDecryptable(counter, TEST_CORE);
        service.grantPersistentAccess(revealed, TEST_CORE, TEST_CORE);

        original.handles.push_back(revealed);
        original.tallies.push_back(0);
    }

    serialize(original);

    PollExport restored;
    deserialize(restored);

    assert(restored == original);

    // handles can be decrypted again by anyone
    std::map<Handle, uint64_t> plaintexts = service.publicDecrypt(restored.handles);
    assert(plaintexts.size() == 2);
}

// ================================================================

void test_serialization()
{
    Log::i("(Test) # Test: Serialization");

    testSerializeHandle();
    testSerializePollExport();
}
