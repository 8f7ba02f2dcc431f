/*=============================================================================

Opaque reference to a ciphertext held by an encrypted arithmetic service.
A handle is a random 256 bit identifier tagged with the kind of encrypted
value it refers to; it never carries information about the plaintext.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_FHE_HANDLE_H
#define GRIDVOTING_FHE_HANDLE_H

#include <cstring>
#include <string>

#include <boost/serialization/access.hpp>
#include <boost/serialization/serialization.hpp>

// ----------------------------------------------------------------
enum HandleType
{
    HT_NONE,
    HT_COUNTER,     // encrypted tally (64 bit)
    HT_CHOICE,      // encrypted option index submitted by a voter (32 bit)
    HT_BOOL         // encrypted comparison result
};

// ----------------------------------------------------------------
// Return string naming the given handle type
std::string printHandleType(const HandleType type);

// ----------------------------------------------------------------
class Handle
{
public:

    static const unsigned int WIDTH = 32;

    // ----------------------------------------------------------------

    Handle():
        type(HandleType::HT_NONE)
    {
        memset(this->data, 0, WIDTH);
    }

    // Create a new random handle of the given type
    static Handle Generate(HandleType);

    // ----------------------------------------------------------------

    inline HandleType GetType() const
    {
        return this->type;
    }

    inline bool IsNull() const
    {
        return this->type == HandleType::HT_NONE;
    }

    // Hex representation of the identifier
    std::string GetHex() const;

    // ----------------------------------------------------------------

    inline bool operator<(const Handle& other) const
    {
        if (this->type != other.type)
            return this->type < other.type;

        return memcmp(this->data, other.data, WIDTH) < 0;
    }

    inline bool operator==(const Handle& other) const
    {
        return (this->type == other.type &&
                memcmp(this->data, other.data, WIDTH) == 0);
    }

    inline bool operator!=(const Handle& other) const
    {
        return !(*this == other);
    }

private:

    // Kind of the referenced value
    HandleType type;

    // Random identifier
    unsigned char data[WIDTH];

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->type;
        a & this->data;
    }
};

// Readability aliases, the service checks the tag on every use
typedef Handle CounterHandle;
typedef Handle ChoiceHandle;
typedef Handle BoolHandle;

#endif // GRIDVOTING_FHE_HANDLE_H
