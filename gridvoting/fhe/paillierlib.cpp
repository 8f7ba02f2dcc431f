#include "fhe/paillierlib.h"

#include <cctype>
#include <vector>

// ================================================================

std::string mpz_to_hex(const mpz_t value)
{
    // see GMP docs for the +2
    std::vector<char> hex(mpz_sizeinbase(value, 16) + 2);
    mpz_get_str(&hex[0], 16, value);
    return std::string(&hex[0]);
}

// ----------------------------------------------------------------

bool mpz_from_hex(mpz_t value, const std::string& hex)
{
    if (hex.empty())
        return false;

    // GMP would skip whitespace and accept a sign, raw ciphertexts have neither
    for (size_t i = 0; i < hex.size(); i++)
    {
        if (!isxdigit((unsigned char) hex[i]))
            return false;
    }

    return mpz_set_str(value, hex.c_str(), 16) == 0;
}
