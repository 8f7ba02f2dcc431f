/*=============================================================================

Single place to pull in libpaillier. The library ships a plain C header, so
GMP has to be included first (it declares C++ overloads) and the paillier
declarations need C linkage.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_FHE_PAILLIERLIB_H
#define GRIDVOTING_FHE_PAILLIERLIB_H

#include <gmp.h>

extern "C" {
#include <paillier.h>
}

#include <string>

// ==========================================================================

// Hex representation of a GMP integer
std::string mpz_to_hex(const mpz_t);

// Parse hex into an initialized GMP integer, false on malformed input
bool mpz_from_hex(mpz_t, const std::string&);

#endif // GRIDVOTING_FHE_PAILLIERLIB_H
