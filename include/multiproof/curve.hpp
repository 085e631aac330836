#ifndef MULTIPROOF_CURVE_HPP
#define MULTIPROOF_CURVE_HPP

#include <mcl/bn.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace multiproof {

using std::size_t;
using std::string;
using std::vector;

using mcl::bn::Fr;
using mcl::bn::G1;
using mcl::bn::G2;
using mcl::bn::GT;

// Dense, low-degree-first coefficients.
typedef vector<Fr> Polynomial;

/**
 * @brief Initializes the BN_SNARK1 pairing once per process
 *
 * Safe to call from any thread and any number of times. Every protocol
 * object calls this on construction.
 */
void initialize();

} // namespace multiproof

#endif // MULTIPROOF_CURVE_HPP
