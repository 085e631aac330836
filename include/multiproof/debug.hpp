// Consistency checks printed when Config::debug is set.
// They re-derive values the protocol already trusts and never throw.

#ifndef MULTIPROOF_DEBUG_HPP
#define MULTIPROOF_DEBUG_HPP

#include "curve.hpp"

namespace multiproof {

struct PrecomputedDomain;

// Q * Z + R == aggregated, and R(x_j) == aggEvals[j]
bool debugOpening(const Polynomial &aggregated, const Polynomial &interpolant,
                  const Polynomial &vanishing, const Polynomial &quotient,
                  const vector<Fr> &points, const vector<Fr> &aggEvals);

// Z(x_j) == 0 and L_j(x_k) == (j == k)
bool debugDomain(const PrecomputedDomain &domain);

} // namespace multiproof

#endif // MULTIPROOF_DEBUG_HPP
