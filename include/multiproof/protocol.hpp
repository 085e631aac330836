#ifndef MULTIPROOF_PROTOCOL_HPP
#define MULTIPROOF_PROTOCOL_HPP

#include "curve.hpp"
#include "kzg.hpp"
#include "transcript.hpp"

namespace multiproof {

// Transcript labels shared by every variant, in the order they are used
extern const char *const LABEL_GAMMA;
extern const char *const LABEL_PROOF;

/**
 * @brief Binds points and evals, then derives gamma
 * @return [1, gamma, ..., gamma^(nPolys-1)], the weight of each polynomial
 *
 * open and verify must both call this before anything else touches the
 * transcript.
 */
vector<Fr> openingChallenges(Transcript &transcript, const vector<Fr> &points,
                             const vector<vector<Fr>> &evals, size_t nPolys);

// Per point j, sum_i challenges[i] * evals[i][j]
vector<Fr> combineEvaluations(const vector<vector<Fr>> &evals, const vector<Fr> &challenges);

/**
 * @brief (aggregated - interpolant) / vanishing
 *
 * The remainder is dropped; it is zero whenever the evaluations are honest.
 */
Polynomial quotientPolynomial(const Polynomial &aggregated, const Polynomial &interpolant,
                              const Polynomial &vanishing);

// Binds the finished proof so later challenges depend on it
void transcribeProof(Transcript &transcript, const Proof &proof);

/**
 * @brief e(aggregated - interpolant, g2) == e(proof, vanishing)
 *
 * vanishing is [Z(tau)]G2 for the opened point set.
 */
bool pairingCheck(const G1 &aggregated, const G1 &interpolant, const G2 &g2,
                  const Proof &proof, const G2 &vanishing);

} // namespace multiproof

#endif // MULTIPROOF_PROTOCOL_HPP
