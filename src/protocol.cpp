#include "../include/multiproof/protocol.hpp"
#include "../include/multiproof/polynomial.hpp"
#include "../include/multiproof/serialize.hpp"
#include <mcl/bn.hpp>

using namespace std;
using namespace mcl::bn;

namespace multiproof {

const char *const LABEL_GAMMA = "open gamma";
const char *const LABEL_PROOF = "open proof";

vector<Fr> openingChallenges(Transcript &transcript, const vector<Fr> &points,
                             const vector<vector<Fr>> &evals, size_t nPolys) {
    size_t field_size = serializedSize<Fr>();
    transcribePointsAndEvals(transcript, points, evals, field_size);
    Fr gamma = getChallenge(transcript, LABEL_GAMMA, field_size);
    return powers(gamma, nPolys);
}

vector<Fr> combineEvaluations(const vector<vector<Fr>> &evals, const vector<Fr> &challenges) {
    size_t n_points = evals.empty() ? 0 : evals[0].size();
    vector<Fr> ret(n_points, 0);
    for (size_t i = 0; i < evals.size() && i < challenges.size(); i++) {
        for (size_t j = 0; j < n_points; j++) {
            ret[j] += evals[i][j] * challenges[i];
        }
    }
    return ret;
}

Polynomial quotientPolynomial(const Polynomial &aggregated, const Polynomial &interpolant,
                              const Polynomial &vanishing) {
    Polynomial numerator = subPolynomials(aggregated, interpolant);
    return polyDivQR(numerator, vanishing).first;
}

void transcribeProof(Transcript &transcript, const Proof &proof) {
    transcribeGeneric(transcript, LABEL_PROOF, proof.w);
}

bool pairingCheck(const G1 &aggregated, const G1 &interpolant, const G2 &g2,
                  const Proof &proof, const G2 &vanishing) {
    G1 lhs;
    G1::sub(lhs, aggregated, interpolant);

    GT left, right;
    pairing(left, lhs, g2);
    pairing(right, proof.w, vanishing);

    return left == right;
}

} // namespace multiproof
