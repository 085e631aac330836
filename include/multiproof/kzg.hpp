#ifndef MULTIPROOF_KZG_HPP
#define MULTIPROOF_KZG_HPP

#include "curve.hpp"
#include "msm.hpp"

namespace multiproof {

/**
 * @brief Powers of a secret tau in both groups, shared read-only
 *
 * g1Powers[i] = tau^i * G1 and g2Powers[i] = tau^i * G2. Commitments read
 * a prefix of g1Powers, verification of a point set of size n reads the
 * first n + 1 of g2Powers.
 */
struct StructuredReferenceString {
    vector<G1> g1Powers;
    vector<G2> g2Powers;

    // Only meaningful on a non-empty SRS
    const G1 &g1Generator() const { return g1Powers.at(0); }
    const G2 &g2Generator() const { return g2Powers.at(0); }

    // Largest committable degree, 0 for an empty SRS
    size_t maxDegree() const { return g1Powers.empty() ? 0 : g1Powers.size() - 1; }

    // Largest point set a verifier can build [Z(tau)]G2 for, 0 for an empty SRS
    size_t maxPoints() const { return g2Powers.empty() ? 0 : g2Powers.size() - 1; }

    /**
     * @brief SRS from given generators and powers of tau
     * @param powers [1, tau, tau^2, ...], one per G1 element
     * @param g2Count number of G2 powers, at most powers.size()
     */
    static StructuredReferenceString fromSecret(const G1 &g1, const G2 &g2,
                                                const vector<Fr> &powers, size_t g2Count);

    // Uses mapToG1(1) and mapToG2(1) as generators. For tests and demos only.
    static StructuredReferenceString fromSecret(const Fr &tau, size_t g1Count, size_t g2Count);
};

typedef StructuredReferenceString SRS;

struct Commitment {
    G1 c;

    bool operator==(const Commitment &o) const { return c == o.c; }
    bool operator!=(const Commitment &o) const { return !(c == o.c); }

    /**
     * @brief Extends commitments to a larger evaluation domain
     * @param commits Evaluations over the size-n domain of an implicit
     *        commitment polynomial
     * @param outputSize Size of the target domain
     *
     * Runs an inverse NTT over the input domain and a forward NTT over the
     * output domain directly on the group elements, which is valid because
     * commitments are additively homomorphic. Throws DomainConstructionFailed
     * if either size has no radix-2 domain.
     */
    static vector<Commitment> extendCommitments(const vector<Commitment> &commits, size_t outputSize);
};

struct Proof {
    G1 w; // Commitment to the quotient

    bool operator==(const Proof &o) const { return w == o.w; }
};

// MSM of coeffs against the SRS prefix; TooManyScalars if degree is too high
Commitment commit(const SRS &srs, const Polynomial &coeffs);

vector<G1> commitmentPoints(const vector<Commitment> &commits);

} // namespace multiproof

#endif // MULTIPROOF_KZG_HPP
