#ifndef MULTIPROOF_METHOD2_HPP
#define MULTIPROOF_METHOD2_HPP

#include "config.hpp"
#include "multiproof.hpp"
#include <memory>

namespace multiproof {

// Everything about a fixed point set that does not depend on the polynomials
struct PrecomputedDomain {
    vector<Fr> points;
    Polynomial vanishing;
    G2 vanishingCommitment;             // [Z(tau)]G2
    vector<Polynomial> lagrange;        // L_j over points
    vector<G1> lagrangeCommitments;     // [L_j(tau)]G1
};

/**
 * @brief Multi-proofs over point sets registered at construction
 *
 * Point sets are referred to by their position in the constructor
 * argument. The vanishing polynomial, its G2 commitment and the Lagrange
 * basis with its G1 commitments are computed once, so open and verify
 * skip interpolation and the G2 MSM. Transcripts are bound exactly as in
 * Method1, a proof made by either one verifies with the other for the
 * same point set and SRS.
 */
class Method2 : public Committer, public MultiProofPrecomp {
public:
    /**
     * @param srs Must hold at least n G1 and n + 1 G2 powers for the
     *        largest point set of size n
     * @param pointSets Non-empty, duplicate-free point sets
     *
     * Throws NoPointsGiven, DuplicatePoints or TooManyScalars for a bad set.
     */
    Method2(std::shared_ptr<const SRS> srs, const vector<vector<Fr>> &pointSets,
            Config config = Config());

    Commitment commit(const Polynomial &coeffs) const override;
    vector<Commitment> commitAll(const vector<Polynomial> &polys) const override;

    Proof open(Transcript &transcript, const vector<vector<Fr>> &evals,
               const vector<Polynomial> &polys, size_t pointSet) const override;

    bool verify(Transcript &transcript, const vector<Commitment> &commits,
                size_t pointSet, const vector<vector<Fr>> &evals,
                const Proof &proof) const override;

    // UnknownPointSet if index was never registered
    const PrecomputedDomain &domain(size_t index) const;

    size_t domainCount() const { return domains_.size(); }

    // Index of a registered set equal to points, in the same order
    bool findDomain(const vector<Fr> &points, size_t &index) const;

    const SRS &srs() const { return *srs_; }

private:
    PrecomputedDomain precompute(const vector<Fr> &points) const;

    std::shared_ptr<const SRS> srs_;
    Config config_;
    vector<PrecomputedDomain> domains_;
};

} // namespace multiproof

#endif // MULTIPROOF_METHOD2_HPP
