#ifndef MULTIPROOF_MULTIPROOF_HPP
#define MULTIPROOF_MULTIPROOF_HPP

#include "curve.hpp"
#include "kzg.hpp"
#include "transcript.hpp"

namespace multiproof {

class Committer {
public:
    virtual ~Committer() {}

    // TooManyScalars if the degree exceeds the SRS
    virtual Commitment commit(const Polynomial &coeffs) const = 0;

    // One commitment per polynomial, in input order
    virtual vector<Commitment> commitAll(const vector<Polynomial> &polys) const = 0;
};

/**
 * @brief Multi-proofs over an arbitrary point set given on every call
 *
 * evals[i][j] is the claimed value of polynomial i at points[j]. The same
 * transcript history must be presented to open and to verify.
 */
class MultiProofNoPrecomp {
public:
    virtual ~MultiProofNoPrecomp() {}

    virtual Proof open(Transcript &transcript, const vector<vector<Fr>> &evals,
                       const vector<Polynomial> &polys, const vector<Fr> &points) const = 0;

    // false for a proof that does not check out, throws only for malformed inputs
    virtual bool verify(Transcript &transcript, const vector<Commitment> &commits,
                        const vector<Fr> &points, const vector<vector<Fr>> &evals,
                        const Proof &proof) const = 0;
};

// Multi-proofs over point sets registered ahead of time and selected by index
class MultiProofPrecomp {
public:
    virtual ~MultiProofPrecomp() {}

    virtual Proof open(Transcript &transcript, const vector<vector<Fr>> &evals,
                       const vector<Polynomial> &polys, size_t pointSet) const = 0;

    virtual bool verify(Transcript &transcript, const vector<Commitment> &commits,
                        size_t pointSet, const vector<vector<Fr>> &evals,
                        const Proof &proof) const = 0;
};

} // namespace multiproof

#endif // MULTIPROOF_MULTIPROOF_HPP
