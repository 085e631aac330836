#ifndef MULTIPROOF_METHOD1_HPP
#define MULTIPROOF_METHOD1_HPP

#include "config.hpp"
#include "multiproof.hpp"
#include <memory>

namespace multiproof {

/**
 * @brief Multi-proofs over any point set, no setup beyond the SRS
 *
 * The verifier rebuilds [Z(tau)]G2 and the interpolant on every call, so
 * verification cost grows with the number of points and the point set can
 * be at most srs.maxPoints() long.
 */
class Method1 : public Committer, public MultiProofNoPrecomp {
public:
    explicit Method1(std::shared_ptr<const SRS> srs, Config config = Config());

    Commitment commit(const Polynomial &coeffs) const override;
    vector<Commitment> commitAll(const vector<Polynomial> &polys) const override;

    Proof open(Transcript &transcript, const vector<vector<Fr>> &evals,
               const vector<Polynomial> &polys, const vector<Fr> &points) const override;

    bool verify(Transcript &transcript, const vector<Commitment> &commits,
                const vector<Fr> &points, const vector<vector<Fr>> &evals,
                const Proof &proof) const override;

    const SRS &srs() const { return *srs_; }
    const Config &config() const { return config_; }

private:
    std::shared_ptr<const SRS> srs_;
    Config config_;
};

} // namespace multiproof

#endif // MULTIPROOF_METHOD1_HPP
