#include "../include/multiproof/method1.hpp"
#include "../include/multiproof/debug.hpp"
#include "../include/multiproof/lagrange.hpp"
#include "../include/multiproof/parallel.hpp"
#include "../include/multiproof/polynomial.hpp"
#include "../include/multiproof/protocol.hpp"
#include "../include/multiproof/shape.hpp"
#include <stdexcept>

using namespace std;

namespace multiproof {

Method1::Method1(shared_ptr<const SRS> srs, Config config)
    : srs_(std::move(srs)), config_(config) {
    initialize();
    if (!srs_ || srs_->g1Powers.empty() || srs_->g2Powers.empty()) {
        throw invalid_argument("Method1 needs an SRS with G1 and G2 powers");
    }
}

Commitment Method1::commit(const Polynomial &coeffs) const {
    return multiproof::commit(*srs_, coeffs);
}

vector<Commitment> Method1::commitAll(const vector<Polynomial> &polys) const {
    vector<Commitment> ret(polys.size());
    forkJoin(polys.size(), config_.threads, [&](size_t i) {
        ret[i] = commit(polys[i]);
    });
    return ret;
}

Proof Method1::open(Transcript &transcript, const vector<vector<Fr>> &evals,
                    const vector<Polynomial> &polys, const vector<Fr> &points) const {
    checkOpeningSizes(evals, polys, points);
    checkPoints(points);

    vector<Fr> gammas = openingChallenges(transcript, points, evals, polys.size());
    Polynomial aggregated = linearCombination(polys, gammas);
    vector<Fr> agg_evals = combineEvaluations(evals, gammas);

    Polynomial interpolant = lagrangeInterpolate(points, agg_evals);
    Polynomial vanishing = vanishingPolynomial(points);
    Polynomial quotient = quotientPolynomial(aggregated, interpolant, vanishing);

    Proof proof;
    proof.w = commit(quotient).c;
    transcribeProof(transcript, proof);

    if (config_.debug) {
        debugOpening(aggregated, interpolant, vanishing, quotient, points, agg_evals);
    }

    return proof;
}

bool Method1::verify(Transcript &transcript, const vector<Commitment> &commits,
                     const vector<Fr> &points, const vector<vector<Fr>> &evals,
                     const Proof &proof) const {
    checkVerifySizes(commits, points, evals);
    if (commits.empty()) throw Error::noPolynomialsGiven();
    checkPoints(points);

    vector<Fr> gammas = openingChallenges(transcript, points, evals, commits.size());
    G1 aggregated = msm(commitmentPoints(commits), gammas);
    vector<Fr> agg_evals = combineEvaluations(evals, gammas);

    G1 interpolant = msm(srs_->g1Powers, lagrangeInterpolate(points, agg_evals));
    G2 vanishing = msm(srs_->g2Powers, vanishingPolynomial(points));

    transcribeProof(transcript, proof);

    if (!proof.w.isValid()) return false;

    return pairingCheck(aggregated, interpolant, srs_->g2Generator(), proof, vanishing);
}

} // namespace multiproof
