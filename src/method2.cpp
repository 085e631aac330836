#include "../include/multiproof/method2.hpp"
#include "../include/multiproof/debug.hpp"
#include "../include/multiproof/lagrange.hpp"
#include "../include/multiproof/parallel.hpp"
#include "../include/multiproof/polynomial.hpp"
#include "../include/multiproof/protocol.hpp"
#include "../include/multiproof/shape.hpp"
#include <iostream>
#include <stdexcept>

using namespace std;

namespace multiproof {

Method2::Method2(shared_ptr<const SRS> srs, const vector<vector<Fr>> &pointSets, Config config)
    : srs_(std::move(srs)), config_(config) {
    initialize();
    if (!srs_ || srs_->g1Powers.empty() || srs_->g2Powers.empty()) {
        throw invalid_argument("Method2 needs an SRS with G1 and G2 powers");
    }

    domains_.resize(pointSets.size());
    forkJoin(pointSets.size(), config_.threads, [&](size_t i) {
        domains_[i] = precompute(pointSets[i]);
    });

    if (config_.debug) {
        for (size_t i = 0; i < domains_.size(); i++) {
            cout << "Checking point set " << i << "...\n";
            debugDomain(domains_[i]);
        }
    }
}

PrecomputedDomain Method2::precompute(const vector<Fr> &points) const {
    checkPoints(points);

    PrecomputedDomain ret;
    ret.points = points;
    ret.vanishing = vanishingPolynomial(points);
    ret.vanishingCommitment = msm(srs_->g2Powers, ret.vanishing);
    ret.vanishingCommitment.normalize();

    ret.lagrange = lagrangeBasis(points, ret.vanishing);
    ret.lagrangeCommitments.resize(points.size());
    for (size_t j = 0; j < points.size(); j++) {
        ret.lagrangeCommitments[j] = multiproof::commit(*srs_, ret.lagrange[j]).c;
    }
    return ret;
}

const PrecomputedDomain &Method2::domain(size_t index) const {
    if (index >= domains_.size()) throw Error::unknownPointSet(index, domains_.size());
    return domains_[index];
}

bool Method2::findDomain(const vector<Fr> &points, size_t &index) const {
    for (size_t i = 0; i < domains_.size(); i++) {
        if (domains_[i].points == points) {
            index = i;
            return true;
        }
    }
    return false;
}

Commitment Method2::commit(const Polynomial &coeffs) const {
    return multiproof::commit(*srs_, coeffs);
}

vector<Commitment> Method2::commitAll(const vector<Polynomial> &polys) const {
    vector<Commitment> ret(polys.size());
    forkJoin(polys.size(), config_.threads, [&](size_t i) {
        ret[i] = commit(polys[i]);
    });
    return ret;
}

Proof Method2::open(Transcript &transcript, const vector<vector<Fr>> &evals,
                    const vector<Polynomial> &polys, size_t pointSet) const {
    const PrecomputedDomain &d = domain(pointSet);
    checkOpeningSizes(evals, polys, d.points);

    vector<Fr> gammas = openingChallenges(transcript, d.points, evals, polys.size());
    Polynomial aggregated = linearCombination(polys, gammas);
    vector<Fr> agg_evals = combineEvaluations(evals, gammas);

    Polynomial interpolant = linearCombination(d.lagrange, agg_evals);
    Polynomial quotient = quotientPolynomial(aggregated, interpolant, d.vanishing);

    Proof proof;
    proof.w = commit(quotient).c;
    transcribeProof(transcript, proof);

    if (config_.debug) {
        debugOpening(aggregated, interpolant, d.vanishing, quotient, d.points, agg_evals);
    }

    return proof;
}

bool Method2::verify(Transcript &transcript, const vector<Commitment> &commits,
                     size_t pointSet, const vector<vector<Fr>> &evals,
                     const Proof &proof) const {
    const PrecomputedDomain &d = domain(pointSet);
    checkVerifySizes(commits, d.points, evals);
    if (commits.empty()) throw Error::noPolynomialsGiven();

    vector<Fr> gammas = openingChallenges(transcript, d.points, evals, commits.size());
    G1 aggregated = msm(commitmentPoints(commits), gammas);
    vector<Fr> agg_evals = combineEvaluations(evals, gammas);

    G1 interpolant = msm(d.lagrangeCommitments, agg_evals);

    transcribeProof(transcript, proof);

    if (!proof.w.isValid()) return false;

    return pairingCheck(aggregated, interpolant, srs_->g2Generator(), proof, d.vanishingCommitment);
}

} // namespace multiproof
