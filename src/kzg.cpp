#include "../include/multiproof/kzg.hpp"
#include "../include/multiproof/ntt.hpp"
#include "../include/multiproof/polynomial.hpp"
#include <mcl/bn.hpp>

using namespace std;
using namespace mcl;
using namespace mcl::bn;

namespace multiproof {

SRS SRS::fromSecret(const G1 &g1, const G2 &g2, const vector<Fr> &powers, size_t g2Count) {
    if (g2Count > powers.size()) throw Error::tooManyScalars(g2Count, powers.size());

    SRS srs;
    srs.g1Powers = curvePowers(powers, g1);
    srs.g2Powers = curvePowers(vector<Fr>(powers.begin(), powers.begin() + g2Count), g2);
    return srs;
}

SRS SRS::fromSecret(const Fr &tau, size_t g1Count, size_t g2Count) {
    initialize();

    G1 one;
    mapToG1(one, 1);

    G2 two;
    mapToG2(two, 1);

    return fromSecret(one, two, powers(tau, g1Count), g2Count);
}

Commitment commit(const SRS &srs, const Polynomial &coeffs) {
    Commitment comm;
    comm.c = msm(srs.g1Powers, coeffs);
    comm.c.normalize();
    return comm;
}

vector<G1> commitmentPoints(const vector<Commitment> &commits) {
    vector<G1> ret(commits.size());
    for (size_t i = 0; i < commits.size(); i++) ret[i] = commits[i].c;
    return ret;
}

vector<Commitment> Commitment::extendCommitments(const vector<Commitment> &commits, size_t outputSize) {
    vector<G1> vals = commitmentPoints(commits);

    EvaluationDomain domain = EvaluationDomain::create(vals.size());
    EvaluationDomain domain_ext = EvaluationDomain::create(outputSize);

    domain.ifft(vals);
    domain_ext.fft(vals);

    vector<Commitment> ret(vals.size());
    for (size_t i = 0; i < vals.size(); i++) {
        vals[i].normalize();
        ret[i].c = vals[i];
    }
    return ret;
}

} // namespace multiproof
