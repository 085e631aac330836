#include "../include/multiproof/ntt.hpp"
#include "../include/multiproof/error.hpp"
#include <mcl/bn.hpp>
#include <vector>

using namespace std;
using namespace mcl;
using namespace mcl::bn;

namespace multiproof {

// BN_SNARK1 scalar field order
static const char *FR_MODULUS =
    "21888242871839275222246405745257275088548364400416034343698204186575808495617";

size_t bitReverse(size_t x, size_t logN) {
    size_t res = 0;
    for (size_t i = 0; i < logN; ++i) {
        res <<= 1;
        res |= (x >> i) & 1;
    }
    return res;
}

Fr getRootOfUnity(size_t n) {
    mpz_class r(FR_MODULUS);
    mpz_class exp = (r - 1) / mpz_class((int)n);

    Fr omega;
    Fr::pow(omega, Fr(GENERATOR), exp);
    return omega;
}

EvaluationDomain EvaluationDomain::create(size_t n) {
    if (n == 0) throw Error::domainConstructionFailed(n);

    size_t logN = 0;
    while ((size_t(1) << logN) < n) {
        logN++;
        if (logN > TWO_ADICITY) throw Error::domainConstructionFailed(n);
    }

    size_t size = size_t(1) << logN;
    return EvaluationDomain(size, getRootOfUnity(size));
}

Fr EvaluationDomain::element(size_t i) const {
    Fr ret;
    Fr::pow(ret, omega_, i % size_);
    return ret;
}

vector<Fr> EvaluationDomain::elements() const {
    vector<Fr> ret(size_);
    Fr curr = 1;
    for (size_t i = 0; i < size_; i++) {
        ret[i] = curr;
        curr *= omega_;
    }
    return ret;
}

} // namespace multiproof
