#include "../include/multiproof/polynomial.hpp"
#include "../include/multiproof/error.hpp"
#include <algorithm>

using namespace std;

namespace multiproof {

vector<Fr> powers(const Fr &e, size_t n) {
    vector<Fr> ret(n, 1);
    for (size_t i = 1; i < n; i++) {
        Fr::mul(ret[i], ret[i - 1], e);
    }
    return ret;
}

Polynomial vanishingPolynomial(const vector<Fr> &points) {
    Polynomial ret = {Fr(1)};
    for (const Fr &p : points) {
        ret = multiplyByLinear(ret, p);
    }
    return ret;
}

void trimPolynomial(Polynomial &p) {
    while (!p.empty() && p.back().isZero()) {
        p.pop_back();
    }
}

pair<Polynomial, Polynomial> polyDivQR(const Polynomial &num, const Polynomial &denom) {
    Polynomial d = denom;
    trimPolynomial(d);
    if (d.empty()) throw Error::divisorIsZero();

    Polynomial rem = num;
    trimPolynomial(rem);
    if (rem.size() < d.size()) {
        return make_pair(Polynomial(), rem);
    }

    Fr lead_inv;
    Fr::inv(lead_inv, d.back());

    size_t dd = d.size() - 1;
    Polynomial quotient(rem.size() - dd, 0);

    for (size_t i = quotient.size(); i-- > 0;) {
        Fr coeff = rem[i + dd] * lead_inv;
        quotient[i] = coeff;
        for (size_t j = 0; j <= dd; j++) {
            rem[i + j] -= coeff * d[j];
        }
    }

    rem.resize(dd);
    trimPolynomial(rem);
    trimPolynomial(quotient);
    return make_pair(quotient, rem);
}

Polynomial linearCombination(const vector<Polynomial> &polys, const vector<Fr> &challenges) {
    size_t n = min(polys.size(), challenges.size());
    if (n == 0) throw Error::noPolynomialsGiven();

    size_t len = 0;
    for (size_t i = 0; i < n; i++) len = max(len, polys[i].size());

    Polynomial ret(len, 0);
    for (size_t i = 0; i < n; i++) {
        const Fr &c = challenges[i];
        for (size_t j = 0; j < polys[i].size(); j++) {
            ret[j] += polys[i][j] * c;
        }
    }
    return ret;
}

// Horner
Fr evaluatePoly(const Polynomial &q, const Fr &x) {
    Fr ret = 0;
    for (size_t j = q.size(); j-- > 0;) {
        ret = ret * x + q[j];
    }
    return ret;
}

Polynomial divideByLinear(const Polynomial &q, const Fr &i) {
    if (q.size() < 2) return Polynomial();

    size_t n = q.size();
    Polynomial result(n - 1);
    Fr carry = 0;

    for (size_t j = n; j-- > 0;) {
        carry = carry * i + q[j];
        if (j > 0)
            result[j - 1] = carry;
    }

    return result;
}

Polynomial multiplyByLinear(const Polynomial &q, const Fr &i) {
    Polynomial ret(q.size() + 1, 0);
    for (size_t j = 0; j < q.size(); j++) {
        ret[j + 1] += q[j];
        ret[j] -= q[j] * i;
    }
    return ret;
}

Polynomial addPolynomials(const Polynomial &a, const Polynomial &b) {
    Polynomial ret(max(a.size(), b.size()), 0);

    for (size_t i = 0; i < a.size(); i++) ret[i] += a[i];
    for (size_t i = 0; i < b.size(); i++) ret[i] += b[i];

    return ret;
}

Polynomial subPolynomials(const Polynomial &a, const Polynomial &b) {
    Polynomial ret(max(a.size(), b.size()), 0);

    for (size_t i = 0; i < a.size(); i++) ret[i] += a[i];
    for (size_t i = 0; i < b.size(); i++) ret[i] -= b[i];

    return ret;
}

vector<Polynomial> randomPolynomials(size_t count, size_t degree) {
    vector<Polynomial> ret(count);
    for (auto &p : ret) {
        p = randomScalars(degree + 1);
    }
    return ret;
}

vector<Fr> randomScalars(size_t count) {
    vector<Fr> ret(count);

    for (size_t i = 0; i < count; i++) {
        ret[i].setByCSPRNG();
    }

    return ret;
}

} // namespace multiproof
