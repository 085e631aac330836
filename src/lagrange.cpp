#include "../include/multiproof/lagrange.hpp"
#include "../include/multiproof/error.hpp"
#include "../include/multiproof/polynomial.hpp"
#include "../include/multiproof/serialize.hpp"
#include <set>

using namespace std;

namespace multiproof {

void checkPoints(const vector<Fr> &points) {
    if (points.empty()) throw Error::noPointsGiven();

    set<vector<uint8_t>> seen;
    for (size_t i = 0; i < points.size(); i++) {
        if (!seen.insert(toBytes(points[i])).second) throw Error::duplicatePoints(i);
    }
}

vector<Polynomial> lagrangeBasis(const vector<Fr> &points) {
    return lagrangeBasis(points, vanishingPolynomial(points));
}

vector<Polynomial> lagrangeBasis(const vector<Fr> &points, const Polynomial &vanishing) {
    checkPoints(points);

    size_t n = points.size();
    vector<Polynomial> basis(n);
    for (size_t j = 0; j < n; j++) {
        // Z / (X - x_j) is exact since x_j is a root of Z
        Polynomial numerator = divideByLinear(vanishing, points[j]);

        Fr denom = evaluatePoly(numerator, points[j]);
        Fr denom_inv;
        Fr::inv(denom_inv, denom);

        for (Fr &c : numerator) c *= denom_inv;
        basis[j] = numerator;
    }
    return basis;
}

Polynomial lagrangeInterpolate(const vector<Fr> &points, const vector<Fr> &values) {
    if (points.size() != values.size()) {
        throw Error::evalsAndPointsDifferentSizes(values.size(), points.size());
    }

    vector<Polynomial> basis = lagrangeBasis(points);
    return linearCombination(basis, values);
}

} // namespace multiproof
