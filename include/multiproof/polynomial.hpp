#ifndef MULTIPROOF_POLYNOMIAL_HPP
#define MULTIPROOF_POLYNOMIAL_HPP

#include "curve.hpp"
#include <utility>

namespace multiproof {

// [1, e, e^2, ..., e^(n-1)]
vector<Fr> powers(const Fr &e, size_t n);

/**
 * @brief Monic polynomial Z(X) = prod (X - p_i)
 *
 * Built by multiplying in one linear factor at a time, O(n^2).
 * An empty point set gives the constant 1.
 */
Polynomial vanishingPolynomial(const vector<Fr> &points);

/**
 * @brief Long division of num by denom
 * @return (quotient, remainder), both with trailing zeros trimmed
 *
 * Throws DivisorIsZero if denom is the zero polynomial.
 */
std::pair<Polynomial, Polynomial> polyDivQR(const Polynomial &num, const Polynomial &denom);

/**
 * @brief sum_i challenges[i] * polys[i]
 *
 * Pairs polynomials with challenges up to the shorter of the two.
 * Throws NoPolynomialsGiven if there is nothing to combine.
 */
Polynomial linearCombination(const vector<Polynomial> &polys, const vector<Fr> &challenges);

Fr evaluatePoly(const Polynomial &q, const Fr &x);

// q / (X - i), dropping the remainder
Polynomial divideByLinear(const Polynomial &q, const Fr &i);

// q * (X - i)
Polynomial multiplyByLinear(const Polynomial &q, const Fr &i);

Polynomial addPolynomials(const Polynomial &a, const Polynomial &b);

Polynomial subPolynomials(const Polynomial &a, const Polynomial &b);

void trimPolynomial(Polynomial &p);

vector<Polynomial> randomPolynomials(size_t count, size_t degree);

vector<Fr> randomScalars(size_t count);

} // namespace multiproof

#endif // MULTIPROOF_POLYNOMIAL_HPP
