#ifndef MULTIPROOF_LAGRANGE_HPP
#define MULTIPROOF_LAGRANGE_HPP

#include "curve.hpp"

namespace multiproof {

/**
 * @brief Rejects empty point sets (NoPointsGiven) and repeated points
 * (DuplicatePoints with the index of the first repeat)
 */
void checkPoints(const vector<Fr> &points);

/**
 * @brief Coefficients of the Lagrange basis over an arbitrary point set
 * @return L with L[j](points[k]) = 1 if j == k else 0, each of length n
 *
 * L[j] = Z(X) / (X - x_j) / Z'(x_j), where Z is the vanishing polynomial
 * of the points.
 */
vector<Polynomial> lagrangeBasis(const vector<Fr> &points);

// Basis built from an already computed vanishing polynomial of the points
vector<Polynomial> lagrangeBasis(const vector<Fr> &points, const Polynomial &vanishing);

// Unique polynomial of degree < n through (points[j], values[j])
Polynomial lagrangeInterpolate(const vector<Fr> &points, const vector<Fr> &values);

} // namespace multiproof

#endif // MULTIPROOF_LAGRANGE_HPP
