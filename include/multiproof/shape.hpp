#ifndef MULTIPROOF_SHAPE_HPP
#define MULTIPROOF_SHAPE_HPP

#include "curve.hpp"
#include "kzg.hpp"

namespace multiproof {

// Row count must match polys, every row must have one entry per point
void checkOpeningSizes(const vector<vector<Fr>> &evals, const vector<Polynomial> &polys,
                       const vector<Fr> &points);

// Row count must match commits, every row must have one entry per point
void checkVerifySizes(const vector<Commitment> &commits, const vector<Fr> &points,
                      const vector<vector<Fr>> &evals);

} // namespace multiproof

#endif // MULTIPROOF_SHAPE_HPP
