#include "../include/multiproof/shape.hpp"
#include "../include/multiproof/error.hpp"

using namespace std;

namespace multiproof {

static void checkRowLengths(const vector<vector<Fr>> &evals, const vector<Fr> &points) {
    for (const auto &e : evals) {
        if (e.size() != points.size()) {
            throw Error::evalsAndPointsDifferentSizes(e.size(), points.size());
        }
    }
}

void checkOpeningSizes(const vector<vector<Fr>> &evals, const vector<Polynomial> &polys,
                       const vector<Fr> &points) {
    if (evals.size() != polys.size()) {
        throw Error::evalsAndPolysDifferentSizes(evals.size(), polys.size());
    }
    checkRowLengths(evals, points);
}

void checkVerifySizes(const vector<Commitment> &commits, const vector<Fr> &points,
                      const vector<vector<Fr>> &evals) {
    if (evals.size() != commits.size()) {
        throw Error::evalsAndCommitsDifferentSizes(evals.size(), commits.size());
    }
    checkRowLengths(evals, points);
}

} // namespace multiproof
