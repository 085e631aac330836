#include <gtest/gtest.h>
#include "testing.hpp"
#include "multiproof/shape.hpp"

using namespace std;
using namespace multiproof;
using namespace multiproof::testkit;

namespace {

vector<vector<Fr>> grid(size_t rows, size_t cols) {
    return vector<vector<Fr>>(rows, vector<Fr>(cols, 1));
}

} // namespace

TEST(ShapeTest, AcceptsConsistentShapes) {
    vector<Fr> points = randomScalars(3);
    checkOpeningSizes(grid(2, 3), randomPolynomials(2, 4), points);
    checkVerifySizes(vector<Commitment>(2), points, grid(2, 3));

    // nothing to open is still well formed
    checkOpeningSizes({}, {}, points);
    checkVerifySizes({}, points, {});
}

TEST(ShapeTest, OpeningRowCount) {
    expectError([] { checkOpeningSizes(grid(3, 2), randomPolynomials(4, 1), randomScalars(2)); },
                ErrorKind::EvalsAndPolysDifferentSizes, {3, 4});
}

TEST(ShapeTest, VerifyRowCount) {
    expectError([] { checkVerifySizes(vector<Commitment>(4), randomScalars(2), grid(5, 2)); },
                ErrorKind::EvalsAndCommitsDifferentSizes, {5, 4});
}

TEST(ShapeTest, RowLengthMustMatchPoints) {
    vector<vector<Fr>> evals = grid(3, 4);
    evals[1].pop_back();

    expectError([&] { checkOpeningSizes(evals, randomPolynomials(3, 1), randomScalars(4)); },
                ErrorKind::EvalsAndPointsDifferentSizes, {3, 4});
    expectError([&] { checkVerifySizes(vector<Commitment>(3), randomScalars(4), evals); },
                ErrorKind::EvalsAndPointsDifferentSizes, {3, 4});
}

TEST(ShapeTest, RowCountIsCheckedFirst) {
    vector<vector<Fr>> evals = grid(2, 1);
    expectError([&] { checkOpeningSizes(evals, randomPolynomials(3, 1), randomScalars(4)); },
                ErrorKind::EvalsAndPolysDifferentSizes, {2, 3});
}
