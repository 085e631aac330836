#include <gtest/gtest.h>
#include "testing.hpp"
#include "multiproof/method1.hpp"

using namespace std;
using namespace multiproof;
using namespace multiproof::testkit;

namespace {

struct Opening {
    vector<Fr> points;
    vector<Polynomial> polys;
    vector<vector<Fr>> evals;
    vector<Commitment> commits;
    Proof proof;
};

Opening makeOpening(const Method1 &s, size_t nPolys, size_t degree, size_t nPoints) {
    Opening o;
    o.points = randomScalars(nPoints);
    o.polys = randomPolynomials(nPolys, degree);
    o.evals = evaluateAll(o.polys, o.points);
    o.commits = s.commitAll(o.polys);

    Transcript t("testing");
    o.proof = s.open(t, o.evals, o.polys, o.points);
    return o;
}

bool verifyOpening(const Method1 &s, const Opening &o, const string &label = "testing") {
    Transcript t(label);
    return s.verify(t, o.commits, o.points, o.evals, o.proof);
}

} // namespace

TEST(Method1Test, Basic) {
    Method1 s(testSrs());
    testBasicNoPrecomp(s);
}

TEST(Method1Test, SizeErrors) {
    Method1 s(testSrs());
    testSizeErrors(s);
}

TEST(Method1Test, OneShortRowIsRejected) {
    Method1 s(testSrs());
    vector<Fr> points = randomScalars(30);
    vector<Polynomial> polys = randomPolynomials(20, 50);
    vector<vector<Fr>> evals = evaluateAll(polys, points);
    vector<Commitment> commits = s.commitAll(polys);

    Transcript prover("testing");
    Proof proof = s.open(prover, evals, polys, points);

    vector<vector<Fr>> ragged = evals;
    ragged[0].resize(19);

    expectError([&] {
        Transcript t("testing");
        s.open(t, ragged, polys, points);
    }, ErrorKind::EvalsAndPointsDifferentSizes, {19, 30});

    expectError([&] {
        Transcript t("testing");
        s.verify(t, commits, points, ragged, proof);
    }, ErrorKind::EvalsAndPointsDifferentSizes, {19, 30});
}

TEST(Method1Test, SinglePolynomialSinglePoint) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 1, 5, 1);
    EXPECT_TRUE(verifyOpening(s, o));
}

TEST(Method1Test, DegreeBelowPointCount) {
    // interpolant is the polynomial itself, quotient is zero
    Method1 s(testSrs());
    Opening o = makeOpening(s, 3, 2, 10);
    EXPECT_TRUE(verifyOpening(s, o));
}

TEST(Method1Test, WrongEvaluationFails) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 4, 12, 6);

    for (size_t i : {0u, 3u}) {
        for (size_t j : {0u, 5u}) {
            Opening bad = o;
            bad.evals[i][j] += Fr(1);
            EXPECT_FALSE(verifyOpening(s, bad)) << i << "," << j;
        }
    }
}

TEST(Method1Test, WrongPointFails) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 4, 12, 6);
    o.points[2] += Fr(1);
    EXPECT_FALSE(verifyOpening(s, o));
}

TEST(Method1Test, WrongCommitmentFails) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 4, 12, 6);
    o.commits[1] = o.commits[2];
    EXPECT_FALSE(verifyOpening(s, o));
}

TEST(Method1Test, WrongProofFails) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 4, 12, 6);

    Opening bad = o;
    G1::add(bad.proof.w, bad.proof.w, testSrs()->g1Generator());
    EXPECT_FALSE(verifyOpening(s, bad));

    bad.proof.w.clear();
    EXPECT_FALSE(verifyOpening(s, bad));
}

TEST(Method1Test, TranscriptLabelMatters) {
    Method1 s(testSrs());
    Opening o = makeOpening(s, 4, 12, 6);
    EXPECT_TRUE(verifyOpening(s, o));
    EXPECT_FALSE(verifyOpening(s, o, "other"));
}

TEST(Method1Test, TranscriptsStayInSync) {
    Method1 s(testSrs());
    vector<Fr> points = randomScalars(5);
    vector<Polynomial> polys = randomPolynomials(3, 9);
    vector<vector<Fr>> evals = evaluateAll(polys, points);
    vector<Commitment> commits = s.commitAll(polys);

    Transcript prover("testing");
    transcribeCommitments(prover, "commits", commits);
    Proof proof = s.open(prover, evals, polys, points);

    Transcript verifier("testing");
    transcribeCommitments(verifier, "commits", commits);
    EXPECT_TRUE(s.verify(verifier, commits, points, evals, proof));

    EXPECT_EQ(getChallenge(prover, "next", 32), getChallenge(verifier, "next", 32));
}

TEST(Method1Test, CallerBoundCommitmentsMustMatch) {
    Method1 s(testSrs());
    vector<Fr> points = randomScalars(5);
    vector<Polynomial> polys = randomPolynomials(3, 9);
    vector<vector<Fr>> evals = evaluateAll(polys, points);
    vector<Commitment> commits = s.commitAll(polys);

    Transcript prover("testing");
    transcribeCommitments(prover, "commits", commits);
    Proof proof = s.open(prover, evals, polys, points);

    Transcript verifier("testing");
    EXPECT_FALSE(s.verify(verifier, commits, points, evals, proof));
}

TEST(Method1Test, BadPointSets) {
    Method1 s(testSrs());
    vector<Polynomial> polys = randomPolynomials(2, 4);

    expectError([&] {
        Transcript t("testing");
        s.open(t, {{}, {}}, polys, {});
    }, ErrorKind::NoPointsGiven, {});

    vector<Fr> points = {Fr(1), Fr(2), Fr(1)};
    vector<vector<Fr>> evals = evaluateAll(polys, points);
    expectError([&] {
        Transcript t("testing");
        s.open(t, evals, polys, points);
    }, ErrorKind::DuplicatePoints, {2});

    vector<Commitment> commits = s.commitAll(polys);
    Proof proof;
    proof.w = testSrs()->g1Generator();
    expectError([&] {
        Transcript t("testing");
        s.verify(t, commits, points, evals, proof);
    }, ErrorKind::DuplicatePoints, {2});
}

TEST(Method1Test, NoPolynomials) {
    Method1 s(testSrs());
    vector<Fr> points = randomScalars(3);
    Proof proof;
    proof.w = testSrs()->g1Generator();

    expectError([&] {
        Transcript t("testing");
        s.open(t, {}, {}, points);
    }, ErrorKind::NoPolynomialsGiven, {});

    expectError([&] {
        Transcript t("testing");
        s.verify(t, {}, points, {}, proof);
    }, ErrorKind::NoPolynomialsGiven, {});
}

TEST(Method1Test, DegreeTooHigh) {
    Method1 s(testSrs());
    expectError([&] { s.commit(randomScalars(65)); }, ErrorKind::TooManyScalars, {65, 64});
}

TEST(Method1Test, ParallelCommitMatchesSequential) {
    Config config;
    config.threads = 4;
    Method1 parallel(testSrs(), config);
    Method1 sequential(testSrs());

    vector<Polynomial> polys = randomPolynomials(11, 20);
    EXPECT_EQ(sequential.commitAll(polys), parallel.commitAll(polys));

    polys[7] = randomScalars(70);
    expectError([&] { parallel.commitAll(polys); }, ErrorKind::TooManyScalars, {70, 64});
}

TEST(Method1Test, DebugChecksPass) {
    Config config;
    config.debug = true;
    Method1 s(testSrs(), config);
    Opening o = makeOpening(s, 3, 10, 4);
    EXPECT_TRUE(verifyOpening(s, o));
}

TEST(Method1Test, RejectsMissingSrs) {
    EXPECT_THROW(Method1(nullptr), std::invalid_argument);
    EXPECT_THROW(Method1(std::make_shared<const SRS>()), std::invalid_argument);
}
