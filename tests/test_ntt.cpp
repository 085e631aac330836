#include <gtest/gtest.h>
#include "testing.hpp"
#include "multiproof/ntt.hpp"

using namespace std;
using namespace multiproof;
using namespace multiproof::testkit;

TEST(NTTTest, RootOfUnityHasExactOrder) {
    for (size_t n : {2u, 8u, 1024u}) {
        Fr w = getRootOfUnity(n);
        Fr wn, half;
        Fr::pow(wn, w, n);
        Fr::pow(half, w, n / 2);
        EXPECT_EQ(Fr(1), wn) << n;
        EXPECT_EQ(Fr(-1), half) << n;
    }
}

TEST(NTTTest, ForwardInverseRoundtrip) {
    vector<Fr> input = randomScalars(16);
    vector<Fr> data = input;
    Fr omega = getRootOfUnity(16);

    ntt_transform(data, omega);
    EXPECT_NE(input, data);
    ntt_inverse(data, omega);
    EXPECT_EQ(input, data);
}

TEST(NTTTest, ForwardIsEvaluation) {
    Polynomial p = randomScalars(8);
    vector<Fr> data = p;
    Fr omega = getRootOfUnity(8);
    ntt_transform(data, omega);

    Fr x = 1;
    for (size_t i = 0; i < 8; i++) {
        EXPECT_EQ(evaluatePoly(p, x), data[i]) << "at omega^" << i;
        x *= omega;
    }
}

TEST(NTTTest, GroupTransformMatchesScalarTransform) {
    vector<Fr> scalars = randomScalars(8);
    G1 g;
    mcl::bn::mapToG1(g, 1);

    vector<G1> points(8);
    for (size_t i = 0; i < 8; i++) G1::mul(points[i], g, scalars[i]);

    Fr omega = getRootOfUnity(8);
    ntt_transform(scalars, omega);
    ntt_transform(points, omega);

    for (size_t i = 0; i < 8; i++) {
        G1 expected;
        G1::mul(expected, g, scalars[i]);
        EXPECT_EQ(expected, points[i]) << i;
    }
}

TEST(EvaluationDomainTest, RoundsUpToPowerOfTwo) {
    EXPECT_EQ(1u, EvaluationDomain::create(1).size());
    EXPECT_EQ(8u, EvaluationDomain::create(5).size());
    EXPECT_EQ(64u, EvaluationDomain::create(64).size());

    EvaluationDomain d = EvaluationDomain::create(4);
    vector<Fr> elems = d.elements();
    ASSERT_EQ(4u, elems.size());
    EXPECT_EQ(Fr(1), elems[0]);
    EXPECT_EQ(d.groupGen(), elems[1]);
    EXPECT_EQ(d.element(3), elems[3]);
    EXPECT_EQ(d.element(0), d.element(4));
}

TEST(EvaluationDomainTest, RejectsUnsupportedSizes) {
    expectError([] { EvaluationDomain::create(0); }, ErrorKind::DomainConstructionFailed, {0});

    size_t too_big = (size_t(1) << TWO_ADICITY) + 1;
    expectError([&] { EvaluationDomain::create(too_big); },
                ErrorKind::DomainConstructionFailed, {too_big});
}

TEST(EvaluationDomainTest, PadsShortInput) {
    EvaluationDomain d = EvaluationDomain::create(4);
    vector<Fr> data = {Fr(3), Fr(5)};
    d.fft(data);
    ASSERT_EQ(4u, data.size());
    // 3 + 5X at X = 1
    EXPECT_EQ(Fr(8), data[0]);

    d.ifft(data);
    EXPECT_EQ(Fr(3), data[0]);
    EXPECT_EQ(Fr(5), data[1]);
    EXPECT_TRUE(data[2].isZero());
    EXPECT_TRUE(data[3].isZero());
}
