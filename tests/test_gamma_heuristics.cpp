#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "gamma_heuristics.hpp"
#include "test_helpers.hpp"

using namespace rrf;
using namespace rrf::heuristics;

// ---- selector parsing ------------------------------------------------------

TEST(GammaSelector, ParsesKnownNames) {
    EXPECT_TRUE(std::holds_alternative<FixedScale>(parse_gamma("scale")));
    EXPECT_TRUE(std::holds_alternative<ClassMedian>(parse_gamma("avg_ann")));

    const GammaSelector nb = parse_gamma("avg_ann_50");
    ASSERT_TRUE(std::holds_alternative<NeighbourBased>(nb));
    EXPECT_EQ(std::get<NeighbourBased>(nb).k_max, 50u);
}

TEST(GammaSelector, UnknownNameIsConfigurationError) {
    EXPECT_THROW(parse_gamma("unknown_string"), ConfigurationError);
    EXPECT_THROW(parse_gamma(""), ConfigurationError);
    EXPECT_THROW(parse_gamma("Scale"), ConfigurationError);
}

TEST(GammaSelector, ExplicitValueMustBePositive) {
    const GammaSelector g = explicit_gamma(0.25);
    ASSERT_TRUE(std::holds_alternative<Explicit>(g));
    EXPECT_DOUBLE_EQ(std::get<Explicit>(g).value, 0.25);

    EXPECT_THROW(explicit_gamma(0.0), ConfigurationError);
    EXPECT_THROW(explicit_gamma(-1.0), ConfigurationError);
    EXPECT_THROW(explicit_gamma(std::nan("")), ConfigurationError);
    EXPECT_THROW(explicit_gamma(INFINITY), ConfigurationError);
}

TEST(GammaSelector, Names) {
    EXPECT_EQ(selector_name(FixedScale{}), "scale");
    EXPECT_EQ(selector_name(ClassMedian{}), "avg_ann");
    EXPECT_EQ(selector_name(NeighbourBased{}), "avg_ann_50");
    EXPECT_EQ(selector_name(Explicit{0.5}), "0.5");
}

// ---- fixed scale -----------------------------------------------------------

TEST(GammaScale, PooledVariance) {
    // entries 1..4: mean 2.5, pooled variance 1.25, d = 2
    const std::vector<double> X = {1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(gamma_scale(X.data(), 2, 2), 1.0 / (2.0 * 1.25), 1e-15);
}

TEST(GammaScale, NotPerFeatureVariance) {
    // Each column is constant, the pooled sample is not
    const std::vector<double> X = {0.0, 2.0, 0.0, 2.0, 0.0, 2.0};
    EXPECT_NEAR(gamma_scale(X.data(), 3, 2), 1.0 / (2.0 * 1.0), 1e-15);
}

TEST(GammaScale, Reproducible) {
    auto X = test_util::random_matrix(100, 4, 3);
    EXPECT_EQ(gamma_scale(X.data(), 100, 4), gamma_scale(X.data(), 100, 4));
}

TEST(GammaScale, ConstantDataIsConfigurationError) {
    const std::vector<double> X(12, 3.5);
    EXPECT_THROW(gamma_scale(X.data(), 4, 3), ConfigurationError);
}

// ---- nearest neighbour -----------------------------------------------------

TEST(NeighbourCount, SmallAndLargeSamples) {
    EXPECT_EQ(neighbour_count(30), 28u);
    EXPECT_EQ(neighbour_count(49), 47u);
    EXPECT_EQ(neighbour_count(50), 50u);
    EXPECT_EQ(neighbour_count(1000), 50u);
    EXPECT_EQ(neighbour_count(3), 1u);
    EXPECT_EQ(neighbour_count(10, 5), 5u);
}

TEST(NeighbourCount, FewerThanThreeSamples) {
    EXPECT_THROW(neighbour_count(2), PreconditionViolation);
    EXPECT_THROW(neighbour_count(0), PreconditionViolation);
}

TEST(GammaNearestNeighbour, HandComputed) {
    // Points 0, 1, 3: k = 1, neighbour distances 1, 1, 2, sigma = 4/3
    const std::vector<double> X = {0.0, 1.0, 3.0};
    const double sigma = 4.0 / 3.0;
    EXPECT_NEAR(gamma_nearest_neighbour(X.data(), 3, 1), 1.0 / (2.0 * sigma * sigma), 1e-12);
}

TEST(GammaNearestNeighbour, UsesFiftiethNeighbourOnLargeSets) {
    const std::size_t n = 120, d = 3;
    auto X = test_util::random_matrix(n, d, 5);
    EXPECT_EQ(gamma_nearest_neighbour(X.data(), n, d),
              gamma_nearest_neighbour(X.data(), n, d, 50));
    EXPECT_NE(gamma_nearest_neighbour(X.data(), n, d, 50),
              gamma_nearest_neighbour(X.data(), n, d, 20));
}

TEST(GammaNearestNeighbour, SmallSampleUsesNMinusTwo) {
    const std::size_t n = 30, d = 4;
    auto X = test_util::random_matrix(n, d, 9);
    // With k_max = 28, n >= k_max so the rank is exactly 28 as well
    EXPECT_DOUBLE_EQ(gamma_nearest_neighbour(X.data(), n, d, 50),
                     gamma_nearest_neighbour(X.data(), n, d, 28));
}

TEST(GammaNearestNeighbour, ExactlyRankSamplesIsPreconditionViolation) {
    // 50 samples would need 51 neighbours including the point itself
    auto X = test_util::random_matrix(50, 2, 4);
    EXPECT_THROW(gamma_nearest_neighbour(X.data(), 50, 2), PreconditionViolation);
}

TEST(GammaNearestNeighbour, InvariantUnderTranslation) {
    const std::size_t n = 60, d = 3;
    auto X = test_util::random_matrix(n, d, 16);
    for (double &x : X)
        x *= 1e-3;
    std::vector<double> shifted(X);
    for (double &x : shifted)
        x += 1e5;

    const double g = gamma_nearest_neighbour(X.data(), n, d);
    EXPECT_NEAR(gamma_nearest_neighbour(shifted.data(), n, d) / g, 1.0, 1e-6);
}

TEST(GammaNearestNeighbour, TooFewSamples) {
    const std::vector<double> X = {0.0, 1.0};
    EXPECT_THROW(gamma_nearest_neighbour(X.data(), 2, 1), PreconditionViolation);
}

TEST(GammaNearestNeighbour, AllPointsIdenticalIsConfigurationError) {
    const std::vector<double> X(20, 1.0);
    EXPECT_THROW(gamma_nearest_neighbour(X.data(), 10, 2), ConfigurationError);
}

// ---- class median ----------------------------------------------------------

TEST(GammaClassMedian, HandComputed) {
    // class 0: {0, 1}  min out-of-class distances 3, 2 -> median 2.5
    // class 1: {3, 7}  min out-of-class distances 2, 6 -> median 4
    const std::vector<double> X = {0.0, 3.0, 1.0, 7.0};
    const std::vector<int> Y = {0, 1, 0, 1};
    const double sigma = (2.5 + 4.0) / 2.0;
    EXPECT_NEAR(gamma_class_median(X.data(), Y.data(), 4, 1), 1.0 / (2.0 * sigma * sigma),
                1e-12);
}

TEST(GammaClassMedian, OddClassSizesTakeMiddleValue) {
    // class 0: {0, 1, 10}  min distances to {4}: 4, 3, 6 -> median 4
    // class 1: {4}         min distance 3 -> median 3
    const std::vector<double> X = {0.0, 1.0, 10.0, 4.0};
    const std::vector<int> Y = {0, 0, 0, 1};
    const double sigma = 3.5;
    EXPECT_NEAR(gamma_class_median(X.data(), Y.data(), 4, 1), 1.0 / (2.0 * sigma * sigma),
                1e-12);
}

TEST(GammaClassMedian, TwoBlobsFinitePositiveAndReproducible) {
    std::vector<int> Y;
    auto X = test_util::two_blobs(40, 3, Y, 21);
    const double g1 = gamma_class_median(X.data(), Y.data(), 80, 3);
    const double g2 = gamma_class_median(X.data(), Y.data(), 80, 3);
    EXPECT_TRUE(std::isfinite(g1));
    EXPECT_GT(g1, 0.0);
    EXPECT_EQ(g1, g2);
}

TEST(GammaClassMedian, InvariantUnderTranslation) {
    std::vector<int> Y;
    auto X = test_util::two_blobs(30, 2, Y, 17);
    for (double &x : X)
        x *= 1e-3;
    std::vector<double> shifted(X);
    for (double &x : shifted)
        x += 1e5;

    const double g = gamma_class_median(X.data(), Y.data(), 60, 2);
    EXPECT_NEAR(gamma_class_median(shifted.data(), Y.data(), 60, 2) / g, 1.0, 1e-6);
}

TEST(GammaClassMedian, SingleClassIsPreconditionViolation) {
    const std::vector<double> X = {0.0, 1.0, 2.0};
    const std::vector<int> Y = {0, 0, 0};
    EXPECT_THROW(gamma_class_median(X.data(), Y.data(), 3, 1), PreconditionViolation);
}

TEST(GammaClassMedian, LabelGapIsPreconditionViolation) {
    const std::vector<double> X = {0.0, 1.0, 2.0};
    const std::vector<int> Y = {0, 2, 2};
    EXPECT_THROW(gamma_class_median(X.data(), Y.data(), 3, 1), PreconditionViolation);
}

TEST(GammaClassMedian, HugeLabelIsPreconditionViolation) {
    // Rejected before anything is sized by the label value
    const std::vector<double> X = {0.0, 1.0, 2.0};
    const std::vector<int> Y = {0, 1, 2000000000};
    EXPECT_THROW(gamma_class_median(X.data(), Y.data(), 3, 1), PreconditionViolation);
}

TEST(GammaClassMedian, NegativeLabelIsPreconditionViolation) {
    const std::vector<double> X = {0.0, 1.0};
    const std::vector<int> Y = {-1, 0};
    EXPECT_THROW(gamma_class_median(X.data(), Y.data(), 2, 1), PreconditionViolation);
}

TEST(GammaClassMedian, MissingLabelsIsConfigurationError) {
    const std::vector<double> X = {0.0, 1.0};
    EXPECT_THROW(gamma_class_median(X.data(), nullptr, 2, 1), ConfigurationError);
}

// ---- dispatch --------------------------------------------------------------

TEST(EstimateGamma, DispatchesOnSelector) {
    auto X = test_util::random_matrix(60, 3, 8);
    EXPECT_EQ(estimate_gamma(FixedScale{}, X.data(), nullptr, 60, 3),
              gamma_scale(X.data(), 60, 3));
    EXPECT_EQ(estimate_gamma(NeighbourBased{}, X.data(), nullptr, 60, 3),
              gamma_nearest_neighbour(X.data(), 60, 3));
    EXPECT_EQ(estimate_gamma(Explicit{0.75}, X.data(), nullptr, 60, 3), 0.75);
}

TEST(EstimateGamma, ExplicitMustStillBePositive) {
    const std::vector<double> X = {0.0, 1.0, 2.0};
    EXPECT_THROW(estimate_gamma(Explicit{-2.0}, X.data(), nullptr, 3, 1), ConfigurationError);
}
