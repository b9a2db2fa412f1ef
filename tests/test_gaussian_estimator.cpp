// tests/test_gaussian_estimator.cpp
//
// Normal-fit p-values against weighted reference histories.

#include "GaussianEstimator.h"
#include "VigilExceptions.h"
#include "TestSupport.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using TestSupport::expect;
using TestSupport::expectNear;
using TestSupport::expectThrows;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

FeatureTable singleFeatureRow(const std::string& feature, double value) {
    FeatureTable t;
    t.addNumericColumn(feature, {value});
    return t;
}

FeatureTable singleFeatureReference(const std::string& feature, std::vector<double> values) {
    std::vector<int64_t> windows;
    for (size_t i = 0; i < values.size(); ++i) windows.push_back(static_cast<int64_t>(i + 1));
    FeatureTable t;
    t.addNumericColumn(feature, std::move(values));
    t.addIntegerColumn("time_window", std::move(windows));
    return t;
}

FeatureTable unitWeights(size_t windows) {
    std::vector<int64_t> tw;
    for (size_t i = 0; i < windows; ++i) tw.push_back(static_cast<int64_t>(i + 1));
    FeatureTable t;
    t.addIntegerColumn("time_window", std::move(tw));
    t.addNumericColumn("weight", std::vector<double>(windows, 1.0));
    return t;
}

double estimateOne(TailDirection direction, double observed, std::vector<double> reference) {
    const size_t m = reference.size();
    const GaussianEstimator estimator(direction);
    const std::vector<double> p = estimator.estimate(
        singleFeatureRow("f", observed), singleFeatureReference("f", std::move(reference)), unitWeights(m));
    return p.at(0);
}

int test_observed_at_mean() {
    std::cout << "[mean] observed equal to the reference mean gives 0.5\n";
    int failed = 0;

    expectNear(estimateOne(TailDirection::LEFT, 4.0, {2.0, 4.0, 6.0}), 0.5, 1e-12, "left tail at mean", failed);
    expectNear(estimateOne(TailDirection::RIGHT, 4.0, {2.0, 4.0, 6.0}), 0.5, 1e-12, "right tail at mean", failed);

    // Standardized distance uses the population sd sqrt(8/3).
    const double z = (6.0 - 4.0) / std::sqrt(8.0 / 3.0);
    const double expected = 0.5 * std::erfc(-z / std::sqrt(2.0));
    expectNear(estimateOne(TailDirection::LEFT, 6.0, {2.0, 4.0, 6.0}), expected, 1e-12, "left tail at +1.22 sd",
               failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_tail_relations() {
    std::cout << "[tails] right + left == 1 and two-tailed == 2 * min\n";
    int failed = 0;

    const std::vector<double> reference = {3.0, 7.5, 5.0, 9.0, 4.2};
    for (double observed : {0.0, 4.0, 5.74, 8.3, 15.0}) {
        const double right = estimateOne(TailDirection::RIGHT, observed, reference);
        const double left = estimateOne(TailDirection::LEFT, observed, reference);
        const double two = estimateOne(TailDirection::TWO, observed, reference);
        const std::string at = " at " + std::to_string(observed);
        expectNear(right + left, 1.0, 1e-12, "complementary tails" + at, failed);
        expectNear(two, 2.0 * std::min(right, left), 1e-12, "two-tailed" + at, failed);
        expect(right >= 0.0 && right <= 1.0 && left >= 0.0 && left <= 1.0, "tails in [0, 1]" + at, failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_feature_order_and_weights() {
    std::cout << "[features] one p-value per feature, joined on time_window\n";
    int failed = 0;

    FeatureTable features;
    features.addNumericColumn("latency", {12.0});
    features.addIntegerColumn("errors", {0});

    FeatureTable reference;
    reference.addIntegerColumn("errors", {2, 0, 4});
    reference.addIntegerColumn("time_window", {20, 10, 30});
    reference.addNumericColumn("latency", {10.0, 14.0, 12.0});

    // Listed out of order; the join pairs each weight with its window.
    FeatureTable weights;
    weights.addNumericColumn("weight", {3.0, 1.0, 0.0});
    weights.addIntegerColumn("time_window", {10, 20, 30});

    const GaussianEstimator estimator(TailDirection::RIGHT);
    const std::vector<double> p = estimator.estimate(features, reference, weights);
    expect(p.size() == 2, "two p-values", failed);

    // Window 10 (weight 3): latency 14, errors 0. Window 20 (weight 1): latency 10, errors 2.
    const double latencyMean = (3.0 * 14.0 + 1.0 * 10.0) / 4.0;
    const double latencySd = std::sqrt((3.0 * std::pow(14.0 - latencyMean, 2) + std::pow(10.0 - latencyMean, 2)) / 4.0);
    const double errorsMean = (3.0 * 0.0 + 1.0 * 2.0) / 4.0;
    const double errorsSd = std::sqrt((3.0 * std::pow(errorsMean, 2) + std::pow(2.0 - errorsMean, 2)) / 4.0);
    expectNear(p[0], 1.0 - GaussianEstimator::normalCdf(12.0, latencyMean, latencySd), 1e-12,
               "latency p-value first", failed);
    expectNear(p[1], 1.0 - GaussianEstimator::normalCdf(0.0, errorsMean, errorsSd), 1e-12,
               "errors p-value second", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_missing_reference_values() {
    std::cout << "[missing] NaN reference windows are ignored\n";
    int failed = 0;

    const double withGap = estimateOne(TailDirection::LEFT, 2.5, {1.0, kNaN, 3.0});
    const double compact = estimateOne(TailDirection::LEFT, 2.5, {1.0, 3.0});
    expectNear(withGap, compact, 1e-12, "gap equals compact history", failed);

    expect(std::isnan(estimateOne(TailDirection::LEFT, 2.5, {kNaN, kNaN})), "all-missing history gives NaN", failed);
    expect(std::isnan(estimateOne(TailDirection::RIGHT, kNaN, {1.0, 2.0})), "missing observation gives NaN", failed);

    FeatureTable weights = unitWeights(2);
    weights = weights.withoutColumn("weight");
    weights.addNumericColumn("weight", {0.0, 0.0});
    const GaussianEstimator estimator;
    const std::vector<double> p =
        estimator.estimate(singleFeatureRow("f", 1.0), singleFeatureReference("f", {1.0, 2.0}), weights);
    expect(std::isnan(p[0]), "zero total weight gives NaN", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_degenerate_reference() {
    std::cout << "[degenerate] constant history is a point mass\n";
    int failed = 0;

    expect(estimateOne(TailDirection::LEFT, 5.0, {5.0, 5.0, 5.0}) == 1.0, "left at the point", failed);
    expect(estimateOne(TailDirection::RIGHT, 5.0, {5.0, 5.0, 5.0}) == 0.0, "right at the point", failed);
    expect(estimateOne(TailDirection::LEFT, 4.0, {5.0, 5.0, 5.0}) == 0.0, "left below the point", failed);
    expect(estimateOne(TailDirection::RIGHT, 6.0, {5.0, 5.0, 5.0}) == 0.0, "right above the point", failed);
    expect(estimateOne(TailDirection::TWO, 5.0, {5.0, 5.0, 5.0}) == 0.0, "two-tailed at the point", failed);

    expect(std::isnan(GaussianEstimator::normalCdf(kNaN, 0.0, 1.0)), "NaN x", failed);
    expect(std::isnan(GaussianEstimator::normalCdf(0.0, 0.0, kNaN)), "NaN sd", failed);
    expectNear(GaussianEstimator::normalCdf(1.96, 0.0, 1.0), 0.9750021048517795, 1e-12, "standard normal 1.96",
               failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_directions() {
    std::cout << "[direction] defaults and parsing\n";
    int failed = 0;

    expect(GaussianEstimator().direction() == TailDirection::LEFT, "left-tailed by default", failed);
    expect(GaussianEstimator("two-tailed").direction() == TailDirection::TWO, "string constructor", failed);
    expect(makeEstimator("gaussian")->direction() == TailDirection::LEFT, "factory keeps default", failed);
    expect(makeEstimator("Gaussian", "right-tailed")->name() == "gaussian", "factory name is case-insensitive",
           failed);

    expectThrows<Vigil::ConfigurationException>([] { GaussianEstimator estimator("invalid"); }, "unknown direction", failed);
    expectThrows<Vigil::ConfigurationException>([] { makeEstimator("poisson"); }, "unknown estimator", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_vertex_name_column_is_ignored() {
    std::cout << "[name] a vertex name column does not count as a feature\n";
    int failed = 0;

    FeatureTable named;
    named.addCategoricalColumn("name", {"router-7"});
    named.addNumericColumn("f", {4.0});

    const GaussianEstimator estimator;
    const std::vector<double> p =
        estimator.estimate(named, singleFeatureReference("f", {2.0, 4.0, 6.0}), unitWeights(3));
    expect(p.size() == 1, "one p-value", failed);
    expectNear(p[0], 0.5, 1e-12, "same result as unnamed row", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}
} // namespace

int main() {
    int total = 0;
    total += test_observed_at_mean();
    total += test_tail_relations();
    total += test_feature_order_and_weights();
    total += test_missing_reference_values();
    total += test_degenerate_reference();
    total += test_directions();
    total += test_vertex_name_column_is_ignored();
    return TestSupport::finish("gaussian estimator", total);
}
