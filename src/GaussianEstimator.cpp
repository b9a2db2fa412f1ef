#include "GaussianEstimator.h"
#include "WeightedStats.h"

#include <algorithm>
#include <cmath>
#include <limits>

GaussianEstimator::GaussianEstimator(TailDirection direction) : ProbabilityEstimator(direction) {}

GaussianEstimator::GaussianEstimator(const std::string& direction)
    : ProbabilityEstimator(parseTailDirection(direction)) {}

double GaussianEstimator::normalCdf(double x, double mean, double sd) {
    if (std::isnan(x) || std::isnan(mean) || std::isnan(sd)) return std::numeric_limits<double>::quiet_NaN();
    if (sd == 0.0) return x >= mean ? 1.0 : 0.0;
    return 0.5 * std::erfc(-(x - mean) / (sd * std::sqrt(2.0)));
}

double GaussianEstimator::pValue(double observed,
                                 const std::vector<double>& references,
                                 const std::vector<double>& weights) const {
    const WeightedMoments fit = WeightedStats::weightedMeanAndSd(references, weights);
    const double cdf = normalCdf(observed, fit.mean, fit.stddev);
    if (std::isnan(cdf)) return cdf;

    switch (direction()) {
        case TailDirection::RIGHT: return 1.0 - cdf;
        case TailDirection::LEFT: return cdf;
        case TailDirection::TWO: return 2.0 * std::min(1.0 - cdf, cdf);
    }
    return std::numeric_limits<double>::quiet_NaN();
}
