#include "EmpiricalEstimator.h"
#include "VigilExceptions.h"
#include "WeightedStats.h"

#include <algorithm>
#include <cmath>
#include <limits>

EmpiricalEstimator::EmpiricalEstimator(TailDirection direction) : ProbabilityEstimator(direction) {}

EmpiricalEstimator::EmpiricalEstimator(const std::string& direction)
    : ProbabilityEstimator(parseTailDirection(direction)) {}

double EmpiricalEstimator::empirical(double value,
                                     const std::vector<double>& references,
                                     const std::vector<double>& weights,
                                     TailDirection direction) {
    if (direction == TailDirection::TWO) {
        throw Vigil::DirectionException("The given direction '" + tailDirectionName(direction) +
                                        "' for empirical calculation is not known.");
    }

    const WeightedSample sample = WeightedStats::dropMissing(references, weights);
    const double total = sample.totalWeight();
    if (total == 0.0 || std::isnan(value)) return std::numeric_limits<double>::quiet_NaN();

    double conditional = 0.0;
    for (size_t i = 0; i < sample.values.size(); ++i) {
        const bool extreme = direction == TailDirection::RIGHT ? sample.values[i] >= value
                                                               : sample.values[i] <= value;
        if (extreme) conditional += sample.weights[i];
    }
    return conditional / total;
}

double EmpiricalEstimator::pValue(double observed,
                                  const std::vector<double>& references,
                                  const std::vector<double>& weights) const {
    if (direction() != TailDirection::TWO) return empirical(observed, references, weights, direction());

    const double right = empirical(observed, references, weights, TailDirection::RIGHT);
    const double left = empirical(observed, references, weights, TailDirection::LEFT);
    if (std::isnan(right) || std::isnan(left)) return std::numeric_limits<double>::quiet_NaN();
    return 2.0 * std::min(right, left);
}
