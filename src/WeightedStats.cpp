#include "WeightedStats.h"

#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

double WeightedSample::totalWeight() const {
    return std::accumulate(weights.begin(), weights.end(), 0.0);
}

namespace WeightedStats {
WeightedSample dropMissing(const std::vector<double>& values, const std::vector<double>& weights) {
    if (values.size() != weights.size()) {
        throw std::invalid_argument("weighted sample has " + std::to_string(values.size()) + " values but " +
                                    std::to_string(weights.size()) + " weights");
    }
    WeightedSample sample;
    sample.values.reserve(values.size());
    sample.weights.reserve(weights.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) continue;
        sample.values.push_back(values[i]);
        sample.weights.push_back(weights[i]);
    }
    return sample;
}

WeightedMoments weightedMeanAndSd(const std::vector<double>& values, const std::vector<double>& weights) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    const WeightedSample sample = dropMissing(values, weights);
    const double total = sample.totalWeight();
    if (sample.values.empty() || total == 0.0) return {nan, nan};

    double weightedSum = 0.0;
    for (size_t i = 0; i < sample.values.size(); ++i) weightedSum += sample.values[i] * sample.weights[i];
    const double mean = weightedSum / total;

    double weightedSq = 0.0;
    for (size_t i = 0; i < sample.values.size(); ++i) {
        const double d = sample.values[i] - mean;
        weightedSq += sample.weights[i] * d * d;
    }
    const double variance = weightedSq / total;
    return {mean, std::sqrt(variance)};
}
}
