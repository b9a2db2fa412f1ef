#pragma once

#include <vector>

struct WeightedMoments {
    double mean;
    double stddev;
};

// Values paired with their weights after missing positions have been dropped.
struct WeightedSample {
    std::vector<double> values;
    std::vector<double> weights;
    double totalWeight() const;
};

namespace WeightedStats {
/**
 * @brief Drops every NaN value together with its weight.
 * @throws std::invalid_argument when values and weights differ in length.
 */
WeightedSample dropMissing(const std::vector<double>& values, const std::vector<double>& weights);

/**
 * @brief Weighted mean and population standard deviation over non-missing values.
 * @post Both fields are NaN when no value is retained or the retained weight is zero.
 * @throws std::invalid_argument when values and weights differ in length.
 */
WeightedMoments weightedMeanAndSd(const std::vector<double>& values, const std::vector<double>& weights);
}
