#pragma once

#include "ProbabilityEstimator.h"

#include <string>
#include <vector>

/**
 * Parametric estimator: each feature's reference values are fit with a Normal
 * distribution using the weighted mean and weighted population standard deviation.
 */
class GaussianEstimator : public ProbabilityEstimator {
public:
    explicit GaussianEstimator(TailDirection direction = TailDirection::LEFT);
    // @throws Vigil::ConfigurationException on unknown direction.
    explicit GaussianEstimator(const std::string& direction);

    std::string name() const override { return "gaussian"; }

    /**
     * @brief Normal CDF at x.
     * @post sd == 0 is treated as a point mass at mean (1 for x >= mean, else 0).
     * @post NaN when x, mean or sd is NaN.
     */
    static double normalCdf(double x, double mean, double sd);

protected:
    double pValue(double observed,
                  const std::vector<double>& references,
                  const std::vector<double>& weights) const override;
};
