#pragma once

#include "ProbabilityEstimator.h"

#include <string>
#include <vector>

/**
 * Non-parametric estimator: the p-value is the weighted share of reference
 * observations at least as extreme as the observed value.
 */
class EmpiricalEstimator : public ProbabilityEstimator {
public:
    explicit EmpiricalEstimator(TailDirection direction = TailDirection::RIGHT);
    // @throws Vigil::ConfigurationException on unknown direction.
    explicit EmpiricalEstimator(const std::string& direction);

    std::string name() const override { return "empirical"; }

    /**
     * @brief Single-direction empirical p-value; NaN references are skipped with their weights.
     * @post NaN when the retained weight is zero or value is NaN.
     * @throws Vigil::DirectionException for TailDirection::TWO.
     * @throws std::invalid_argument when references and weights differ in length.
     */
    static double empirical(double value,
                            const std::vector<double>& references,
                            const std::vector<double>& weights,
                            TailDirection direction);

protected:
    double pValue(double observed,
                  const std::vector<double>& references,
                  const std::vector<double>& weights) const override;
};
