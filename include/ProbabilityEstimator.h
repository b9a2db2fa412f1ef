#pragma once

#include "FeatureTable.h"

#include <memory>
#include <string>
#include <vector>

enum class TailDirection { RIGHT, LEFT, TWO };

/**
 * @brief Parses "right-tailed", "left-tailed" or "two-tailed".
 * @throws Vigil::ConfigurationException for any other string.
 */
TailDirection parseTailDirection(const std::string& direction);
std::string tailDirectionName(TailDirection direction);

/**
 * Turns one vertex's feature row into per-feature p-values against a weighted
 * reference history. Implementations are stateless beyond their tail direction
 * and safe to share across threads.
 */
class ProbabilityEstimator {
public:
    explicit ProbabilityEstimator(TailDirection direction) : direction_(direction) {}
    virtual ~ProbabilityEstimator() = default;

    TailDirection direction() const noexcept { return direction_; }
    virtual std::string name() const = 0;

    /**
     * @brief Computes one p-value per feature column, in column order.
     * @param featuresValues 1 x n table, one numeric column per feature; an optional
     *        vertex 'name' column is ignored.
     * @param referenceFeaturesValues m x (n+1) table of past feature values plus 'time_window'.
     * @param weights m x 2 table with 'time_window' and 'weight'.
     * @post NaN marks a feature with no usable reference data.
     * @throws Vigil::InvalidInputException naming the violated input contract.
     */
    std::vector<double> estimate(const FeatureTable& featuresValues,
                                 const FeatureTable& referenceFeaturesValues,
                                 const FeatureTable& weights) const;

protected:
    // references and weights are aligned; references may hold NaN for missing windows.
    virtual double pValue(double observed,
                          const std::vector<double>& references,
                          const std::vector<double>& weights) const = 0;

private:
    TailDirection direction_;
};

/**
 * @brief Builds an estimator by name ("gaussian" or "empirical").
 * @param direction tail direction, empty for the estimator's default.
 * @throws Vigil::ConfigurationException on unknown name or direction.
 */
std::unique_ptr<ProbabilityEstimator> makeEstimator(const std::string& kind, const std::string& direction = "");
