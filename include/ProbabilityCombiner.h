#pragma once

#include "FeatureTable.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Reduces an ordered list of per-feature p-values to one vertex score.
 * Every policy shares the same input contract, enforced by combine():
 *  - the input must be a sequence (scalar input -> Vigil::CombinerTypeException),
 *  - it must not be empty (Vigil::CombinerValueException),
 *  - each element must be numeric (Vigil::CombinerValueException).
 * NaN elements are valid "no data" markers.
 */
class ProbabilityCombiner {
public:
    virtual ~ProbabilityCombiner() = default;

    virtual std::string name() const = 0;

    double combine(const std::vector<double>& pValues) const;
    // Missing cells count as NaN.
    double combine(const std::vector<CellValue>& pValues) const;
    // Always throws Vigil::CombinerTypeException.
    double combine(const CellValue& scalar) const;

protected:
    // pValues is non-empty.
    virtual double combineChecked(const std::vector<double>& pValues) const = 0;
};

// Returns the first p-value unchanged.
class FirstFeatureCombiner : public ProbabilityCombiner {
public:
    std::string name() const override { return "first"; }

protected:
    double combineChecked(const std::vector<double>& pValues) const override;
};

// Smallest non-NaN p-value; NaN when all are NaN.
class MinimumCombiner : public ProbabilityCombiner {
public:
    std::string name() const override { return "minimum"; }

protected:
    double combineChecked(const std::vector<double>& pValues) const override;
};

/**
 * Fisher's method over the non-NaN p-values: X = -2 * sum(ln p) follows a
 * chi-square law with 2k degrees of freedom under the null.
 */
class FisherCombiner : public ProbabilityCombiner {
public:
    std::string name() const override { return "fisher"; }

    // Survival function of chi-square with 2k degrees of freedom.
    static double chiSquareSurvivalEvenDof(double x, size_t k);

protected:
    double combineChecked(const std::vector<double>& pValues) const override;
};

/**
 * @brief Builds a combiner by policy name ("first", "minimum", "fisher").
 * @throws Vigil::ConfigurationException on unknown policy.
 */
std::unique_ptr<ProbabilityCombiner> makeCombiner(const std::string& policy);
