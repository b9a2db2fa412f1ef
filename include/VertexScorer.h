#pragma once

#include "FeatureTable.h"
#include "ProbabilityCombiner.h"
#include "ProbabilityEstimator.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

struct VertexScore {
    std::string vertex;
    std::vector<double> pValues;
    double score = std::numeric_limits<double>::quiet_NaN();
    bool ok = true;
    std::string error;
};

/**
 * Pairs one estimator with one combiner. Both are only read after construction,
 * so a scorer can score many vertices concurrently.
 */
class VertexScorer {
public:
    VertexScorer(std::unique_ptr<ProbabilityEstimator> estimator, std::unique_ptr<ProbabilityCombiner> combiner);

    const ProbabilityEstimator& estimator() const noexcept { return *estimator_; }
    const ProbabilityCombiner& combiner() const noexcept { return *combiner_; }

    /**
     * @brief Scores one vertex: per-feature p-values, then the combined score.
     * @pre featureRow has one row; a 'name' column, when present, labels the vertex.
     * @throws Vigil::InvalidInputException / Vigil::CombinerValueException on bad input.
     */
    VertexScore score(const FeatureTable& featureRow,
                      const FeatureTable& reference,
                      const FeatureTable& weights) const;

    /**
     * @brief Scores every row of a feature table, results in row order.
     * @details When the reference carries a 'name' column, each vertex is scored
     *          against its own rows only and the weights are narrowed to those
     *          windows. Failures are reported per vertex (ok=false, error set).
     */
    std::vector<VertexScore> scoreAll(const FeatureTable& features,
                                      const FeatureTable& reference,
                                      const FeatureTable& weights) const;

private:
    std::unique_ptr<ProbabilityEstimator> estimator_;
    std::unique_ptr<ProbabilityCombiner> combiner_;
};
