#include "ProbabilityEstimator.h"
#include "CommonUtils.h"
#include "EmpiricalEstimator.h"
#include "GaussianEstimator.h"
#include "InputValidation.h"
#include "VigilExceptions.h"

#include <limits>
#include <variant>

TailDirection parseTailDirection(const std::string& direction) {
    if (direction == "right-tailed") return TailDirection::RIGHT;
    if (direction == "left-tailed") return TailDirection::LEFT;
    if (direction == "two-tailed") return TailDirection::TWO;
    throw Vigil::ConfigurationException("The given direction '" + direction +
                                        "' for probability calculation is not known! Possible directions are: "
                                        "'right-tailed', 'left-tailed' & 'two-tailed'.");
}

std::string tailDirectionName(TailDirection direction) {
    switch (direction) {
        case TailDirection::RIGHT: return "right-tailed";
        case TailDirection::LEFT: return "left-tailed";
        case TailDirection::TWO: return "two-tailed";
    }
    return "unknown";
}

std::vector<double> ProbabilityEstimator::estimate(const FeatureTable& featuresValues,
                                                   const FeatureTable& referenceFeaturesValues,
                                                   const FeatureTable& weights) const {
    const FeatureTable features = featuresValues.hasColumn(InputValidation::kVertexNameColumn)
        ? featuresValues.withoutColumn(InputValidation::kVertexNameColumn)
        : featuresValues;

    InputValidation::validateEstimatorInputs(features, referenceFeaturesValues, weights).throwIfFailed();

    const FeatureTable joined = referenceFeaturesValues.innerJoin(weights, InputValidation::kTimeWindowColumn);
    const std::vector<double> joinedWeights = joined.numericValues(InputValidation::kWeightColumn);

    std::vector<double> pValues;
    pValues.reserve(features.colCount());
    for (size_t c = 0; c < features.colCount(); ++c) {
        const std::string& featureName = features.columns()[c].name;
        const CellValue cell = features.cell(0, c);

        double observed = std::numeric_limits<double>::quiet_NaN();
        if (const auto* d = std::get_if<double>(&cell)) {
            observed = *d;
        } else if (const auto* i = std::get_if<int64_t>(&cell)) {
            observed = static_cast<double>(*i);
        }

        pValues.push_back(pValue(observed, joined.numericValues(featureName), joinedWeights));
    }
    return pValues;
}

std::unique_ptr<ProbabilityEstimator> makeEstimator(const std::string& kind, const std::string& direction) {
    const std::string k = CommonUtils::toLower(CommonUtils::trim(kind));
    if (k == "gaussian") {
        return direction.empty() ? std::make_unique<GaussianEstimator>()
                                 : std::make_unique<GaussianEstimator>(direction);
    }
    if (k == "empirical") {
        return direction.empty() ? std::make_unique<EmpiricalEstimator>()
                                 : std::make_unique<EmpiricalEstimator>(direction);
    }
    throw Vigil::ConfigurationException("Unknown estimator '" + kind + "' (allowed: gaussian, empirical)");
}
