#pragma once

#include "FeatureTable.h"
#include "VigilExceptions.h"

#include <string>
#include <utility>

namespace InputValidation {
inline constexpr const char* kTimeWindowColumn = "time_window";
inline constexpr const char* kWeightColumn = "weight";
inline constexpr const char* kVertexNameColumn = "name";

struct ValidationResult {
    bool ok = true;
    Vigil::InputContract violated = Vigil::InputContract::TABLE_INTEGRITY;
    std::string message;

    static ValidationResult pass() { return {}; }
    static ValidationResult fail(Vigil::InputContract contract, std::string message) {
        return {false, contract, std::move(message)};
    }

    // Throws Vigil::InvalidInputException when !ok.
    void throwIfFailed() const;
};

/**
 * @brief Checks the estimator input contracts in order and reports the first violation.
 * @pre featuresValues carries no vertex-name column.
 * @post No numeric work is performed; inputs are not modified.
 */
ValidationResult validateEstimatorInputs(const FeatureTable& featuresValues,
                                         const FeatureTable& referenceFeaturesValues,
                                         const FeatureTable& weights);
}
