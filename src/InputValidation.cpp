#include "InputValidation.h"
#include "CommonUtils.h"

#include <cmath>
#include <set>
#include <variant>

namespace Vigil {
const char* inputContractName(InputContract contract) noexcept {
    switch (contract) {
        case InputContract::TABLE_INTEGRITY: return "table_integrity";
        case InputContract::FEATURE_ROW_SHAPE: return "feature_row_shape";
        case InputContract::REFERENCE_SHAPE: return "reference_shape";
        case InputContract::WEIGHTS_SHAPE: return "weights_shape";
        case InputContract::REFERENCE_TIME_WINDOW: return "reference_time_window";
        case InputContract::REFERENCE_COLUMNS: return "reference_columns";
        case InputContract::WEIGHTS_COLUMNS: return "weights_columns";
        case InputContract::FEATURE_VALUE_TYPES: return "feature_value_types";
        case InputContract::WINDOW_WEIGHT_TYPES: return "window_weight_types";
        case InputContract::WINDOW_COVERAGE: return "window_coverage";
    }
    return "unknown";
}
} // namespace Vigil

namespace {
using Vigil::InputContract;
using InputValidation::ValidationResult;

std::set<std::string> nameSet(const FeatureTable& table) {
    const auto names = table.columnNames();
    return std::set<std::string>(names.begin(), names.end());
}

// Numeric, fully present and finite; the mask alone does not rule out a stored NaN.
bool isCompleteNumeric(const TypedColumn& col) {
    if (!col.isNumeric()) return false;
    for (uint8_t m : col.missing) {
        if (m) return false;
    }
    if (const auto* values = std::get_if<std::vector<double>>(&col.values)) {
        for (double v : *values) {
            if (!std::isfinite(v)) return false;
        }
    }
    return true;
}
} // namespace

namespace InputValidation {
void ValidationResult::throwIfFailed() const {
    if (!ok) throw Vigil::InvalidInputException(violated, message);
}

ValidationResult validateEstimatorInputs(const FeatureTable& featuresValues,
                                         const FeatureTable& referenceFeaturesValues,
                                         const FeatureTable& weights) {
    const FeatureTable& reference = referenceFeaturesValues;

    const std::pair<const char*, const FeatureTable*> tables[] = {
        {"features_values", &featuresValues},
        {"reference_features_values", &reference},
        {"weights", &weights},
    };
    for (const auto& [label, table] : tables) {
        const std::string issue = table->structuralIssue();
        if (!issue.empty()) {
            return ValidationResult::fail(InputContract::TABLE_INTEGRITY,
                                          std::string("'") + label + "' is not a well-formed table: " + issue);
        }
    }

    if (featuresValues.rowCount() != 1 || featuresValues.colCount() < 1) {
        return ValidationResult::fail(InputContract::FEATURE_ROW_SHAPE,
            "'features_values' should have exactly 1 row and a column for each feature, got " +
            std::to_string(featuresValues.rowCount()) + " rows and " + std::to_string(featuresValues.colCount()) +
            " columns");
    }

    if (reference.rowCount() < 1 || reference.colCount() != featuresValues.colCount() + 1) {
        return ValidationResult::fail(InputContract::REFERENCE_SHAPE,
            "'reference_features_values' should have >= 1 rows and a column for each feature and the time_window, got " +
            std::to_string(reference.rowCount()) + " rows and " + std::to_string(reference.colCount()) + " columns");
    }

    if (weights.rowCount() != reference.rowCount() || weights.colCount() != 2) {
        return ValidationResult::fail(InputContract::WEIGHTS_SHAPE,
            "'weights' should have as many rows as 'reference_features_values' (" +
            std::to_string(reference.rowCount()) + ") and exactly 2 columns, got " +
            std::to_string(weights.rowCount()) + " rows and " + std::to_string(weights.colCount()) + " columns");
    }

    if (!reference.hasColumn(kTimeWindowColumn)) {
        return ValidationResult::fail(InputContract::REFERENCE_TIME_WINDOW,
                                      "'reference_features_values' should have the column 'time_window'");
    }

    std::set<std::string> expected = nameSet(featuresValues);
    expected.insert(kTimeWindowColumn);
    if (expected != nameSet(reference)) {
        return ValidationResult::fail(InputContract::REFERENCE_COLUMNS,
            "'features_values' [" + CommonUtils::joinNames(featuresValues.columnNames()) +
            "] and 'reference_features_values' [" + CommonUtils::joinNames(reference.columnNames()) +
            "] should have the same feature columns");
    }

    if (nameSet(weights) != std::set<std::string>{kTimeWindowColumn, kWeightColumn}) {
        return ValidationResult::fail(InputContract::WEIGHTS_COLUMNS,
            "'weights' should have the columns 'time_window' & 'weight', got [" +
            CommonUtils::joinNames(weights.columnNames()) + "]");
    }

    for (const auto& col : featuresValues.columns()) {
        if (!col.isNumeric()) {
            return ValidationResult::fail(InputContract::FEATURE_VALUE_TYPES,
                "feature '" + col.name + "' in 'features_values' should be of an integer or float type");
        }
        if (!reference.column(col.name).isNumeric()) {
            return ValidationResult::fail(InputContract::FEATURE_VALUE_TYPES,
                "feature '" + col.name + "' in 'reference_features_values' should be of an integer or float type");
        }
    }

    if (!isCompleteNumeric(reference.column(kTimeWindowColumn))) {
        return ValidationResult::fail(InputContract::WINDOW_WEIGHT_TYPES,
            "every 'time_window' in 'reference_features_values' should be a present, finite integer or float");
    }
    if (!isCompleteNumeric(weights.column(kTimeWindowColumn))) {
        return ValidationResult::fail(InputContract::WINDOW_WEIGHT_TYPES,
                                      "every 'time_window' in 'weights' should be a present, finite integer or float");
    }
    if (!isCompleteNumeric(weights.column(kWeightColumn))) {
        return ValidationResult::fail(InputContract::WINDOW_WEIGHT_TYPES,
                                      "every 'weight' in 'weights' should be a present, finite integer or float");
    }

    const std::vector<double> referenceWindows = reference.numericValues(kTimeWindowColumn);
    const std::vector<double> weightWindows = weights.numericValues(kTimeWindowColumn);
    const std::set<double> referenceSet(referenceWindows.begin(), referenceWindows.end());
    const std::set<double> weightSet(weightWindows.begin(), weightWindows.end());
    if (referenceSet != weightSet) {
        return ValidationResult::fail(InputContract::WINDOW_COVERAGE,
            "each time_window in 'reference_features_values' should have a weight in 'weights' and vice versa");
    }
    if (weightSet.size() != weightWindows.size()) {
        return ValidationResult::fail(InputContract::WINDOW_COVERAGE,
                                      "each time_window should appear only once in 'weights'");
    }

    return ValidationResult::pass();
}
}
