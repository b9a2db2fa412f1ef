#include "ProbabilityCombiner.h"
#include "CommonUtils.h"
#include "VigilExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

double ProbabilityCombiner::combine(const std::vector<double>& pValues) const {
    if (pValues.empty()) throw Vigil::CombinerValueException("The given list of p_values is empty.");
    return combineChecked(pValues);
}

double ProbabilityCombiner::combine(const std::vector<CellValue>& pValues) const {
    std::vector<double> numeric;
    numeric.reserve(pValues.size());
    for (size_t i = 0; i < pValues.size(); ++i) {
        const CellValue& v = pValues[i];
        if (const auto* d = std::get_if<double>(&v)) {
            numeric.push_back(*d);
        } else if (const auto* n = std::get_if<int64_t>(&v)) {
            numeric.push_back(static_cast<double>(*n));
        } else if (std::holds_alternative<std::monostate>(v)) {
            numeric.push_back(kNaN);
        } else {
            throw Vigil::CombinerValueException("Element " + std::to_string(i) + " ('" + std::get<std::string>(v) +
                                                "') of the given p_values is not numeric.");
        }
    }
    return combine(numeric);
}

double ProbabilityCombiner::combine(const CellValue& /*scalar*/) const {
    throw Vigil::CombinerTypeException("The given p_values should be a list, not a single value.");
}

double FirstFeatureCombiner::combineChecked(const std::vector<double>& pValues) const {
    return pValues.front();
}

double MinimumCombiner::combineChecked(const std::vector<double>& pValues) const {
    double best = kNaN;
    for (double p : pValues) {
        if (std::isnan(p)) continue;
        if (std::isnan(best) || p < best) best = p;
    }
    return best;
}

double FisherCombiner::chiSquareSurvivalEvenDof(double x, size_t k) {
    if (std::isnan(x)) return kNaN;
    if (x <= 0.0) return 1.0;
    if (std::isinf(x)) return 0.0;
    // P(X > x) = exp(-x/2) * sum_{i<k} (x/2)^i / i!
    const double half = x / 2.0;
    double term = 1.0;
    double sum = 1.0;
    for (size_t i = 1; i < k; ++i) {
        term *= half / static_cast<double>(i);
        sum += term;
    }
    return std::min(1.0, std::exp(-half) * sum);
}

double FisherCombiner::combineChecked(const std::vector<double>& pValues) const {
    double statistic = 0.0;
    size_t k = 0;
    for (double p : pValues) {
        if (std::isnan(p)) continue;
        if (p <= 0.0) return 0.0;
        statistic += -2.0 * std::log(p);
        ++k;
    }
    if (k == 0) return kNaN;
    return chiSquareSurvivalEvenDof(statistic, k);
}

std::unique_ptr<ProbabilityCombiner> makeCombiner(const std::string& policy) {
    const std::string p = CommonUtils::toLower(CommonUtils::trim(policy));
    if (p == "first") return std::make_unique<FirstFeatureCombiner>();
    if (p == "minimum") return std::make_unique<MinimumCombiner>();
    if (p == "fisher") return std::make_unique<FisherCombiner>();
    throw Vigil::ConfigurationException("Unknown combiner '" + policy + "' (allowed: first, minimum, fisher)");
}
