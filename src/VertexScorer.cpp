#include "VertexScorer.h"
#include "InputValidation.h"
#include "VigilExceptions.h"

#include <charconv>
#include <cmath>
#include <set>
#include <unordered_map>
#include <utility>
#include <variant>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
std::string cellLabel(const CellValue& cell) {
    if (const auto* s = std::get_if<std::string>(&cell)) return *s;
    if (const auto* i = std::get_if<int64_t>(&cell)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&cell)) {
        // Shortest round-trip form, so distinct names never share a label.
        char buf[32];
        const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), *d);
        if (ec == std::errc{}) return std::string(buf, end);
    }
    return "";
}

std::string vertexLabel(const FeatureTable& table, size_t row) {
    const int nameIdx = table.findColumnIndex(InputValidation::kVertexNameColumn);
    if (nameIdx < 0) return "row_" + std::to_string(row);
    return cellLabel(table.cell(row, static_cast<size_t>(nameIdx)));
}

// Keeps only the weight rows whose window occurs in the vertex's reference rows.
FeatureTable weightsForWindows(const FeatureTable& weights, const FeatureTable& reference) {
    const std::string tw = InputValidation::kTimeWindowColumn;
    if (!weights.hasColumn(tw) || !weights.column(tw).isNumeric()) return weights;
    if (!reference.hasColumn(tw) || !reference.column(tw).isNumeric()) return weights;

    const std::vector<double> referenceWindows = reference.numericValues(tw);
    const std::set<double> wanted(referenceWindows.begin(), referenceWindows.end());
    const std::vector<double> weightWindows = weights.numericValues(tw);

    FeatureTable out = weights;
    MissingMask keep(weightWindows.size(), 0);
    for (size_t i = 0; i < weightWindows.size(); ++i) {
        if (wanted.count(weightWindows[i])) keep[i] = 1;
    }
    out.removeRows(keep);
    return out;
}
} // namespace

VertexScorer::VertexScorer(std::unique_ptr<ProbabilityEstimator> estimator,
                           std::unique_ptr<ProbabilityCombiner> combiner)
    : estimator_(std::move(estimator)), combiner_(std::move(combiner)) {
    if (!estimator_ || !combiner_) {
        throw Vigil::ConfigurationException("VertexScorer needs both an estimator and a combiner");
    }
}

VertexScore VertexScorer::score(const FeatureTable& featureRow,
                                const FeatureTable& reference,
                                const FeatureTable& weights) const {
    VertexScore result;
    result.vertex = featureRow.rowCount() > 0 ? vertexLabel(featureRow, 0) : "";
    result.pValues = estimator_->estimate(featureRow, reference, weights);
    result.score = combiner_->combine(result.pValues);
    return result;
}

std::vector<VertexScore> VertexScorer::scoreAll(const FeatureTable& features,
                                                const FeatureTable& reference,
                                                const FeatureTable& weights) const {
    const std::string nameColumn = InputValidation::kVertexNameColumn;
    const bool perVertexHistory = reference.hasColumn(nameColumn);

    std::unordered_map<std::string, std::vector<size_t>> historyRows;
    if (perVertexHistory) {
        const size_t nameIdx = static_cast<size_t>(reference.findColumnIndex(nameColumn));
        for (size_t r = 0; r < reference.rowCount(); ++r) {
            historyRows[cellLabel(reference.cell(r, nameIdx))].push_back(r);
        }
    }

    const size_t n = features.rowCount();
    std::vector<VertexScore> results(n);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < n; ++i) {
        VertexScore& out = results[i];
        std::string label = "row_" + std::to_string(i);
        try {
            label = vertexLabel(features, i);
            const FeatureTable row = features.selectRows({i});
            if (!perVertexHistory) {
                out = score(row, reference, weights);
            } else {
                const auto it = historyRows.find(label);
                const FeatureTable history = reference
                    .selectRows(it == historyRows.end() ? std::vector<size_t>{} : it->second)
                    .withoutColumn(nameColumn);
                out = score(row, history, weightsForWindows(weights, history));
            }
            out.vertex = label;
        } catch (const Vigil::VigilException& ex) {
            out.vertex = label;
            out.ok = false;
            out.error = ex.what();
            out.pValues.clear();
            out.score = std::numeric_limits<double>::quiet_NaN();
        }
    }
    return results;
}
