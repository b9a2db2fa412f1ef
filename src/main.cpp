#include "FeatureTable.h"
#include "InputValidation.h"
#include "ProbabilityCombiner.h"
#include "ProbabilityEstimator.h"
#include "ScoreExport.h"
#include "ScoringConfig.h"
#include "VertexScorer.h"
#include "VigilExceptions.h"
#include <iostream>
#include <string>
#include <vector>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPartial = 2;

void applyThreadCount(const ScoringConfig& config) {
    if (config.threads <= 0) return;
#ifdef USE_OPENMP
    omp_set_num_threads(config.threads);
#else
    std::cerr << "[Vigil Warning] Built without OpenMP; --threads " << config.threads << " is ignored.\n";
#endif
}

FeatureTable loadTable(const std::string& label, const std::string& path, const ScoringConfig& config) {
    FeatureTable table = FeatureTable::fromCsv(path, config.delimiter);
    if (config.verbose) {
        std::cout << "[Vigil] Loaded " << label << " '" << path << "': " << table.rowCount() << " rows x "
                  << table.colCount() << " columns\n";
    }
    return table;
}

int run(const ScoringConfig& config) {
    applyThreadCount(config);

    const FeatureTable features = loadTable("features", config.featuresPath, config);
    const FeatureTable reference = loadTable("reference", config.referencePath, config);
    const FeatureTable weights = loadTable("weights", config.weightsPath, config);

    VertexScorer scorer(makeEstimator(config.estimator, config.direction), makeCombiner(config.combiner));
    if (config.verbose) {
        std::cout << "[Vigil] Scoring " << features.rowCount() << " vertices with " << scorer.estimator().name()
                  << " (" << tailDirectionName(scorer.estimator().direction()) << ") and combiner '"
                  << scorer.combiner().name() << "'\n";
    }

    const std::vector<VertexScore> scores = scorer.scoreAll(features, reference, weights);

    size_t failed = 0;
    for (const auto& s : scores) {
        if (s.ok) continue;
        ++failed;
        std::cerr << "[Vigil Warning] Vertex '" << s.vertex << "' was not scored: " << s.error << "\n";
    }

    const std::vector<std::string> featureNames =
        features.withoutColumn(InputValidation::kVertexNameColumn).columnNames();
    const FeatureTable table = ScoreExport::scoresToTable(scores, featureNames);

    if (config.outputFormat == "parquet") {
#ifdef VIGIL_USE_NATIVE_PARQUET
        std::string error;
        if (!ScoreExport::writeParquet(table, config.outputPath, error)) {
            std::cerr << "[Vigil Error] " << error << "\n";
            return kExitFailure;
        }
#endif
    } else {
        ScoreExport::writeCsv(table, config.outputPath, config.delimiter);
    }

    if (config.verbose) {
        std::cout << "[Vigil] Wrote " << scores.size() - failed << " scored vertices to '" << config.outputPath
                  << "' (" << failed << " failed)\n";
    }
    return failed > 0 ? kExitPartial : kExitOk;
}
} // namespace

int main(int argc, char* argv[]) {
    const std::string prog = argc > 0 ? argv[0] : "vigil_score";
    try {
        const ScoringConfig config = ScoringConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << ScoringConfig::usage(prog);
            return kExitOk;
        }
        return run(config);
    } catch (const Vigil::ConfigurationException& e) {
        std::cerr << "[Vigil Error] " << e.what() << "\n" << ScoringConfig::usage(prog);
        return kExitFailure;
    } catch (const Vigil::VigilException& e) {
        std::cerr << "[Vigil Error] " << e.what() << "\n";
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "[Vigil Exception] " << e.what() << "\n";
        return kExitFailure;
    }
}
