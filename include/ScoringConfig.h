#pragma once
#include <string>

struct ScoringConfig {
    std::string featuresPath;
    std::string referencePath;
    std::string weightsPath;
    std::string outputPath = "vertex_scores.csv";
    std::string outputFormat = "csv";     // csv|parquet

    std::string estimator = "gaussian";   // gaussian|empirical
    std::string direction;                // right-tailed|left-tailed|two-tailed, empty => estimator default
    std::string combiner = "first";       // first|minimum|fisher

    char delimiter = ',';
    // 0 keeps the OpenMP runtime default.
    int threads = 0;
    bool verbose = false;
    bool showHelp = false;

    /**
     * @brief Builds config from CLI args, layered over an optional --config file.
     * @details Positional args are features, reference and weights paths, in that order.
     *          Command-line options take precedence over the config file.
     * @throws Vigil::ConfigurationException on invalid arguments or values.
     */
    static ScoringConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a loose YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults, validated.
     * @throws Vigil::ConfigurationException on parse/validation failures.
     */
    static ScoringConfig fromFile(const std::string& configPath, const ScoringConfig& base);

    /**
     * @throws Vigil::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage(const std::string& prog);
};
