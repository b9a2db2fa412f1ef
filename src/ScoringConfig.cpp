#include "ScoringConfig.h"
#include "CommonUtils.h"
#include "ProbabilityEstimator.h"
#include "VigilExceptions.h"

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

namespace {
int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoi(value, &pos);
        if (pos != value.size()) throw Vigil::ConfigurationException("Invalid integer for " + key + ": " + value);
    } catch (const Vigil::VigilException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Vigil::ConfigurationException("Invalid integer for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (parsed < minValue) {
        throw Vigil::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Vigil::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// Removes braces and a trailing comma outside quotes so JSON-ish lines read as key: value.
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t last = out.find_last_not_of(" \t\r\n");
    if (last != std::string::npos && out[last] == ',') out.erase(last, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(ScoringConfig& config, const std::string& key, const std::string& value) {
    if (key == "features") {
        config.featuresPath = value;
    } else if (key == "reference") {
        config.referencePath = value;
    } else if (key == "weights") {
        config.weightsPath = value;
    } else if (key == "output") {
        config.outputPath = value;
    } else if (key == "output_format") {
        config.outputFormat = CommonUtils::toLower(value);
    } else if (key == "estimator") {
        config.estimator = CommonUtils::toLower(value);
    } else if (key == "direction") {
        config.direction = CommonUtils::toLower(value);
    } else if (key == "combiner") {
        config.combiner = CommonUtils::toLower(value);
    } else if (key == "delimiter") {
        if (value.size() != 1) throw Vigil::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
    } else if (key == "threads") {
        config.threads = parseIntStrict(value, "threads", 0);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, "verbose");
    } else {
        throw Vigil::ConfigurationException("Unknown config key: " + key);
    }
}

ScoringConfig mergeFile(const std::string& configPath, const ScoringConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Vigil::ConfigurationException("Could not open config file: " + configPath);

    ScoringConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Vigil::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                ": expected 'key: value', got '" + line + "'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Vigil::VigilException& ex) {
            throw Vigil::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}
} // namespace

ScoringConfig ScoringConfig::fromArgs(int argc, char* argv[]) {
    std::string configPath;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool showHelp = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) throw Vigil::ConfigurationException(flag + " expects a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            showHelp = true;
        } else if (arg == "--verbose") {
            overrides.emplace_back("verbose", "true");
        } else if (arg == "--config") {
            configPath = next(arg);
        } else if (arg == "--output" || arg == "-o") {
            overrides.emplace_back("output", next(arg));
        } else if (arg.rfind("--", 0) == 0) {
            overrides.emplace_back(normalizeConfigKey(arg.substr(2)), next(arg));
        } else {
            positional.push_back(arg);
        }
    }

    ScoringConfig config;
    if (showHelp) {
        config.showHelp = true;
        return config;
    }
    if (!configPath.empty()) config = mergeFile(configPath, config);

    if (positional.size() > 3) {
        throw Vigil::ConfigurationException("Unexpected argument: " + positional[3]);
    }
    if (positional.size() > 0) config.featuresPath = positional[0];
    if (positional.size() > 1) config.referencePath = positional[1];
    if (positional.size() > 2) config.weightsPath = positional[2];

    for (const auto& [key, value] : overrides) {
        try {
            assignKeyValue(config, key, value);
        } catch (const Vigil::VigilException& ex) {
            throw Vigil::ConfigurationException("Invalid option --" + key + ": " + ex.what());
        }
    }

    config.validate();
    return config;
}

ScoringConfig ScoringConfig::fromFile(const std::string& configPath, const ScoringConfig& base) {
    ScoringConfig config = mergeFile(configPath, base);
    config.validate();
    return config;
}

void ScoringConfig::validate() const {
    if (featuresPath.empty() || referencePath.empty() || weightsPath.empty()) {
        throw Vigil::ConfigurationException("features, reference and weights paths are required");
    }
    if (outputPath.empty()) {
        throw Vigil::ConfigurationException("output path must not be empty");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(outputFormat, {"csv", "parquet"})) {
        throw Vigil::ConfigurationException("output_format must be one of: csv, parquet");
    }
#ifndef VIGIL_USE_NATIVE_PARQUET
    if (outputFormat == "parquet") {
        throw Vigil::ConfigurationException("output_format parquet requires a build with VIGIL_USE_NATIVE_PARQUET");
    }
#endif
    if (!isIn(estimator, {"gaussian", "empirical"})) {
        throw Vigil::ConfigurationException("estimator must be one of: gaussian, empirical");
    }
    if (!direction.empty()) parseTailDirection(direction);
    if (!isIn(combiner, {"first", "minimum", "fisher"})) {
        throw Vigil::ConfigurationException("combiner must be one of: first, minimum, fisher");
    }
    if (threads < 0) {
        throw Vigil::ConfigurationException("threads must be >= 0");
    }
}

std::string ScoringConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " <features.csv> <reference.csv> <weights.csv> [options]\n"
           "Options:\n"
           "  --estimator <gaussian|empirical>              Probability estimator (default: gaussian)\n"
           "  --direction <right-tailed|left-tailed|two-tailed>\n"
           "                                                Tail direction (default: estimator specific)\n"
           "  --combiner <first|minimum|fisher>             P-value combination policy (default: first)\n"
           "  --output, -o <file>                           Score table output (default: vertex_scores.csv)\n"
           "  --output-format <csv|parquet>                 Output format (default: csv)\n"
           "  --delimiter <char>                            CSV delimiter character (default: ,)\n"
           "  --threads <n>                                 Worker threads, 0 = runtime default\n"
           "  --config <file>                               key: value config file\n"
           "  --verbose                                     Enable progress logs\n"
           "  --help                                        Show this help message\n";
}
