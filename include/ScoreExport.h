#pragma once

#include "FeatureTable.h"
#include "VertexScorer.h"

#include <string>
#include <vector>

namespace ScoreExport {
/**
 * @brief Lays scores out as a table: name, p_<feature>..., score, error.
 * @pre every successful score carries featureNames.size() p-values.
 * @throws Vigil::DatasetException when a successful score has a different p-value count.
 */
FeatureTable scoresToTable(const std::vector<VertexScore>& scores, const std::vector<std::string>& featureNames);

/**
 * @brief Writes a table as CSV; missing numeric cells are written as "nan", other missing cells empty.
 * @throws Vigil::IOException when the file cannot be written.
 */
void writeCsv(const FeatureTable& table, const std::string& path, char delimiter = ',');

#ifdef VIGIL_USE_NATIVE_PARQUET
/**
 * @brief Writes a table as Parquet through Arrow; missing and non-finite cells become nulls.
 * @post Returns false with errorOut set when the Arrow table cannot be built or written.
 */
bool writeParquet(const FeatureTable& table, const std::string& path, std::string& errorOut);
#endif
}
