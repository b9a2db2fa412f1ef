#include "ScoreExport.h"
#include "CSVUtils.h"
#include "VigilExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#ifdef VIGIL_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
std::string formatCell(const CellValue& cell, ColumnType type) {
    if (std::holds_alternative<std::monostate>(cell)) return type == ColumnType::NUMERIC ? "nan" : "";
    if (const auto* s = std::get_if<std::string>(&cell)) return *s;
    if (const auto* i = std::get_if<int64_t>(&cell)) return std::to_string(*i);
    const double v = std::get<double>(cell);
    if (std::isnan(v)) return "nan";
    std::ostringstream os;
    os << std::setprecision(12) << v;
    return os.str();
}

#ifdef VIGIL_USE_NATIVE_PARQUET
template <typename Builder, typename Value>
bool appendCell(Builder& builder, bool isNull, const Value& value, const std::string& column, std::string& errorOut) {
    const arrow::Status status = isNull ? builder.AppendNull() : builder.Append(value);
    if (!status.ok()) {
        errorOut = "Failed to append value for column '" + column + "': " + status.ToString();
        return false;
    }
    return true;
}
#endif
} // namespace

namespace ScoreExport {
FeatureTable scoresToTable(const std::vector<VertexScore>& scores, const std::vector<std::string>& featureNames) {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    std::vector<std::string> names;
    std::vector<std::vector<double>> pColumns(featureNames.size());
    std::vector<double> combined;
    std::vector<std::string> errors;
    MissingMask errorMissing;

    for (const auto& s : scores) {
        if (s.ok && s.pValues.size() != featureNames.size()) {
            throw Vigil::DatasetException("vertex '" + s.vertex + "' has " + std::to_string(s.pValues.size()) +
                                          " p-values for " + std::to_string(featureNames.size()) + " features");
        }
        names.push_back(s.vertex);
        for (size_t f = 0; f < featureNames.size(); ++f) {
            pColumns[f].push_back(s.ok ? s.pValues[f] : nan);
        }
        combined.push_back(s.ok ? s.score : nan);
        errors.push_back(s.error);
        errorMissing.push_back(s.ok ? 1 : 0);
    }

    FeatureTable table;
    table.addCategoricalColumn("name", std::move(names));
    for (size_t f = 0; f < featureNames.size(); ++f) {
        table.addNumericColumn("p_" + featureNames[f], std::move(pColumns[f]));
    }
    table.addNumericColumn("score", std::move(combined));
    table.addCategoricalColumn("error", std::move(errors), std::move(errorMissing));
    return table;
}

void writeCsv(const FeatureTable& table, const std::string& path, char delimiter) {
    std::ofstream out(path);
    if (!out) throw Vigil::IOException("Failed to open output file: " + path);

    CSVUtils::writeCSVLine(out, table.columnNames(), delimiter);
    std::vector<std::string> fields(table.colCount());
    for (size_t r = 0; r < table.rowCount(); ++r) {
        for (size_t c = 0; c < table.colCount(); ++c) fields[c] = formatCell(table.cell(r, c), table.columns()[c].type);
        CSVUtils::writeCSVLine(out, fields, delimiter);
    }

    out.flush();
    if (!out) throw Vigil::IOException("Failed while writing output file: " + path);
}

#ifdef VIGIL_USE_NATIVE_PARQUET
bool writeParquet(const FeatureTable& table, const std::string& path, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.colCount());
    arrays.reserve(table.colCount());

    for (const auto& col : table.columns()) {
        std::shared_ptr<arrow::Array> arr;
        arrow::Status status;
        if (col.type == ColumnType::NUMERIC) {
            arrow::DoubleBuilder builder;
            const auto& vals = std::get<std::vector<double>>(col.values);
            for (size_t r = 0; r < vals.size(); ++r) {
                const bool isNull = col.isMissing(r) || !std::isfinite(vals[r]);
                if (!appendCell(builder, isNull, vals[r], col.name, errorOut)) return false;
            }
            status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::float64(), true));
        } else if (col.type == ColumnType::INTEGER) {
            arrow::Int64Builder builder;
            const auto& vals = std::get<std::vector<int64_t>>(col.values);
            for (size_t r = 0; r < vals.size(); ++r) {
                if (!appendCell(builder, col.isMissing(r), vals[r], col.name, errorOut)) return false;
            }
            status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::int64(), true));
        } else {
            arrow::StringBuilder builder;
            const auto& vals = std::get<std::vector<std::string>>(col.values);
            for (size_t r = 0; r < vals.size(); ++r) {
                if (!appendCell(builder, col.isMissing(r), vals[r], col.name, errorOut)) return false;
            }
            status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::utf8(), true));
        }
        if (!status.ok()) {
            errorOut = "Failed to finalize Arrow array for column '" + col.name + "': " + status.ToString();
            return false;
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(table.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
}
