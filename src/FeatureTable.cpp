#include "FeatureTable.h"
#include "CommonUtils.h"
#include "CSVUtils.h"
#include "VigilExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <type_traits>
#include <unordered_set>

namespace {
bool parseInt64(const std::string& token, int64_t& out) {
    std::string cleaned = CommonUtils::trim(token);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out);
    return ec == std::errc{} && p == e;
}

bool parseDouble(const std::string& token, double& out) {
    std::string cleaned = CommonUtils::trim(token);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

TypedColumn takeRows(const TypedColumn& col, const std::vector<size_t>& rows) {
    TypedColumn out;
    out.name = col.name;
    out.type = col.type;
    out.missing.reserve(rows.size());
    for (size_t r : rows) out.missing.push_back(col.isMissing(r) ? 1 : 0);

    out.values = std::visit([&rows](const auto& values) -> ColumnStorage {
        using Vec = std::decay_t<decltype(values)>;
        Vec next;
        next.reserve(rows.size());
        for (size_t r : rows) next.push_back(values[r]);
        return next;
    }, col.values);
    return out;
}

TypedColumn inferColumn(const std::string& name, const std::vector<std::vector<std::string>>& rows, size_t c) {
    MissingMask missing(rows.size(), 0);
    bool allInteger = true;
    bool allNumeric = true;
    for (size_t r = 0; r < rows.size(); ++r) {
        const std::string& token = rows[r][c];
        if (CommonUtils::isMissingToken(token)) {
            missing[r] = 1;
            continue;
        }
        int64_t iv = 0;
        double dv = 0.0;
        if (allInteger && !parseInt64(token, iv)) allInteger = false;
        if (allNumeric && !parseDouble(token, dv)) allNumeric = false;
    }

    TypedColumn col;
    col.name = name;
    col.missing = missing;
    const bool anyPresent = std::find(missing.begin(), missing.end(), 0) != missing.end();

    if (allInteger && anyPresent) {
        std::vector<int64_t> values(rows.size(), 0);
        for (size_t r = 0; r < rows.size(); ++r) {
            if (!missing[r]) parseInt64(rows[r][c], values[r]);
        }
        col.type = ColumnType::INTEGER;
        col.values = std::move(values);
    } else if (allNumeric) {
        std::vector<double> values(rows.size(), std::numeric_limits<double>::quiet_NaN());
        for (size_t r = 0; r < rows.size(); ++r) {
            if (!missing[r]) parseDouble(rows[r][c], values[r]);
        }
        col.type = ColumnType::NUMERIC;
        col.values = std::move(values);
    } else {
        std::vector<std::string> values(rows.size());
        for (size_t r = 0; r < rows.size(); ++r) {
            if (!missing[r]) values[r] = CommonUtils::trim(rows[r][c]);
        }
        col.type = ColumnType::CATEGORICAL;
        col.values = std::move(values);
    }
    return col;
}
} // namespace

size_t TypedColumn::size() const noexcept {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

FeatureTable FeatureTable::fromCsv(const std::string& filename, char delimiter) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Vigil::IOException("Could not open file: " + filename);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || header.empty()) throw Vigil::DatasetException("Malformed or empty CSV header in " + filename);

    std::vector<std::vector<std::string>> rows;
    size_t record = 1;
    while (in.peek() != EOF) {
        ++record;
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed);
        if (malformed) {
            throw Vigil::DatasetException("Unterminated quoted field at record " + std::to_string(record) + " in " + filename);
        }
        if (row.empty()) continue;
        if (row.size() != header.size()) {
            throw Vigil::DatasetException("Record " + std::to_string(record) + " in " + filename + " has " +
                                          std::to_string(row.size()) + " fields, header has " +
                                          std::to_string(header.size()));
        }
        rows.push_back(std::move(row));
    }

    FeatureTable table;
    for (size_t c = 0; c < header.size(); ++c) {
        if (header[c].empty()) {
            throw Vigil::DatasetException("Empty column name at position " + std::to_string(c + 1) + " in " + filename);
        }
        TypedColumn col = inferColumn(header[c], rows, c);
        table.addColumn(std::move(col));
    }
    return table;
}

void FeatureTable::addNumericColumn(std::string name, std::vector<double> values) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.missing.resize(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) col.missing[i] = 1;
    }
    col.values = std::move(values);
    addColumn(std::move(col));
}

void FeatureTable::addIntegerColumn(std::string name, std::vector<int64_t> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::INTEGER;
    if (missing.empty()) missing.assign(values.size(), 0);
    col.missing = std::move(missing);
    col.values = std::move(values);
    addColumn(std::move(col));
}

void FeatureTable::addCategoricalColumn(std::string name, std::vector<std::string> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    if (missing.empty()) missing.assign(values.size(), 0);
    col.missing = std::move(missing);
    col.values = std::move(values);
    addColumn(std::move(col));
}

void FeatureTable::addColumn(TypedColumn column) {
    if (hasColumn(column.name)) throw Vigil::DatasetException("Duplicate column name: " + column.name);
    const size_t n = column.size();
    if (column.missing.size() != n) {
        throw Vigil::DatasetException("Missing mask of column '" + column.name + "' does not match its length");
    }
    if (columns_.empty()) {
        rowCount_ = n;
    } else if (n != rowCount_) {
        throw Vigil::DatasetException("Column '" + column.name + "' has " + std::to_string(n) +
                                      " values, table has " + std::to_string(rowCount_) + " rows");
    }
    columns_.push_back(std::move(column));
}

std::vector<std::string> FeatureTable::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

int FeatureTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& FeatureTable::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Vigil::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

std::vector<double> FeatureTable::numericValues(const std::string& name) const {
    const TypedColumn& col = column(name);
    std::vector<double> out(col.size(), std::numeric_limits<double>::quiet_NaN());
    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<std::vector<double>>(col.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (!col.isMissing(i)) out[i] = values[i];
        }
    } else if (col.type == ColumnType::INTEGER) {
        const auto& values = std::get<std::vector<int64_t>>(col.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (!col.isMissing(i)) out[i] = static_cast<double>(values[i]);
        }
    } else {
        throw Vigil::DatasetException("Column '" + name + "' is not numeric");
    }
    return out;
}

CellValue FeatureTable::cell(size_t row, size_t col) const {
    if (col >= columns_.size() || row >= columns_[col].size()) {
        throw Vigil::DatasetException("Cell (" + std::to_string(row) + ", " + std::to_string(col) + ") out of range");
    }
    const TypedColumn& c = columns_[col];
    if (c.isMissing(row)) return std::monostate{};
    return std::visit([row](const auto& values) -> CellValue { return values[row]; }, c.values);
}

FeatureTable FeatureTable::selectRows(const std::vector<size_t>& rows) const {
    for (size_t r : rows) {
        if (r >= rowCount_) throw Vigil::DatasetException("Row index " + std::to_string(r) + " out of range");
    }
    FeatureTable out;
    for (const auto& col : columns_) out.addColumn(takeRows(col, rows));
    out.rowCount_ = rows.size();
    return out;
}

FeatureTable FeatureTable::withoutColumn(const std::string& name) const {
    FeatureTable out;
    for (const auto& col : columns_) {
        if (col.name != name) out.addColumn(col);
    }
    if (out.columns_.empty()) out.rowCount_ = 0;
    return out;
}

void FeatureTable::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Vigil::DatasetException("Row mask size mismatch");

    std::vector<size_t> kept;
    kept.reserve(rowCount_);
    for (size_t i = 0; i < rowCount_; ++i) {
        if (keepMask[i]) kept.push_back(i);
    }
    for (auto& col : columns_) col = takeRows(col, kept);
    rowCount_ = kept.size();
}

FeatureTable FeatureTable::innerJoin(const FeatureTable& other, const std::string& key) const {
    const std::vector<double> leftKeys = numericValues(key);
    const std::vector<double> rightKeys = other.numericValues(key);

    for (const auto& col : other.columns()) {
        if (col.name != key && hasColumn(col.name)) {
            throw Vigil::DatasetException("Join would duplicate column '" + col.name + "'");
        }
    }

    std::map<double, std::vector<size_t>> rightIndex;
    for (size_t r = 0; r < rightKeys.size(); ++r) {
        if (!std::isnan(rightKeys[r])) rightIndex[rightKeys[r]].push_back(r);
    }

    std::vector<size_t> leftRows;
    std::vector<size_t> rightRows;
    for (size_t l = 0; l < leftKeys.size(); ++l) {
        if (std::isnan(leftKeys[l])) continue;
        const auto it = rightIndex.find(leftKeys[l]);
        if (it == rightIndex.end()) continue;
        for (size_t r : it->second) {
            leftRows.push_back(l);
            rightRows.push_back(r);
        }
    }

    FeatureTable out = selectRows(leftRows);
    for (const auto& col : other.columns()) {
        if (col.name == key) continue;
        out.addColumn(takeRows(col, rightRows));
    }
    return out;
}

std::string FeatureTable::structuralIssue() const {
    std::unordered_set<std::string> seen;
    for (const auto& col : columns_) {
        if (!seen.insert(col.name).second) return "duplicate column name '" + col.name + "'";
        if (col.size() != rowCount_) {
            return "column '" + col.name + "' has " + std::to_string(col.size()) + " values for " +
                   std::to_string(rowCount_) + " rows";
        }
        if (col.missing.size() != rowCount_) return "missing mask of column '" + col.name + "' is misaligned";
        const bool storageMatchesType =
            (col.type == ColumnType::NUMERIC && std::holds_alternative<std::vector<double>>(col.values)) ||
            (col.type == ColumnType::INTEGER && std::holds_alternative<std::vector<int64_t>>(col.values)) ||
            (col.type == ColumnType::CATEGORICAL && std::holds_alternative<std::vector<std::string>>(col.values));
        if (!storageMatchesType) return "storage of column '" + col.name + "' does not match its declared type";
    }
    return "";
}
