#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, INTEGER, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;
// Single cell; std::monostate marks a missing cell.
using CellValue = std::variant<std::monostate, double, int64_t, std::string>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept;
    bool isNumeric() const noexcept { return type == ColumnType::NUMERIC || type == ColumnType::INTEGER; }
    bool isMissing(size_t row) const noexcept { return row < missing.size() && missing[row] != 0; }
};

/**
 * Column-oriented table with typed storage and an explicit missing mask per column.
 * Carries feature rows, reference histories, window weights and score exports.
 */
class FeatureTable {
public:
    FeatureTable() = default;

    /**
     * @brief Loads a CSV file and infers INTEGER / NUMERIC / CATEGORICAL per column.
     * @pre file exists and its first record is the header.
     * @throws Vigil::IOException when the file cannot be opened.
     * @throws Vigil::DatasetException on malformed header, duplicate column names or ragged rows.
     */
    static FeatureTable fromCsv(const std::string& filename, char delimiter = ',');

    // NaN entries are recorded as missing.
    void addNumericColumn(std::string name, std::vector<double> values);
    void addIntegerColumn(std::string name, std::vector<int64_t> values, MissingMask missing = {});
    void addCategoricalColumn(std::string name, std::vector<std::string> values, MissingMask missing = {});

    /**
     * @brief Appends a column.
     * @throws Vigil::DatasetException on duplicate name or a length different from rowCount().
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    /**
     * @throws Vigil::DatasetException when the column is absent.
     */
    const TypedColumn& column(const std::string& name) const;

    /**
     * @brief Column values widened to double, NaN for missing cells.
     * @throws Vigil::DatasetException when the column is absent or categorical.
     */
    std::vector<double> numericValues(const std::string& name) const;

    /**
     * @throws Vigil::DatasetException when row or column is out of range.
     */
    CellValue cell(size_t row, size_t col) const;

    FeatureTable selectRows(const std::vector<size_t>& rows) const;
    FeatureTable withoutColumn(const std::string& name) const;

    /**
     * @brief Removes rows where keepMask is false across all columns.
     * @throws Vigil::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    /**
     * @brief Inner join on a numeric key column present in both tables.
     * @details Output keeps this table's row order and columns, followed by the
     *          other table's non-key columns. Rows with a missing key never match.
     * @throws Vigil::DatasetException when the key is absent or categorical, or a
     *         non-key column name appears in both tables.
     */
    FeatureTable innerJoin(const FeatureTable& other, const std::string& key) const;

    /**
     * @brief Describes the first structural defect (ragged column, misaligned
     *        missing mask, duplicate name); empty when the table is well formed.
     */
    std::string structuralIssue() const;

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
