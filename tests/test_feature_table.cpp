// tests/test_feature_table.cpp
//
// Column typing, CSV loading and the window join used by the estimators.

#include "FeatureTable.h"
#include "VigilExceptions.h"
#include "TestSupport.h"

#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

using TestSupport::expect;
using TestSupport::expectThrows;

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

int test_columns_and_missing_cells() {
    std::cout << "[columns] typed storage with a missing mask\n";
    int failed = 0;

    FeatureTable t;
    t.addNumericColumn("cpu", {0.5, kNaN, 0.9});
    t.addIntegerColumn("packets", {10, 20, 30}, {0, 0, 1});
    t.addCategoricalColumn("host", {"a", "b", "c"});

    expect(t.rowCount() == 3 && t.colCount() == 3, "3x3 shape", failed);
    expect(t.column("cpu").isMissing(1), "NaN recorded as missing", failed);
    expect(std::holds_alternative<std::monostate>(t.cell(1, 0)), "missing numeric cell is monostate", failed);
    expect(std::holds_alternative<std::monostate>(t.cell(2, 1)), "masked integer cell is monostate", failed);
    expect(std::get<int64_t>(t.cell(0, 1)) == 10, "integer cell keeps int64", failed);
    expect(std::get<std::string>(t.cell(2, 2)) == "c", "categorical cell", failed);

    const std::vector<double> packets = t.numericValues("packets");
    expect(packets[0] == 10.0 && packets[1] == 20.0 && std::isnan(packets[2]), "integers widen to double", failed);

    expect(t.findColumnIndex("host") == 2, "column index lookup", failed);
    expect(t.findColumnIndex("absent") == -1, "absent column gives -1", failed);
    expect(t.structuralIssue().empty(), "well formed table", failed);

    expectThrows<Vigil::DatasetException>([&] { t.numericValues("host"); }, "categorical is not numeric", failed);
    expectThrows<Vigil::DatasetException>([&] { t.column("absent"); }, "absent column", failed);
    expectThrows<Vigil::DatasetException>([&] { t.cell(3, 0); }, "row out of range", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_add_column_rejects_bad_shapes() {
    std::cout << "[columns] duplicate names and length mismatches are rejected\n";
    int failed = 0;

    FeatureTable t;
    t.addNumericColumn("x", {1.0, 2.0});
    expectThrows<Vigil::DatasetException>([&] { t.addNumericColumn("x", {3.0, 4.0}); }, "duplicate name", failed);
    expectThrows<Vigil::DatasetException>([&] { t.addNumericColumn("y", {1.0}); }, "short column", failed);
    expectThrows<Vigil::DatasetException>(
        [&] { t.addIntegerColumn("z", {1, 2}, {0}); }, "mask shorter than values", failed);
    expect(t.colCount() == 1, "failed adds leave the table unchanged", failed);

    // Mutable access can break the table; structuralIssue reports it.
    std::get<std::vector<double>>(t.columns()[0].values).push_back(3.0);
    expect(!t.structuralIssue().empty(), "ragged column detected", failed);

    FeatureTable mistyped;
    mistyped.addNumericColumn("w", {1.0});
    mistyped.columns()[0].type = ColumnType::INTEGER;
    expect(!mistyped.structuralIssue().empty(), "storage/type mismatch detected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_row_selection() {
    std::cout << "[rows] selectRows / removeRows / withoutColumn\n";
    int failed = 0;

    FeatureTable t;
    t.addNumericColumn("v", {1.0, 2.0, 3.0, 4.0});
    t.addCategoricalColumn("name", {"a", "b", "a", "c"});

    const FeatureTable picked = t.selectRows({2, 0});
    expect(picked.rowCount() == 2, "two rows picked", failed);
    expect(std::get<double>(picked.cell(0, 0)) == 3.0, "selection order kept", failed);
    expect(picked.selectRows({}).rowCount() == 0, "empty selection", failed);
    expectThrows<Vigil::DatasetException>([&] { t.selectRows({4}); }, "row out of range", failed);

    const FeatureTable bare = t.withoutColumn("name");
    expect(bare.colCount() == 1 && !bare.hasColumn("name") && bare.rowCount() == 4, "name column dropped", failed);
    expect(t.withoutColumn("absent").colCount() == 2, "dropping an absent column is a no-op", failed);

    FeatureTable copy = t;
    copy.removeRows({1, 0, 0, 1});
    expect(copy.rowCount() == 2, "two rows kept", failed);
    expect(copy.numericValues("v") == std::vector<double>({1.0, 4.0}), "kept rows in order", failed);
    expectThrows<Vigil::DatasetException>([&] { copy.removeRows({1}); }, "mask size mismatch", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_inner_join_on_window() {
    std::cout << "[join] inner join keeps left order and drops unmatched rows\n";
    int failed = 0;

    FeatureTable reference;
    reference.addNumericColumn("f", {10.0, 20.0, 30.0, 40.0});
    reference.addIntegerColumn("time_window", {3, 1, 2, 9});

    FeatureTable weights;
    weights.addNumericColumn("time_window", {1.0, 2.0, 3.0});
    weights.addNumericColumn("weight", {0.1, 0.2, 0.3});

    const FeatureTable joined = reference.innerJoin(weights, "time_window");
    expect(joined.rowCount() == 3, "window 9 has no weight and is dropped", failed);
    expect(joined.columnNames() == std::vector<std::string>({"f", "time_window", "weight"}), "join columns", failed);
    expect(joined.numericValues("f") == std::vector<double>({10.0, 20.0, 30.0}), "left order kept", failed);
    expect(joined.numericValues("weight") == std::vector<double>({0.3, 0.1, 0.2}), "weights follow windows",
           failed);

    FeatureTable clash;
    clash.addNumericColumn("time_window", {1.0});
    clash.addNumericColumn("f", {1.0});
    expectThrows<Vigil::DatasetException>(
        [&] { reference.innerJoin(clash, "time_window"); }, "duplicated non-key column", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_csv_loading() {
    std::cout << "[csv] type inference, missing tokens and quoting\n";
    int failed = 0;

    const std::string path = TestSupport::writeTempFile(
        "feature_table.csv",
        "name,packets,latency,label\n"
        "\"edge, west\",12,0.5,ok\n"
        "core,NA,1e-3,\n"
        "\n"
        "leaf,7,,warn\n");

    const FeatureTable t = FeatureTable::fromCsv(path);
    expect(t.rowCount() == 3 && t.colCount() == 4, "blank line skipped", failed);
    expect(t.column("name").type == ColumnType::CATEGORICAL, "name is categorical", failed);
    expect(t.column("packets").type == ColumnType::INTEGER, "packets is integer", failed);
    expect(t.column("latency").type == ColumnType::NUMERIC, "latency is numeric", failed);
    expect(t.column("label").type == ColumnType::CATEGORICAL, "label is categorical", failed);
    expect(std::get<std::string>(t.cell(0, 0)) == "edge, west", "quoted delimiter kept", failed);
    expect(t.column("packets").isMissing(1), "NA token is missing", failed);
    expect(t.column("latency").isMissing(2), "empty numeric field is missing", failed);
    expect(t.column("label").isMissing(1), "empty categorical field is missing", failed);

    const std::string semicolons = TestSupport::writeTempFile("feature_table_semicolon.csv", "a;b\n1;2.5\n");
    const FeatureTable s = FeatureTable::fromCsv(semicolons, ';');
    expect(s.colCount() == 2 && s.numericValues("b")[0] == 2.5, "custom delimiter", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_csv_missing_after_text() {
    std::cout << "[csv] missing tokens after a text value are still marked missing\n";
    int failed = 0;

    const std::string path = TestSupport::writeTempFile("missing_names.csv", "name,f\nalpha,1\nNA,2\n,3\nnull,4\n");
    const FeatureTable t = FeatureTable::fromCsv(path);
    const TypedColumn& name = t.column("name");
    expect(name.type == ColumnType::CATEGORICAL, "name is categorical", failed);
    expect(!name.isMissing(0), "alpha present", failed);
    expect(name.isMissing(1), "NA after text is missing", failed);
    expect(name.isMissing(2), "empty after text is missing", failed);
    expect(name.isMissing(3), "null after text is missing", failed);
    expect(std::holds_alternative<std::monostate>(t.cell(2, 0)), "empty name reads as a missing cell", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_csv_errors() {
    std::cout << "[csv] unreadable and malformed files are reported\n";
    int failed = 0;

    expectThrows<Vigil::IOException>(
        [] { FeatureTable::fromCsv("/nonexistent/vigil/features.csv"); }, "missing file", failed);

    const std::string ragged = TestSupport::writeTempFile("ragged.csv", "a,b\n1,2\n3\n");
    expectThrows<Vigil::DatasetException>([&] { FeatureTable::fromCsv(ragged); }, "ragged row", failed);

    const std::string dupes = TestSupport::writeTempFile("dupes.csv", "a,a\n1,2\n");
    expectThrows<Vigil::DatasetException>([&] { FeatureTable::fromCsv(dupes); }, "duplicate header", failed);

    const std::string unterminated = TestSupport::writeTempFile("unterminated.csv", "a,b\n\"1,2\n");
    expectThrows<Vigil::DatasetException>([&] { FeatureTable::fromCsv(unterminated); }, "open quote", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}
} // namespace

int main() {
    int total = 0;
    total += test_columns_and_missing_cells();
    total += test_add_column_rejects_bad_shapes();
    total += test_row_selection();
    total += test_inner_join_on_window();
    total += test_csv_loading();
    total += test_csv_missing_after_text();
    total += test_csv_errors();
    return TestSupport::finish("feature table", total);
}
