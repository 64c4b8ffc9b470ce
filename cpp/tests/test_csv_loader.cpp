#include "test_common.hpp"

#include "effluent/core/logging.hpp"
#include "effluent/core/version.hpp"
#include "effluent/data/csv_loader.hpp"
#include "effluent/processing/compliance_pipeline.hpp"

#include <stdexcept>

using namespace effluent;
using namespace effluent::test;

namespace {

void runParseTests() {
    const std::string content =
        "bod1, cod1 ,label\n"
        "1.5,2,a\n"
        "3,,b\n"
        "\n"
        "4,5\n"            // malformed: skipped
        "6,x7,c\n";

    DataFrame df = CsvLoader::parse(content, CsvOptions{});
    REQUIRE(df.row_count() == 3, "three well-formed rows");
    REQUIRE(df.column_count() == 3, "three columns");
    REQUIRE(df.column_names()[1] == "cod1", "header names trimmed");

    REQUIRE(df.column_type("bod1") == ColumnType::FLOAT64, "numeric column");
    REQUIRE(df.column_type("cod1") == ColumnType::STRING, "x7 makes cod1 a string column");
    REQUIRE(df.column_type("label") == ColumnType::STRING, "string column");

    const auto bod1 = df.get_f64("bod1");
    REQUIRE(bod1[0] == 1.5 && bod1[1] == 3.0 && bod1[2] == 6.0, "bod1 values");
    const auto label = df.get_string("label");
    REQUIRE(label[0] == "a" && label[2] == "c", "label values");
}

void runMissingValueTests() {
    DataFrame df = CsvLoader::parse("a,b\n1,\n2,nan\n,4\n", CsvOptions{});
    REQUIRE(df.column_type("a") == ColumnType::FLOAT64, "blank cells keep the column numeric");
    const auto a = df.get_f64("a");
    const auto b = df.get_f64("b");
    REQUIRE(std::isnan(b[0]) && std::isnan(b[1]) && b[2] == 4.0, "blank and nan cells are NaN");
    REQUIRE(std::isnan(a[2]), "blank leading cell is NaN");
}

void runOptionTests() {
    CsvOptions semicolon;
    semicolon.delimiter = ';';
    semicolon.skip_rows = 1;
    DataFrame df = CsvLoader::parse("exported by simulator\nx;y\n1;2\n3;4\n", semicolon);
    REQUIRE(df.row_count() == 2 && df.has_column("y"), "delimiter and skip_rows");

    CsvOptions no_header;
    no_header.has_header = false;
    DataFrame raw = CsvLoader::parse("1,2\n3,4\n", no_header);
    REQUIRE(raw.has_column("column_0") && raw.has_column("column_1"), "generated names");
    REQUIRE(raw.row_count() == 2, "all rows are data");

    REQUIRE_THROWS(CsvLoader::parse("", CsvOptions{}), std::runtime_error, "missing header");
    REQUIRE_THROWS(CsvLoader::load("/nonexistent/effluent.csv", CsvOptions{}),
                   std::runtime_error, "unreadable file");
}

void runScenarioFileTests() {
    // Header-only scenario file: valid, no rows
    DataFrame header_only = CsvLoader::parse("bod1,cod1,bod31,cod31,snh1,snh31\n", CsvOptions{});
    REQUIRE(header_only.row_count() == 0 && header_only.column_count() == 6, "header only");
    REQUIRE(header_only.column_type("bod31") == ColumnType::FLOAT64, "empty columns numeric");

    DataFrame df = CsvLoader::parse(
        "bod1,cod1,bod31,cod31,snh1,snh31\n"
        "200,500,10,50,30,2\n"
        "100,500,60,50,30,2\n"
        "200,500,10,50,30,2\n",
        CsvOptions{});
    const DataFrame enriched = process_dataframe(df, ComplianceLimits{});
    const auto fail_type = enriched.get_string(columns::FAIL_TYPE);
    REQUIRE(fail_type[0] == "Compliant", "row 0 compliant");
    REQUIRE(fail_type[1] == "Max Limit Failure", "row 1 max limit failure");
}

void runLoggingTests() {
    REQUIRE(parse_log_level("DEBUG") == LogLevel::DEBUG, "case-insensitive level");
    REQUIRE(parse_log_level("warn") == LogLevel::WARN, "warn level");
    REQUIRE_THROWS(parse_log_level("loud"), std::invalid_argument, "unknown level");

    const LogLevel previous = get_log_level();
    set_log_level(LogLevel::ERROR);
    REQUIRE(get_log_level() == LogLevel::ERROR, "level set");
    log_info("[TEST] suppressed");
    set_log_level(previous);
}

void runVersionTests() {
    const std::string version = Version::get_version_string();
    REQUIRE(version == std::to_string(Version::MAJOR) + "." + std::to_string(Version::MINOR) +
                           "." + std::to_string(Version::PATCH),
            "dotted version");

    const std::string info = Version::get_build_info();
    REQUIRE(info.rfind("effluent " + version + " (", 0) == 0, "build info prefix");
    REQUIRE(contains(info, "arrow") == Version::has_arrow(), "arrow reported when built in");
    REQUIRE(contains(info, "openmp") == Version::has_openmp(), "openmp reported when built in");
    REQUIRE(contains(info, "scalar") == (!Version::has_arrow() && !Version::has_openmp()),
            "scalar build reported");
}

} // namespace

int main() {
    runParseTests();
    runMissingValueTests();
    runOptionTests();
    runScenarioFileTests();
    runLoggingTests();
    runVersionTests();
    std::cout << "[PASS] test_csv_loader\n";
    return 0;
}
