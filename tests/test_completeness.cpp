#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/extraction/completeness.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using survey_workbench::ValidationError;
using survey_workbench::test::ScratchDir;
namespace extraction = survey_workbench::extraction;

TEST_CASE("completeness_two_of_three_is_incomplete") {
    ScratchDir dir("complete_two");
    dir.write("P001/P001_A_Extract Data.csv", "x\r\n1\r\n");
    dir.write("P001/P001_B_Extract Data.csv", "");

    auto r = extraction::check_data_completeness("P001", dir.path(), 3);
    REQUIRE_FALSE(r.complete);
    REQUIRE(r.files.size() == 2);
    REQUIRE(r.issues == std::vector<std::string>{"Expected 3 CSV files, found 2"});
}

TEST_CASE("completeness_three_of_three_is_complete") {
    ScratchDir dir("complete_three");
    dir.write("P001/P001_A_Extract Data.csv", "");
    dir.write("P001/P001_B_Extract Data.csv", "");
    dir.write("P001/P001_C_Extract Data.csv", "");
    dir.write("P001/P001_A.xlsx", "");

    auto r = extraction::check_data_completeness("P001", dir.path(), 3);
    REQUIRE(r.complete);
    REQUIRE(r.issues.empty());
    REQUIRE(r.files.size() == 3);
}

TEST_CASE("completeness_reports_missing_folder_and_no_exports") {
    ScratchDir dir("complete_missing");
    auto missing = extraction::check_data_completeness("P404", dir.path(), 0);
    REQUIRE_FALSE(missing.complete);
    REQUIRE(missing.issues.at(0).rfind("Folder not found: ", 0) == 0);

    dir.write("P001/readme.txt", "");
    auto none = extraction::check_data_completeness("P001", dir.path(), 0);
    REQUIRE_FALSE(none.complete);
    REQUIRE(none.issues == std::vector<std::string>{"No Extract Data CSV files found"});
}

TEST_CASE("unknown_expected_count_accepts_any_export") {
    ScratchDir dir("complete_unknown");
    dir.write("P001/P001_A_Extract Data.csv", "");
    REQUIRE(extraction::check_data_completeness("P001", dir.path(), 0).complete);
}

TEST_CASE("missing_data_report_summarises_all_folders") {
    ScratchDir dir("complete_report");
    dir.write("P001/P001_A_Extract Data.csv", "");
    dir.write("P001/P001_B_Extract Data.csv", "");
    dir.write("P002/P002_A_Extract Data.csv", "");

    auto report = extraction::generate_missing_data_report(dir.path(), 2);
    REQUIRE(report.total() == 2);
    REQUIRE(report.complete_count == 1);
    REQUIRE(report.incomplete_count == 1);
    REQUIRE(report.summary() == "Summary: 1 complete, 1 incomplete (out of 2 total)");
    REQUIRE(report.lines() == std::vector<std::string>{
                                  "P001: Complete (2 files)",
                                  "P002: INCOMPLETE - Expected 2 CSV files, found 1"});
}

TEST_CASE("missing_data_report_validates_source") {
    ScratchDir dir("complete_report_empty");
    REQUIRE_THROWS_AS(extraction::generate_missing_data_report("", 1), ValidationError);
    REQUIRE_THROWS_AS(extraction::generate_missing_data_report(dir.path() / "none", 1),
                      ValidationError);
    REQUIRE_THROWS_AS(extraction::generate_missing_data_report(dir.path(), 1), ValidationError);
}
