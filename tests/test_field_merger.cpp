#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/extraction/field_merger.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using survey_workbench::ValidationError;
using survey_workbench::test::ScratchDir;
namespace extraction = survey_workbench::extraction;

TEST_CASE("survey_name_strips_participant_prefix_and_suffix") {
    REQUIRE(extraction::survey_name_from_filename("P001_BDI_Extract Data.csv", "P001") == "BDI");
    REQUIRE(extraction::survey_name_from_filename("Other_Extract Data.csv", "P001") == "Other");
}

TEST_CASE("merge_produces_union_of_disjoint_survey_fields") {
    ScratchDir dir("merge_union");
    dir.write("P001/P001_BDI_Extract Data.csv", "File,q1,q2\r\nbdi.xlsx,3,4\r\n");
    dir.write("P001/P001_STAI_Extract Data.csv", "File,q1\r\nstai.xlsx,7\r\n");
    dir.write("P001/notes.txt", "ignored");

    auto files = extraction::find_extract_files(dir.path() / "P001");
    REQUIRE(files.size() == 2);

    auto record = extraction::merge_participant_fields("P001", files);
    REQUIRE(record.participant_id() == "P001");
    REQUIRE(record.size() == 3);
    REQUIRE(record.get("BDI_q1") == "3");
    REQUIRE(record.get("BDI_q2") == "4");
    REQUIRE(record.get("STAI_q1") == "7");
    REQUIRE_FALSE(record.contains("BDI_File"));
    REQUIRE(record.keys().front() == "participant_id");
}

TEST_CASE("merge_last_row_wins_and_short_rows_are_blank") {
    ScratchDir dir("merge_rows");
    auto p = dir.write("P001/P001_X_Extract Data.csv", "a,b\r\n1,2\r\n3\r\n");

    auto record = extraction::merge_participant_fields("P001", {p});
    REQUIRE(record.get("X_a") == "3");
    REQUIRE(record.contains("X_b"));
    REQUIRE(record.get("X_b").empty());
    REQUIRE(record.fields().front().first == "X_a");
}

TEST_CASE("empty_export_contributes_no_fields") {
    ScratchDir dir("merge_empty");
    auto p = dir.write("P001/P001_X_Extract Data.csv", "");
    REQUIRE(extraction::merge_participant_fields("P001", {p}).empty());
}

TEST_CASE("prepare_participant_record_validates_inputs") {
    ScratchDir dir("merge_validate");
    REQUIRE_THROWS_AS(extraction::prepare_participant_record("", dir.path()), ValidationError);
    REQUIRE_THROWS_AS(extraction::prepare_participant_record("P001", ""), ValidationError);
    REQUIRE_THROWS_AS(extraction::prepare_participant_record("P001", dir.path()), ValidationError);

    std::filesystem::create_directories(dir.path() / "P001");
    REQUIRE_THROWS_AS(extraction::prepare_participant_record("P001", dir.path()), ValidationError);
}
