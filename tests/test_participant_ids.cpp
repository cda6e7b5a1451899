#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/participants/participant_ids.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using survey_workbench::test::ScratchDir;
namespace participants = survey_workbench::participants;

TEST_CASE("parse_participant_ids_splits_commas_and_newlines") {
    auto ids = participants::parse_participant_ids(" P001, P002\r\nP003\n\n,P001 ");
    REQUIRE(ids == std::vector<std::string>{"P001", "P002", "P003", "P001"});
}

TEST_CASE("unique_participant_ids_keeps_first_occurrence") {
    auto ids = participants::unique_participant_ids({"B", "A", "B", "C", "A"});
    REQUIRE(ids == std::vector<std::string>{"B", "A", "C"});
}

TEST_CASE("import_participant_list_reads_every_csv_cell") {
    ScratchDir dir("ids_csv");
    auto p = dir.write("ids.csv", "P001,P002\r\n,P003\r\nP002,\r\n");
    REQUIRE(participants::import_participant_list(p) ==
            std::vector<std::string>{"P001", "P002", "P003"});
}

TEST_CASE("import_participant_list_reads_text_files") {
    ScratchDir dir("ids_txt");
    auto p = dir.write("ids.txt", "P010\nP011, P012\nP010\n");
    REQUIRE(participants::import_participant_list(p) ==
            std::vector<std::string>{"P010", "P011", "P012"});
}

TEST_CASE("import_participant_list_missing_file_throws") {
    ScratchDir dir("ids_missing");
    REQUIRE_THROWS_AS(participants::import_participant_list(dir.path() / "none.txt"),
                      survey_workbench::IOError);
}
