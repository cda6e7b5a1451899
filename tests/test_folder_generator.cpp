#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/generation/folder_generator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using survey_workbench::QuestionnaireSpec;
using survey_workbench::ValidationError;
using survey_workbench::test::ScratchDir;
namespace fs = std::filesystem;
namespace generation = survey_workbench::generation;

TEST_CASE("copy_file_name_numbers_only_multiple_copies") {
    REQUIRE(generation::copy_file_name("P001", "BDI", ".xlsx", 1, 1) == "P001_BDI.xlsx");
    REQUIRE(generation::copy_file_name("P001", "BDI", ".xlsx", 2, 3) == "P001_BDI2.xlsx");
    REQUIRE(generation::resolve_survey_name({"", "t.xlsx", 1}, 2) == "survey_3");
}

TEST_CASE("generate_three_copies_of_one_template") {
    ScratchDir dir("gen_three");
    auto tpl = dir.write("templates/diary.docx", "template");

    auto r = generation::generate_participant_folder(
        "P001", dir.path() / "out", {{"Diary", tpl.string(), 3}});

    REQUIRE(r.folder == dir.path() / "out" / "P001");
    REQUIRE(r.files.size() == 3);
    for (int n = 1; n <= 3; ++n) {
        REQUIRE(fs::exists(r.folder / ("P001_Diary" + std::to_string(n) + ".docx")));
    }
    REQUIRE_FALSE(fs::exists(r.folder / "P001_Diary.docx"));
}

TEST_CASE("generate_single_copy_has_no_number") {
    ScratchDir dir("gen_single");
    auto tpl = dir.write("bdi.xlsx", "bdi");

    auto r = generation::generate_participant_folder("P001", dir.path(), {{"BDI", tpl.string(), 1}});
    REQUIRE(r.files.size() == 1);
    REQUIRE(r.files[0] == dir.path() / "P001" / "P001_BDI.xlsx");
}

TEST_CASE("regenerating_replaces_previous_folder_contents") {
    ScratchDir dir("gen_regen");
    auto tpl = dir.write("a.txt", "a");
    dir.write("out/P001/stale.txt", "old");

    auto r = generation::generate_participant_folder("P001", dir.path() / "out",
                                                     {{"A", tpl.string(), 1}});
    std::vector<std::string> names;
    for (const auto& e : fs::directory_iterator(r.folder)) {
        names.push_back(e.path().filename().string());
    }
    REQUIRE(names == std::vector<std::string>{"P001_A.txt"});
}

TEST_CASE("generation_validates_before_touching_disk") {
    ScratchDir dir("gen_validate");
    dir.write("out/P001/keep.txt", "keep");
    auto tpl = dir.write("a.txt", "a");
    const auto out = dir.path() / "out";

    REQUIRE_THROWS_AS(generation::generate_participant_folder("", out, {{"A", tpl.string(), 1}}),
                      ValidationError);
    REQUIRE_THROWS_AS(generation::generate_participant_folder("P001", "", {{"A", tpl.string(), 1}}),
                      ValidationError);
    REQUIRE_THROWS_AS(generation::generate_participant_folder("P001", out, {}), ValidationError);
    REQUIRE_THROWS_AS(generation::generate_participant_folder(
                          "P001", out, {{"A", (dir.path() / "missing.txt").string(), 1}}),
                      ValidationError);
    REQUIRE_THROWS_AS(generation::generate_participant_folder("../x", out, {{"A", tpl.string(), 1}}),
                      ValidationError);

    REQUIRE(fs::exists(out / "P001" / "keep.txt"));
}

TEST_CASE("rows_without_template_are_skipped") {
    ScratchDir dir("gen_skip");
    auto tpl = dir.write("a.txt", "a");

    auto r = generation::generate_participant_folder(
        "P001", dir.path(), {{"Empty", "", 2}, {"", tpl.string(), 1}});
    REQUIRE(r.files.size() == 1);
    REQUIRE(r.files[0].filename().string() == "P001_survey_2.txt");
}

TEST_CASE("batch_generation_continues_after_failure") {
    ScratchDir dir("gen_batch");
    auto tpl = dir.write("a.txt", "a");

    std::ostringstream log;
    survey_workbench::core::EventEmitter events(&log);
    auto report = generation::generate_batch({"P001", "bad/id", "P002"}, dir.path() / "out",
                                             {{"A", tpl.string(), 1}}, &events);

    REQUIRE(report.total == 3);
    REQUIRE(report.succeeded == std::vector<std::string>{"P001", "P002"});
    REQUIRE(report.failed.size() == 1);
    REQUIRE(report.failed[0].participant_id == "bad/id");
    REQUIRE(fs::exists(dir.path() / "out" / "P002" / "P002_A.txt"));
    REQUIRE(log.str().find("\"participant_end\"") != std::string::npos);
}

TEST_CASE("batch_generation_requires_ids") {
    ScratchDir dir("gen_batch_empty");
    REQUIRE_THROWS_AS(generation::generate_batch({}, dir.path(), {}), ValidationError);
}
