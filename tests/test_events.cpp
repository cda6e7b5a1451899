#include "survey_workbench/core/events.hpp"
#include "survey_workbench/core/report.hpp"
#include "survey_workbench/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using json = nlohmann::json;
namespace core = survey_workbench::core;

TEST_CASE("events_are_json_lines_with_run_id_and_timestamp") {
    std::ostringstream out;
    core::EventEmitter events(&out, nullptr, "run_1");
    events.run_start("extract", {{"mode", "batch"}});
    events.participant_end("P001", "extract", "ok", {{"fields", 3}});

    auto lines = core::split(out.str(), '\n');
    REQUIRE(lines.size() >= 2);

    json start = json::parse(lines[0]);
    REQUIRE(start["type"] == "run_start");
    REQUIRE(start["run_id"] == "run_1");
    REQUIRE(start["command"] == "extract");
    REQUIRE(start["mode"] == "batch");
    REQUIRE(start.contains("ts"));

    json end = json::parse(lines[1]);
    REQUIRE(end["type"] == "participant_end");
    REQUIRE(end["status"] == "ok");
    REQUIRE(end["fields"] == 3);
}

TEST_CASE("batch_message_lists_skipped_and_failed_sections") {
    survey_workbench::BatchReport report;
    report.total = 4;
    report.succeeded = {"P001"};
    report.duplicates = {"P002"};
    report.incomplete = {{"P003", "Expected 3 CSV files, found 1"}};
    report.failed = {{"P004", "boom"}};

    const std::string msg = core::format_batch_message(report, "Extracted 1 of 4 participants successfully!");
    REQUIRE(msg == "Extracted 1 of 4 participants successfully!"
                   "\n\nSkipped (already in masterfile):\nP002"
                   "\n\nIncomplete data:\nP003: Expected 3 CSV files, found 1"
                   "\n\nFailed:\nP004: boom");

    json j = core::batch_report_to_json(report);
    REQUIRE(j["success_count"] == 1);
    REQUIRE(j["failed"][0]["participant_id"] == "P004");
}

TEST_CASE("record_json_starts_with_participant_id") {
    survey_workbench::ParticipantRecord record("P001");
    record.set("B_x", "1");
    record.set("A_y", "2");
    record.set("B_x", "3");

    json j = core::record_to_json(record);
    REQUIRE(j.size() == 3);
    REQUIRE(j[0]["field"] == "participant_id");
    REQUIRE(j[0]["value"] == "P001");
    REQUIRE(j[1]["field"] == "B_x");
    REQUIRE(j[1]["value"] == "3");
}

TEST_CASE("string_helpers") {
    REQUIRE(core::trim("  a b \t") == "a b");
    REQUIRE(core::parse_int_or(" 12 ", -1) == 12);
    REQUIRE(core::parse_int_or("1x", 7) == 7);
    REQUIRE(core::strip_utf8_bom("\xEF\xBB\xBFid") == "id");
}
