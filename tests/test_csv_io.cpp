#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/io/csv_io.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using survey_workbench::CsvError;
using survey_workbench::test::ScratchDir;
namespace io = survey_workbench::io;

TEST_CASE("parse_csv_handles_quotes_and_line_endings") {
    auto rows = io::parse_csv("a,\"b,c\",\"say \"\"hi\"\"\"\r\n1,\"two\nlines\",3\r\n\r\nx\n");
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0] == io::CsvRow{"a", "b,c", "say \"hi\""});
    REQUIRE(rows[1] == io::CsvRow{"1", "two\nlines", "3"});
    REQUIRE(rows[2] == io::CsvRow{"x"});
}

TEST_CASE("parse_csv_keeps_empty_fields") {
    auto rows = io::parse_csv("a,,c,\n");
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0] == io::CsvRow{"a", "", "c", ""});
}

TEST_CASE("parse_csv_rejects_unterminated_quote") {
    REQUIRE_THROWS_AS(io::parse_csv("a,\"open\n"), CsvError);
}

TEST_CASE("read_csv_table_strips_bom_and_splits_header") {
    ScratchDir dir("csv_table");
    auto p = dir.write("t.csv", "\xEF\xBB\xBFparticipant_id,score\r\nP001,5\r\n");

    io::CsvTable t = io::read_csv_table(p);
    REQUIRE(t.header == std::vector<std::string>{"participant_id", "score"});
    REQUIRE(t.rows.size() == 1);
    REQUIRE(t.column_index("participant_id") == 0);
    REQUIRE(t.column_index("missing") == -1);
}

TEST_CASE("read_csv_header_is_empty_for_missing_file") {
    ScratchDir dir("csv_header");
    REQUIRE(io::read_csv_header(dir.path() / "nope.csv").empty());
}

TEST_CASE("format_csv_row_quotes_minimally") {
    REQUIRE(io::format_csv_row({"plain", "a,b", "q\"", ""}) == "plain,\"a,b\",\"q\"\"\",\r\n");
    REQUIRE(io::csv_escape("line\nbreak") == "\"line\nbreak\"");
}
