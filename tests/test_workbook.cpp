#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/io/workbook.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using survey_workbench::MasterfileError;
using survey_workbench::test::ScratchDir;
namespace io = survey_workbench::io;

TEST_CASE("worksheet_first_empty_row_scans_from_top") {
    io::Worksheet ws("Data");
    REQUIRE(ws.first_empty_row(1) == 1);
    ws.set_cell(1, 1, "h");
    ws.set_cell(2, 1, "x");
    ws.set_cell(4, 1, "y");
    REQUIRE(ws.first_empty_row(1) == 3);
    ws.set_cell(2, 1, "");
    REQUIRE(ws.is_empty(2, 1));
    REQUIRE(ws.first_empty_row(1) == 2);
    REQUIRE(ws.max_row() == 4);
    REQUIRE(ws.first_empty_row(1, 4) == 5);
    REQUIRE(ws.first_empty_row(1, 3) == 3);
}

TEST_CASE("workbook_save_and_load_keeps_cells_and_sheets") {
    ScratchDir dir("wb_io");
    const auto path = dir.path() / "book.xls";

    io::Workbook wb = io::Workbook::create("Data");
    wb.sheet(0).set_cell(1, 1, "participant_id");
    wb.sheet(0).set_cell(2, 1, "P001");
    wb.sheet(0).set_cell(2, 5, "a <b> & \"c\"");
    wb.add_sheet("Notes").set_cell(3, 2, "note");
    wb.save(path);

    io::Workbook loaded = io::Workbook::load(path);
    REQUIRE(loaded.sheet_names() == std::vector<std::string>{"Data", "Notes"});
    REQUIRE(loaded.sheet(0).cell(2, 1) == "P001");
    REQUIRE(loaded.sheet(0).cell(2, 5) == "a <b> & \"c\"");
    REQUIRE(loaded.sheet(0).is_empty(2, 2));
    REQUIRE(loaded.find_sheet("Notes")->cell(3, 2) == "note");
    REQUIRE(loaded.find_sheet("Missing") == nullptr);
}

TEST_CASE("workbook_load_rejects_foreign_files") {
    ScratchDir dir("wb_bad");
    REQUIRE_THROWS_AS(io::Workbook::load(dir.path() / "none.xls"), MasterfileError);
    REQUIRE_THROWS_AS(io::Workbook::load(dir.write("plain.xml", "<root/>")), MasterfileError);
    REQUIRE_THROWS_AS(io::Workbook::load(dir.write("broken.xls", "<Workbook")), MasterfileError);
}

TEST_CASE("workbook_sheet_index_out_of_range_throws") {
    io::Workbook wb = io::Workbook::create();
    REQUIRE(wb.sheet_count() == 1);
    REQUIRE_THROWS_AS(wb.sheet(1), MasterfileError);
}
