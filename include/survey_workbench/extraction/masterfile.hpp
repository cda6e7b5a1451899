#pragma once

#include "survey_workbench/core/types.hpp"
#include "survey_workbench/extraction/duplicates.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::extraction {

namespace fs = std::filesystem;

struct CsvAppendResult {
    std::vector<std::string> header;
    bool header_written = false;
};

/**
 * Append a record to a CSV masterfile.
 *
 * The column set is the existing header followed by any new record keys.
 * A header is written only when the file is new or empty; earlier rows are
 * never rewritten. Fields the record does not have are left blank.
 */
CsvAppendResult append_csv_record(const fs::path& path, const ParticipantRecord& record);

struct WorkbookAppendResult {
    fs::path saved_path;
    std::string sheet;
    int row = 0;
    bool header_written = false;
    bool retargeted = false;
};

// Same stem with the legacy .xls extension
fs::path legacy_workbook_path(const fs::path& path);

/**
 * Append a record to a workbook masterfile.
 *
 * Uses the sheet named data_sheet, else the first sheet. The participant id
 * goes to column A of the first empty row, remaining fields follow in
 * lexicographic key order. When A1 is empty row 1 receives the header and
 * the record lands on the first empty row below it. Non-.xls paths are saved as a .xls copy, which
 * is reported in saved_path.
 */
WorkbookAppendResult append_workbook_record(const fs::path& path, const ParticipantRecord& record,
                                            const std::string& data_sheet = "Data");

/**
 * The cumulative table extraction writes to. Tracks its own path because a
 * workbook append may move it to a .xls sibling.
 */
class Masterfile {
public:
    Masterfile(fs::path path, std::string data_sheet = "Data",
               DuplicateScanOptions scan = {});

    const fs::path& path() const { return path_; }
    MasterfileFormat format() const { return format_; }

    bool contains(const std::string& participant_id) const;

    // Returns the path the record was written to
    fs::path append(const ParticipantRecord& record);

private:
    fs::path path_;
    MasterfileFormat format_;
    std::string data_sheet_;
    DuplicateScanOptions scan_;
};

} // namespace survey_workbench::extraction
