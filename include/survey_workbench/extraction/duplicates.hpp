#pragma once

#include <filesystem>
#include <string>

namespace survey_workbench::extraction {

namespace fs = std::filesystem;

// Cell range of the first column searched in workbook masterfiles
struct DuplicateScanOptions {
    int first_row = 2;
    int last_row = 1000;
};

// Exact match in the participant_id column of a CSV masterfile
bool csv_contains_participant(const fs::path& masterfile, const std::string& participant_id);

// Trimmed match in column A of the first sheet, within the scan range
bool workbook_contains_participant(const fs::path& masterfile, const std::string& participant_id,
                                   const DuplicateScanOptions& options = {});

/**
 * Advisory duplicate check; callers may append regardless.
 * A missing masterfile or an unsupported extension holds no duplicates.
 * Throws IOError when an existing masterfile cannot be read.
 */
bool check_duplicate(const std::string& participant_id, const fs::path& masterfile,
                     const DuplicateScanOptions& options = {});

} // namespace survey_workbench::extraction
