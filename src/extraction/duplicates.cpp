#include "survey_workbench/extraction/duplicates.hpp"
#include "survey_workbench/core/types.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/io/csv_io.hpp"
#include "survey_workbench/io/workbook.hpp"

namespace survey_workbench::extraction {

bool csv_contains_participant(const fs::path& masterfile, const std::string& participant_id) {
    const io::CsvTable table = io::read_csv_table(masterfile);
    const int col = table.column_index(kParticipantIdField);
    if (col < 0) {
        return false;
    }

    for (const auto& row : table.rows) {
        if (static_cast<size_t>(col) < row.size() && row[col] == participant_id) {
            return true;
        }
    }
    return false;
}

bool workbook_contains_participant(const fs::path& masterfile, const std::string& participant_id,
                                   const DuplicateScanOptions& options) {
    const io::Workbook wb = io::Workbook::load(masterfile);
    const io::Worksheet& ws = wb.sheet(0);

    for (const auto& value : ws.column_values(1, options.first_row, options.last_row)) {
        if (core::trim(value) == participant_id) {
            return true;
        }
    }
    return false;
}

bool check_duplicate(const std::string& participant_id, const fs::path& masterfile,
                     const DuplicateScanOptions& options) {
    if (masterfile.empty() || !fs::exists(masterfile)) {
        return false;
    }

    switch (detect_masterfile_format(masterfile)) {
        case MasterfileFormat::CSV:
            return csv_contains_participant(masterfile, participant_id);
        case MasterfileFormat::WORKBOOK:
            return workbook_contains_participant(masterfile, participant_id, options);
        default:
            return false;
    }
}

} // namespace survey_workbench::extraction
