#include "survey_workbench/extraction/masterfile.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/io/csv_io.hpp"
#include "survey_workbench/io/workbook.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <utility>

namespace survey_workbench::extraction {

namespace {

bool file_has_content(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

bool ends_with_newline(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in || in.tellg() <= 0) {
        return true;
    }
    in.seekg(-1, std::ios::end);
    char last = 0;
    in.get(last);
    return last == '\n' || last == '\r';
}

} // namespace

CsvAppendResult append_csv_record(const fs::path& path, const ParticipantRecord& record) {
    CsvAppendResult result;

    const bool has_content = file_has_content(path);
    if (has_content) {
        result.header = io::read_csv_header(path);
    }

    std::set<std::string> known(result.header.begin(), result.header.end());
    for (const auto& key : record.keys()) {
        if (known.insert(key).second) {
            result.header.push_back(key);
        }
    }

    io::CsvRow row;
    row.reserve(result.header.size());
    for (const auto& column : result.header) {
        row.push_back(record.value_for(column));
    }

    std::vector<io::CsvRow> lines;
    if (!has_content) {
        lines.push_back(result.header);
        result.header_written = true;
    } else if (!ends_with_newline(path)) {
        // Keep the new row off an unterminated last line
        lines.push_back({});
    }
    lines.push_back(std::move(row));

    io::append_csv_rows(path, lines);
    return result;
}

fs::path legacy_workbook_path(const fs::path& path) {
    fs::path out = path;
    out.replace_extension(".xls");
    return out;
}

WorkbookAppendResult append_workbook_record(const fs::path& path, const ParticipantRecord& record,
                                            const std::string& data_sheet) {
    WorkbookAppendResult result;

    io::Workbook wb = fs::exists(path) ? io::Workbook::load(path)
                                       : io::Workbook::create(data_sheet);

    io::Worksheet* ws = wb.find_sheet(data_sheet);
    if (!ws) {
        ws = &wb.sheet(0);
    }
    result.sheet = ws->name();

    std::vector<std::pair<std::string, std::string>> sorted = record.fields();
    std::sort(sorted.begin(), sorted.end());

    int row = ws->first_empty_row(1);
    if (row == 1) {
        ws->set_cell(1, 1, kParticipantIdField);
        for (size_t i = 0; i < sorted.size(); ++i) {
            ws->set_cell(1, static_cast<int>(i) + 2, sorted[i].first);
        }
        result.header_written = true;
        // Row 1 may be blank above existing data
        row = ws->first_empty_row(1, 2);
    }

    ws->set_cell(row, 1, record.participant_id());
    for (size_t i = 0; i < sorted.size(); ++i) {
        ws->set_cell(row, static_cast<int>(i) + 2, sorted[i].second);
    }
    result.row = row;

    if (core::to_lower(path.extension().string()) == ".xls") {
        result.saved_path = path;
    } else {
        result.saved_path = legacy_workbook_path(path);
        result.retargeted = true;
    }
    wb.save(result.saved_path);
    return result;
}

Masterfile::Masterfile(fs::path path, std::string data_sheet, DuplicateScanOptions scan)
    : path_(std::move(path)),
      format_(detect_masterfile_format(path_)),
      data_sheet_(std::move(data_sheet)),
      scan_(scan) {
    if (path_.empty()) {
        throw ValidationError("Please select a masterfile!");
    }
    if (format_ == MasterfileFormat::UNSUPPORTED) {
        throw ValidationError("Unsupported file format! Please use .csv, .xls, or .xlsx");
    }
}

bool Masterfile::contains(const std::string& participant_id) const {
    return check_duplicate(participant_id, path_, scan_);
}

fs::path Masterfile::append(const ParticipantRecord& record) {
    if (format_ == MasterfileFormat::CSV) {
        append_csv_record(path_, record);
        return path_;
    }

    WorkbookAppendResult r = append_workbook_record(path_, record, data_sheet_);
    if (r.retargeted) {
        path_ = r.saved_path;
    }
    return r.saved_path;
}

} // namespace survey_workbench::extraction
