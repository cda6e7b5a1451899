#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::io {

namespace fs = std::filesystem;

using CsvRow = std::vector<std::string>;

// Header plus data rows of a comma-delimited file
struct CsvTable {
    std::vector<std::string> header;
    std::vector<CsvRow> rows;

    // Index of a header column, or -1
    int column_index(const std::string& name) const;
};

// Parse comma-delimited text.
// - Quoted fields may contain commas, doubled quotes and line breaks.
// - CRLF, LF and CR line endings are accepted.
// - Blank lines are skipped.
std::vector<CsvRow> parse_csv(const std::string& text);

// Read a CSV file; the first row becomes the header. A UTF-8 BOM is ignored.
// An empty file yields an empty table.
CsvTable read_csv_table(const fs::path& path);

// Header row only, empty for a missing or empty file
std::vector<std::string> read_csv_header(const fs::path& path);

// Quote a cell if it contains a comma, quote, CR or LF. Quotes are doubled.
std::string csv_escape(const std::string& s);

// One CRLF-terminated line
std::string format_csv_row(const CsvRow& row);

// Append rows to a file, creating it if needed
void append_csv_rows(const fs::path& path, const std::vector<CsvRow>& rows);

} // namespace survey_workbench::io
