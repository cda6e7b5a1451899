#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace survey_workbench::io {

namespace fs = std::filesystem;

// Sparse grid of text cells, rows and columns are 1-based
class Worksheet {
public:
    Worksheet() = default;
    explicit Worksheet(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    std::string cell(int row, int col) const;
    void set_cell(int row, int col, const std::string& value);
    bool is_empty(int row, int col) const;

    // Linear scan downward from from_row for the first empty cell in a column
    int first_empty_row(int col, int from_row = 1) const;

    // Non-empty cell values of one column between two rows (inclusive)
    std::vector<std::string> column_values(int col, int first_row, int last_row) const;

    int max_row() const;

    const std::map<std::pair<int, int>, std::string>& cells() const { return cells_; }

private:
    std::string name_;
    std::map<std::pair<int, int>, std::string> cells_;
};

/**
 * Workbook stored as an Excel 2003 XML Spreadsheet (SpreadsheetML).
 * Only cell text is carried; styles and formulas are not preserved.
 */
class Workbook {
public:
    // New workbook with a single sheet
    static Workbook create(const std::string& sheet_name = "Data");
    static Workbook load(const fs::path& path);

    void save(const fs::path& path) const;

    std::vector<std::string> sheet_names() const;
    size_t sheet_count() const { return sheets_.size(); }

    Worksheet& sheet(size_t index);
    const Worksheet& sheet(size_t index) const;

    // nullptr when no sheet has that name
    Worksheet* find_sheet(const std::string& name);

    Worksheet& add_sheet(const std::string& name);

private:
    std::vector<Worksheet> sheets_;
};

} // namespace survey_workbench::io
