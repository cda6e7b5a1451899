#include "survey_workbench/io/csv_io.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

#include <fstream>
#include <iterator>
#include <utility>

namespace survey_workbench::io {

int CsvTable::column_index(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

std::vector<CsvRow> parse_csv(const std::string& text) {
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        row.push_back(field);
        field.clear();
        field_started = false;
    };
    auto end_row = [&]() {
        // A line with nothing on it is not a record
        if (!(row.empty() && !field_started && field.empty())) {
            end_field();
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field_started && field.empty()) {
                    in_quotes = true;
                    field_started = true;
                } else {
                    field += c;
                }
                break;
            case ',':
                end_field();
                field_started = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw CsvError("unterminated quoted field");
    }
    end_row();
    return rows;
}

CsvTable read_csv_table(const fs::path& path) {
    CsvTable table;
    std::string text = core::strip_utf8_bom(core::read_text(path));
    auto rows = parse_csv(text);
    if (rows.empty()) {
        return table;
    }

    table.header = std::move(rows.front());
    table.rows.assign(std::make_move_iterator(rows.begin() + 1),
                      std::make_move_iterator(rows.end()));
    return table;
}

std::vector<std::string> read_csv_header(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || fs::file_size(path, ec) == 0) {
        return {};
    }
    return read_csv_table(path).header;
}

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) {
        return s;
    }

    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string format_csv_row(const CsvRow& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += ',';
        line += csv_escape(row[i]);
    }
    line += "\r\n";
    return line;
}

void append_csv_rows(const fs::path& path, const std::vector<CsvRow>& rows) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        throw IOError("Cannot open for append: " + path.string());
    }
    for (const auto& row : rows) {
        out << format_csv_row(row);
    }
    out.flush();
    if (!out) {
        throw IOError("Cannot write file: " + path.string());
    }
}

} // namespace survey_workbench::io
