#include "survey_workbench/io/workbook.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

#include <QByteArray>
#include <QLatin1String>
#include <QString>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <algorithm>

namespace survey_workbench::io {

namespace {

const QString kSpreadsheetNs = QStringLiteral("urn:schemas-microsoft-com:office:spreadsheet");

// ss:Index style attribute, falling back to an unprefixed one
QString attribute(const QXmlStreamReader& reader, const char* name) {
    const QXmlStreamAttributes attrs = reader.attributes();
    const QString local = QLatin1String(name);
    if (attrs.hasAttribute(kSpreadsheetNs, local)) {
        return attrs.value(kSpreadsheetNs, local).toString();
    }
    return attrs.value(local).toString();
}

int index_attribute(const QXmlStreamReader& reader, const char* name, int fallback) {
    const QString raw = attribute(reader, name);
    if (raw.isEmpty()) return fallback;
    bool ok = false;
    const int v = raw.toInt(&ok);
    return (ok && v > 0) ? v : fallback;
}

void read_row(QXmlStreamReader& reader, Worksheet& ws, int row) {
    int col = 1;
    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("Cell")) {
            reader.skipCurrentElement();
            continue;
        }

        col = index_attribute(reader, "Index", col);
        const int merge_across = index_attribute(reader, "MergeAcross", 0);

        while (reader.readNextStartElement()) {
            if (reader.name() == QLatin1String("Data")) {
                const QString text =
                    reader.readElementText(QXmlStreamReader::IncludeChildElements);
                ws.set_cell(row, col, text.toStdString());
            } else {
                reader.skipCurrentElement();
            }
        }
        col += 1 + merge_across;
    }
}

void read_table(QXmlStreamReader& reader, Worksheet& ws) {
    int row = 1;
    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("Row")) {
            reader.skipCurrentElement();
            continue;
        }
        row = index_attribute(reader, "Index", row);
        read_row(reader, ws, row);
        ++row;
    }
}

} // namespace

std::string Worksheet::cell(int row, int col) const {
    auto it = cells_.find({row, col});
    return it == cells_.end() ? std::string() : it->second;
}

void Worksheet::set_cell(int row, int col, const std::string& value) {
    if (value.empty()) {
        cells_.erase({row, col});
        return;
    }
    cells_[{row, col}] = value;
}

bool Worksheet::is_empty(int row, int col) const {
    return cells_.find({row, col}) == cells_.end();
}

int Worksheet::first_empty_row(int col, int from_row) const {
    int row = std::max(from_row, 1);
    while (!is_empty(row, col)) {
        ++row;
    }
    return row;
}

std::vector<std::string> Worksheet::column_values(int col, int first_row, int last_row) const {
    std::vector<std::string> values;
    for (const auto& [pos, value] : cells_) {
        if (pos.second == col && pos.first >= first_row && pos.first <= last_row) {
            values.push_back(value);
        }
    }
    return values;
}

int Worksheet::max_row() const {
    int m = 0;
    for (const auto& entry : cells_) {
        m = std::max(m, entry.first.first);
    }
    return m;
}

Workbook Workbook::create(const std::string& sheet_name) {
    Workbook wb;
    wb.add_sheet(sheet_name);
    return wb;
}

Workbook Workbook::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw MasterfileError("Workbook not found: " + path.string());
    }

    const std::string raw = core::read_text(path);
    QXmlStreamReader reader(QByteArray(raw.data(), static_cast<int>(raw.size())));

    Workbook wb;
    if (!reader.readNextStartElement() || reader.name() != QLatin1String("Workbook") ||
        reader.namespaceUri() != kSpreadsheetNs) {
        throw MasterfileError("Not an XML Spreadsheet workbook: " + path.string());
    }

    while (reader.readNextStartElement()) {
        if (reader.name() != QLatin1String("Worksheet")) {
            reader.skipCurrentElement();
            continue;
        }

        Worksheet& ws = wb.add_sheet(attribute(reader, "Name").toStdString());
        while (reader.readNextStartElement()) {
            if (reader.name() == QLatin1String("Table")) {
                read_table(reader, ws);
            } else {
                reader.skipCurrentElement();
            }
        }
    }

    if (reader.hasError()) {
        throw MasterfileError("Malformed workbook " + path.string() + ": " +
                              reader.errorString().toStdString());
    }
    if (wb.sheets_.empty()) {
        throw MasterfileError("Workbook has no worksheets: " + path.string());
    }
    return wb;
}

void Workbook::save(const fs::path& path) const {
    QByteArray buffer;
    QXmlStreamWriter writer(&buffer);
    writer.setAutoFormatting(true);
    writer.writeStartDocument();
    writer.writeProcessingInstruction(QStringLiteral("mso-application"),
                                      QStringLiteral("progid=\"Excel.Sheet\""));

    writer.writeStartElement(QStringLiteral("Workbook"));
    writer.writeDefaultNamespace(kSpreadsheetNs);
    writer.writeNamespace(kSpreadsheetNs, QStringLiteral("ss"));

    for (const auto& ws : sheets_) {
        writer.writeStartElement(QStringLiteral("Worksheet"));
        writer.writeAttribute(kSpreadsheetNs, QStringLiteral("Name"),
                              QString::fromStdString(ws.name()));
        writer.writeStartElement(QStringLiteral("Table"));

        int current_row = 0;
        for (const auto& [pos, value] : ws.cells()) {
            if (pos.first != current_row) {
                if (current_row != 0) writer.writeEndElement(); // Row
                current_row = pos.first;
                writer.writeStartElement(QStringLiteral("Row"));
                writer.writeAttribute(kSpreadsheetNs, QStringLiteral("Index"),
                                      QString::number(current_row));
            }
            writer.writeStartElement(QStringLiteral("Cell"));
            writer.writeAttribute(kSpreadsheetNs, QStringLiteral("Index"),
                                  QString::number(pos.second));
            writer.writeStartElement(QStringLiteral("Data"));
            writer.writeAttribute(kSpreadsheetNs, QStringLiteral("Type"),
                                  QStringLiteral("String"));
            writer.writeCharacters(QString::fromStdString(value));
            writer.writeEndElement(); // Data
            writer.writeEndElement(); // Cell
        }
        if (current_row != 0) writer.writeEndElement(); // Row

        writer.writeEndElement(); // Table
        writer.writeEndElement(); // Worksheet
    }

    writer.writeEndElement(); // Workbook
    writer.writeEndDocument();

    if (writer.hasError()) {
        throw MasterfileError("Cannot serialise workbook: " + path.string());
    }
    core::write_text(path, std::string(buffer.constData(), static_cast<size_t>(buffer.size())));
}

std::vector<std::string> Workbook::sheet_names() const {
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& ws : sheets_) {
        names.push_back(ws.name());
    }
    return names;
}

Worksheet& Workbook::sheet(size_t index) {
    if (index >= sheets_.size()) {
        throw MasterfileError("Worksheet index out of range: " + std::to_string(index));
    }
    return sheets_[index];
}

const Worksheet& Workbook::sheet(size_t index) const {
    if (index >= sheets_.size()) {
        throw MasterfileError("Worksheet index out of range: " + std::to_string(index));
    }
    return sheets_[index];
}

Worksheet* Workbook::find_sheet(const std::string& name) {
    for (auto& ws : sheets_) {
        if (ws.name() == name) return &ws;
    }
    return nullptr;
}

Worksheet& Workbook::add_sheet(const std::string& name) {
    sheets_.emplace_back(name);
    return sheets_.back();
}

} // namespace survey_workbench::io
