#include "survey_workbench/extraction/completeness.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

#include <utility>

namespace survey_workbench::extraction {

CompletenessReport check_data_completeness(const std::string& participant_id,
                                           const fs::path& source_dir,
                                           int expected_count,
                                           const std::string& extract_suffix) {
    CompletenessReport report;

    const fs::path folder = source_dir / participant_id;
    if (!fs::is_directory(folder)) {
        report.issues.push_back("Folder not found: " + folder.string());
        return report;
    }

    report.files = core::discover_files(folder, extract_suffix);
    if (report.files.empty()) {
        report.issues.push_back("No Extract Data CSV files found");
        return report;
    }

    const int found = static_cast<int>(report.files.size());
    if (expected_count > 0 && found < expected_count) {
        report.issues.push_back("Expected " + std::to_string(expected_count) +
                                " CSV files, found " + std::to_string(found));
    }

    report.complete = report.issues.empty();
    return report;
}

std::string MissingDataReport::summary() const {
    return "Summary: " + std::to_string(complete_count) + " complete, " +
           std::to_string(incomplete_count) + " incomplete (out of " +
           std::to_string(total()) + " total)";
}

std::vector<std::string> MissingDataReport::lines() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        if (e.report.complete) {
            out.push_back(e.participant_id + ": Complete (" +
                          std::to_string(e.report.files.size()) + " files)");
        } else {
            out.push_back(e.participant_id + ": INCOMPLETE - " + core::join(e.report.issues, ", "));
        }
    }
    return out;
}

MissingDataReport generate_missing_data_report(const fs::path& source_dir,
                                               int expected_count,
                                               const std::string& extract_suffix) {
    if (source_dir.empty()) {
        throw ValidationError("Please select a source folder!");
    }
    if (!fs::is_directory(source_dir)) {
        throw ValidationError("Source folder not found: " + source_dir.string());
    }

    const auto folders = core::list_subdirectories(source_dir);
    if (folders.empty()) {
        throw ValidationError("No participant folders found in source directory!");
    }

    MissingDataReport report;
    for (const auto& folder : folders) {
        MissingDataEntry entry;
        entry.participant_id = folder.filename().string();
        entry.report = check_data_completeness(entry.participant_id, source_dir,
                                               expected_count, extract_suffix);
        if (entry.report.complete) {
            ++report.complete_count;
        } else {
            ++report.incomplete_count;
        }
        report.entries.push_back(std::move(entry));
    }
    return report;
}

} // namespace survey_workbench::extraction
