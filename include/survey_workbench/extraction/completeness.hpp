#pragma once

#include "survey_workbench/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::extraction {

namespace fs = std::filesystem;

/**
 * Check that a participant folder holds the expected number of exports.
 *
 * Only file names are inspected: an export with no rows still counts as
 * present. expected_count <= 0 means the count is unknown and any non-zero
 * number of exports is complete.
 */
CompletenessReport check_data_completeness(const std::string& participant_id,
                                           const fs::path& source_dir,
                                           int expected_count,
                                           const std::string& extract_suffix = kExtractSuffix);

struct MissingDataEntry {
    std::string participant_id;
    CompletenessReport report;
};

struct MissingDataReport {
    std::vector<MissingDataEntry> entries;
    int complete_count = 0;
    int incomplete_count = 0;

    int total() const { return static_cast<int>(entries.size()); }
    std::string summary() const;
    std::vector<std::string> lines() const;
};

// Completeness of every participant folder below source_dir, sorted by name
MissingDataReport generate_missing_data_report(const fs::path& source_dir,
                                               int expected_count,
                                               const std::string& extract_suffix = kExtractSuffix);

} // namespace survey_workbench::extraction
