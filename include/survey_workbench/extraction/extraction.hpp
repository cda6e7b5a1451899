#pragma once

#include "survey_workbench/config/configuration.hpp"
#include "survey_workbench/core/events.hpp"
#include "survey_workbench/core/types.hpp"
#include "survey_workbench/extraction/duplicates.hpp"
#include "survey_workbench/extraction/field_merger.hpp"
#include "survey_workbench/extraction/masterfile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::extraction {

namespace fs = std::filesystem;

struct ExtractionSettings {
    fs::path source_dir;
    fs::path masterfile_path;
    int expected_count = 0; // 0: unknown
    std::string data_sheet = "Data";
    MergeOptions merge;
    DuplicateScanOptions scan;

    static ExtractionSettings from_config(const config::Config& cfg);
};

enum class ExtractionStatus {
    EXTRACTED,
    DUPLICATE,
    INCOMPLETE
};

inline std::string extraction_status_to_string(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::EXTRACTED: return "extracted";
        case ExtractionStatus::DUPLICATE: return "duplicate";
        case ExtractionStatus::INCOMPLETE: return "incomplete";
        default: return "unknown";
    }
}

struct ExtractionOutcome {
    std::string participant_id; // trimmed
    ExtractionStatus status = ExtractionStatus::EXTRACTED;
    bool duplicate = false;
    CompletenessReport completeness;
    ParticipantRecord record;
    fs::path written_to;
};

/**
 * Drives extraction of participants into one masterfile.
 *
 * Duplicate and completeness checks are advisory. A single extraction stops
 * at the first failed check unless forced; a batch skips such participants
 * and records them in the report.
 */
class Extractor {
public:
    explicit Extractor(ExtractionSettings settings, core::EventEmitter* events = nullptr);

    // Current masterfile path; moves to a .xls sibling after a workbook save
    const fs::path& masterfile_path() const { return masterfile_.path(); }

    // Read errors are reported as a warning and count as "not a duplicate"
    bool check_duplicate(const std::string& participant_id);

    CompletenessReport check_completeness(const std::string& participant_id) const;

    // The record extraction would append, without writing anything
    ParticipantRecord preview(const std::string& participant_id) const;

    ExtractionOutcome extract(const std::string& participant_id, bool force);

    BatchReport extract_batch(const std::vector<std::string>& participant_ids);

private:
    ExtractionSettings settings_;
    Masterfile masterfile_;
    core::EventEmitter* events_;
};

} // namespace survey_workbench::extraction
