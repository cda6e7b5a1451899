#include "survey_workbench/extraction/extraction.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/extraction/completeness.hpp"

#include <utility>

namespace survey_workbench::extraction {

ExtractionSettings ExtractionSettings::from_config(const config::Config& cfg) {
    ExtractionSettings s;
    s.source_dir = cfg.extraction.source_path;
    s.masterfile_path = cfg.extraction.masterfile_path;
    s.expected_count = cfg.expected_survey_count();
    s.data_sheet = cfg.extraction.data_sheet;
    s.merge.extract_suffix = cfg.extraction.extract_suffix;
    s.merge.ignored_column = cfg.extraction.ignored_column;
    s.scan.first_row = cfg.extraction.duplicate_scan_first_row;
    s.scan.last_row = cfg.extraction.duplicate_scan_last_row;
    return s;
}

Extractor::Extractor(ExtractionSettings settings, core::EventEmitter* events)
    : settings_(std::move(settings)),
      masterfile_(settings_.masterfile_path, settings_.data_sheet, settings_.scan),
      events_(events) {}

bool Extractor::check_duplicate(const std::string& participant_id) {
    try {
        return masterfile_.contains(participant_id);
    } catch (const IOError& e) {
        if (events_) {
            events_->warning(std::string("Duplicate check skipped: ") + e.what(),
                             {{"participant_id", participant_id},
                              {"masterfile", masterfile_.path().string()}});
        }
        return false;
    }
}

CompletenessReport Extractor::check_completeness(const std::string& participant_id) const {
    return check_data_completeness(participant_id, settings_.source_dir,
                                   settings_.expected_count, settings_.merge.extract_suffix);
}

ParticipantRecord Extractor::preview(const std::string& participant_id) const {
    return prepare_participant_record(participant_id, settings_.source_dir, settings_.merge);
}

ExtractionOutcome Extractor::extract(const std::string& participant_id, bool force) {
    const std::string pid = core::trim(participant_id);
    if (pid.empty()) {
        throw ValidationError("Please enter a participant ID!");
    }

    ExtractionOutcome outcome;
    outcome.participant_id = pid;
    if (events_) events_->participant_start(pid, "extract");

    outcome.duplicate = check_duplicate(pid);
    if (outcome.duplicate && !force) {
        outcome.status = ExtractionStatus::DUPLICATE;
        if (events_) events_->participant_end(pid, "extract", "duplicate");
        return outcome;
    }

    outcome.completeness = check_completeness(pid);
    if (!outcome.completeness.complete && !force) {
        outcome.status = ExtractionStatus::INCOMPLETE;
        if (events_) {
            events_->participant_end(pid, "extract", "incomplete",
                                     {{"issues", outcome.completeness.issues}});
        }
        return outcome;
    }

    outcome.record = preview(pid);
    outcome.written_to = masterfile_.append(outcome.record);
    outcome.status = ExtractionStatus::EXTRACTED;

    if (events_) {
        events_->participant_end(pid, "extract", "ok",
                                 {{"fields", static_cast<int>(outcome.record.size())},
                                  {"masterfile", outcome.written_to.string()}});
    }
    return outcome;
}

BatchReport Extractor::extract_batch(const std::vector<std::string>& participant_ids) {
    if (participant_ids.empty()) {
        throw ValidationError("Please enter at least one participant ID!");
    }

    BatchReport report;
    report.total = static_cast<int>(participant_ids.size());

    for (const auto& pid : participant_ids) {
        if (events_) events_->participant_start(pid, "extract");

        try {
            if (check_duplicate(pid)) {
                report.duplicates.push_back(pid);
                if (events_) events_->participant_end(pid, "extract", "duplicate");
                continue;
            }

            CompletenessReport completeness = check_completeness(pid);
            if (!completeness.complete) {
                report.incomplete.push_back({pid, core::join(completeness.issues, ", ")});
                if (events_) {
                    events_->participant_end(pid, "extract", "incomplete",
                                             {{"issues", completeness.issues}});
                }
                continue;
            }

            ParticipantRecord record = preview(pid);
            fs::path written = masterfile_.append(record);
            report.succeeded.push_back(pid);
            if (events_) {
                events_->participant_end(pid, "extract", "ok",
                                         {{"fields", static_cast<int>(record.size())},
                                          {"masterfile", written.string()}});
            }
        } catch (const std::exception& e) {
            report.failed.push_back({pid, e.what()});
            if (events_) events_->participant_end(pid, "extract", "failed", {{"error", e.what()}});
        }
    }

    return report;
}

} // namespace survey_workbench::extraction
