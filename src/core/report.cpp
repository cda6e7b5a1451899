#include "survey_workbench/core/report.hpp"

namespace survey_workbench::core {

using json = nlohmann::json;

std::string format_batch_message(const BatchReport& report, const std::string& headline) {
    std::string msg = headline;

    if (!report.duplicates.empty()) {
        msg += "\n\nSkipped (already in masterfile):";
        for (const auto& pid : report.duplicates) {
            msg += "\n" + pid;
        }
    }
    if (!report.incomplete.empty()) {
        msg += "\n\nIncomplete data:";
        for (const auto& f : report.incomplete) {
            msg += "\n" + f.participant_id + ": " + f.message;
        }
    }
    if (!report.failed.empty()) {
        msg += "\n\nFailed:";
        for (const auto& f : report.failed) {
            msg += "\n" + f.participant_id + ": " + f.message;
        }
    }
    return msg;
}

static json failures_to_json(const std::vector<ParticipantFailure>& failures) {
    json arr = json::array();
    for (const auto& f : failures) {
        arr.push_back({{"participant_id", f.participant_id}, {"message", f.message}});
    }
    return arr;
}

json batch_report_to_json(const BatchReport& report) {
    json j;
    j["total"] = report.total;
    j["success_count"] = report.success_count();
    j["succeeded"] = report.succeeded;
    j["duplicates"] = report.duplicates;
    j["incomplete"] = failures_to_json(report.incomplete);
    j["failed"] = failures_to_json(report.failed);
    return j;
}

json completeness_to_json(const CompletenessReport& report) {
    json j;
    j["complete"] = report.complete;
    j["issues"] = report.issues;
    j["files"] = json::array();
    for (const auto& f : report.files) {
        j["files"].push_back(f.filename().string());
    }
    return j;
}

json record_to_json(const ParticipantRecord& record) {
    json fields = json::array();
    fields.push_back({{"field", kParticipantIdField}, {"value", record.participant_id()}});
    for (const auto& [key, value] : record.fields()) {
        fields.push_back({{"field", key}, {"value", value}});
    }
    return fields;
}

} // namespace survey_workbench::core
