#include "survey_workbench/core/events.hpp"
#include "survey_workbench/core/utils.hpp"

#include <utility>

namespace survey_workbench::core {

static void merge_into(json& event, const json& extra) {
    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
}

EventEmitter::EventEmitter(std::ostream* out, std::ofstream* log_file)
    : EventEmitter(out, log_file, get_run_id()) {}

EventEmitter::EventEmitter(std::ostream* out, std::ofstream* log_file, std::string run_id)
    : out_(out), log_file_(log_file), run_id_(std::move(run_id)) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();

    if (out_) {
        (*out_) << line << "\n";
        out_->flush();
    }

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& command, const json& extra) {
    json event = base_event("run_start");
    event["command"] = command;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::run_end(bool success, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = success ? "ok" : "error";
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::participant_start(const std::string& participant_id,
                                     const std::string& action) {
    json event = base_event("participant_start");
    event["participant_id"] = participant_id;
    event["action"] = action;
    emit(event);
}

void EventEmitter::participant_end(const std::string& participant_id,
                                   const std::string& action,
                                   const std::string& status, const json& extra) {
    json event = base_event("participant_end");
    event["participant_id"] = participant_id;
    event["action"] = action;
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json event = base_event("warning");
    event["message"] = message;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::error(const std::string& message, const json& extra) {
    json event = base_event("error");
    event["message"] = message;
    merge_into(event, extra);
    emit(event);
}

} // namespace survey_workbench::core
