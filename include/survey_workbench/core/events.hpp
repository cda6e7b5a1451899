#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <ostream>
#include <string>

namespace survey_workbench::core {

using json = nlohmann::json;

/**
 * Structured JSON-lines logging.
 * Every event is one line with "type", "run_id" and "ts"; it goes to the
 * primary stream and, when set, to a log file.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream* out, std::ofstream* log_file = nullptr);
    EventEmitter(std::ostream* out, std::ofstream* log_file, std::string run_id);

    const std::string& run_id() const { return run_id_; }

    void run_start(const std::string& command, const json& extra = json::object());
    void run_end(bool success, const json& extra = json::object());

    void participant_start(const std::string& participant_id, const std::string& action);
    void participant_end(const std::string& participant_id, const std::string& action,
                         const std::string& status, const json& extra = json::object());

    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message, const json& extra = json::object());

    void emit(const json& event);

private:
    json base_event(const std::string& type) const;

    std::ostream* out_;
    std::ofstream* log_file_;
    std::string run_id_;
};

} // namespace survey_workbench::core
