#pragma once

#include "survey_workbench/core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace survey_workbench::core {

// Human-readable batch outcome: headline followed by skipped and failed sections
std::string format_batch_message(const BatchReport& report, const std::string& headline);

nlohmann::json batch_report_to_json(const BatchReport& report);

nlohmann::json completeness_to_json(const CompletenessReport& report);

nlohmann::json record_to_json(const ParticipantRecord& record);

} // namespace survey_workbench::core
