#include "survey_workbench/participants/participant_ids.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/io/csv_io.hpp"

#include <algorithm>
#include <set>

namespace survey_workbench::participants {

std::vector<std::string> parse_participant_ids(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ',', '\n');
    std::replace(normalized.begin(), normalized.end(), '\r', '\n');

    std::vector<std::string> ids;
    for (const auto& part : core::split(normalized, '\n')) {
        std::string pid = core::trim(part);
        if (!pid.empty()) {
            ids.push_back(pid);
        }
    }
    return ids;
}

std::vector<std::string> unique_participant_ids(const std::vector<std::string>& ids) {
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (const auto& pid : ids) {
        if (seen.insert(pid).second) {
            out.push_back(pid);
        }
    }
    return out;
}

std::vector<std::string> import_participant_list(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Participant list not found: " + path.string());
    }

    std::vector<std::string> ids;
    if (core::to_lower(path.extension().string()) == ".csv") {
        const std::string text = core::strip_utf8_bom(core::read_text(path));
        for (const auto& row : io::parse_csv(text)) {
            for (const auto& cell : row) {
                std::string pid = core::trim(cell);
                if (!pid.empty()) {
                    ids.push_back(pid);
                }
            }
        }
    } else {
        ids = parse_participant_ids(core::strip_utf8_bom(core::read_text(path)));
    }

    return unique_participant_ids(ids);
}

} // namespace survey_workbench::participants
