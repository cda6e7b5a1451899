#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::participants {

namespace fs = std::filesystem;

// Split on commas and newlines, trim, drop empties. Order and repeats are kept.
std::vector<std::string> parse_participant_ids(const std::string& text);

// Drop repeated ids, keeping the first occurrence
std::vector<std::string> unique_participant_ids(const std::vector<std::string>& ids);

// Read a participant list file.
// .csv files contribute every non-empty cell; anything else is read as text.
// The result is de-duplicated.
std::vector<std::string> import_participant_list(const fs::path& path);

} // namespace survey_workbench::participants
