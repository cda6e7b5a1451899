#pragma once

#include "survey_workbench/core/events.hpp"
#include "survey_workbench/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::generation {

namespace fs = std::filesystem;

struct GenerationResult {
    fs::path folder;
    std::vector<fs::path> files;
};

// Logical survey name of a row; an empty name falls back to survey_<index+1>
std::string resolve_survey_name(const QuestionnaireSpec& row, size_t index);

// <pid>_<survey><ext> for a single copy, <pid>_<survey><n><ext> (n from 1) otherwise
std::string copy_file_name(const std::string& participant_id, const std::string& survey_name,
                           const std::string& extension, int copy_number, int copy_count);

/**
 * Create <target_dir>/<participant_id> and fill it with template copies.
 *
 * An existing participant folder is removed first, so the result only holds
 * the files of the current configuration. Inputs and template files are
 * validated before anything on disk is touched.
 */
GenerationResult generate_participant_folder(const std::string& participant_id,
                                             const fs::path& target_dir,
                                             const std::vector<QuestionnaireSpec>& questionnaires);

// Generate folders one id after another; a failing id does not stop the rest.
BatchReport generate_batch(const std::vector<std::string>& participant_ids,
                           const fs::path& target_dir,
                           const std::vector<QuestionnaireSpec>& questionnaires,
                           core::EventEmitter* events = nullptr);

} // namespace survey_workbench::generation
