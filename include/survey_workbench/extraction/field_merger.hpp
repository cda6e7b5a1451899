#pragma once

#include "survey_workbench/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::extraction {

namespace fs = std::filesystem;

struct MergeOptions {
    std::string extract_suffix = kExtractSuffix;
    std::string ignored_column = kIgnoredColumn;
};

// Exports in a participant folder, sorted by file name
std::vector<fs::path> find_extract_files(const fs::path& participant_folder,
                                         const std::string& extract_suffix = kExtractSuffix);

// "P001_BDI_Extract Data.csv" -> "BDI"
std::string survey_name_from_filename(const std::string& filename,
                                      const std::string& participant_id,
                                      const std::string& extract_suffix = kExtractSuffix);

// Add every column of every data row of one export as <survey>_<column>
void merge_extract_file(ParticipantRecord& record, const fs::path& file,
                        const std::string& survey_name,
                        const std::string& ignored_column = kIgnoredColumn);

// Fold a sorted list of exports into one record. Later files win on key collisions.
ParticipantRecord merge_participant_fields(const std::string& participant_id,
                                           const std::vector<fs::path>& files,
                                           const MergeOptions& options = {});

/**
 * Validate inputs, locate the participant's exports and merge them.
 * Throws ValidationError for a missing id, source folder, participant folder
 * or when the folder holds no exports.
 */
ParticipantRecord prepare_participant_record(const std::string& participant_id,
                                             const fs::path& source_dir,
                                             const MergeOptions& options = {});

} // namespace survey_workbench::extraction
