#include "survey_workbench/extraction/field_merger.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/io/csv_io.hpp"

namespace survey_workbench::extraction {

std::vector<fs::path> find_extract_files(const fs::path& participant_folder,
                                         const std::string& extract_suffix) {
    return core::discover_files(participant_folder, extract_suffix);
}

std::string survey_name_from_filename(const std::string& filename,
                                      const std::string& participant_id,
                                      const std::string& extract_suffix) {
    std::string name = filename;
    if (core::ends_with(name, extract_suffix)) {
        name.erase(name.size() - extract_suffix.size());
    }
    const std::string prefix = participant_id + "_";
    if (core::starts_with(name, prefix)) {
        name.erase(0, prefix.size());
    }
    return name;
}

void merge_extract_file(ParticipantRecord& record, const fs::path& file,
                        const std::string& survey_name,
                        const std::string& ignored_column) {
    io::CsvTable table = io::read_csv_table(file);

    for (const auto& row : table.rows) {
        for (size_t c = 0; c < table.header.size(); ++c) {
            const std::string& column = table.header[c];
            if (column == ignored_column) {
                continue;
            }
            // Short rows leave trailing fields blank; surplus cells have no column
            const std::string value = c < row.size() ? row[c] : std::string();
            record.set(survey_name + "_" + column, value);
        }
    }
}

ParticipantRecord merge_participant_fields(const std::string& participant_id,
                                           const std::vector<fs::path>& files,
                                           const MergeOptions& options) {
    ParticipantRecord record(participant_id);
    for (const auto& file : files) {
        const std::string survey = survey_name_from_filename(
            file.filename().string(), participant_id, options.extract_suffix);
        merge_extract_file(record, file, survey, options.ignored_column);
    }
    return record;
}

ParticipantRecord prepare_participant_record(const std::string& participant_id,
                                             const fs::path& source_dir,
                                             const MergeOptions& options) {
    if (core::trim(participant_id).empty()) {
        throw ValidationError("Please enter a participant ID!");
    }
    if (source_dir.empty()) {
        throw ValidationError("Please select a source folder!");
    }

    const fs::path folder = source_dir / participant_id;
    if (!fs::is_directory(folder)) {
        throw ValidationError("Participant folder not found: " + folder.string());
    }

    const auto files = find_extract_files(folder, options.extract_suffix);
    if (files.empty()) {
        throw ValidationError("No Extract Data CSV files found in participant folder!");
    }

    return merge_participant_fields(participant_id, files, options);
}

} // namespace survey_workbench::extraction
