#include "survey_workbench/generation/folder_generator.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

namespace survey_workbench::generation {

namespace {

void validate_participant_id(const std::string& participant_id) {
    if (participant_id.empty()) {
        throw ValidationError("Please enter a participant ID!");
    }
    if (participant_id == "." || participant_id == ".." ||
        participant_id.find_first_of("/\\") != std::string::npos) {
        throw ValidationError("Invalid participant ID: " + participant_id);
    }
}

} // namespace

std::string resolve_survey_name(const QuestionnaireSpec& row, size_t index) {
    std::string name = core::trim(row.name);
    if (name.empty()) {
        name = "survey_" + std::to_string(index + 1);
    }
    return name;
}

std::string copy_file_name(const std::string& participant_id, const std::string& survey_name,
                           const std::string& extension, int copy_number, int copy_count) {
    std::string name = participant_id + "_" + survey_name;
    if (copy_count != 1) {
        name += std::to_string(copy_number);
    }
    return name + extension;
}

GenerationResult generate_participant_folder(const std::string& participant_id,
                                             const fs::path& target_dir,
                                             const std::vector<QuestionnaireSpec>& questionnaires) {
    const std::string pid = core::trim(participant_id);
    validate_participant_id(pid);
    if (target_dir.empty()) {
        throw ValidationError("Please select a target folder!");
    }
    if (questionnaires.empty()) {
        throw ValidationError("Please configure questionnaires!");
    }

    for (const auto& q : questionnaires) {
        if (!q.template_path.empty() && !fs::is_regular_file(q.template_path)) {
            throw ValidationError("Template file not found: " + q.template_path);
        }
    }

    GenerationResult result;
    result.folder = target_dir / pid;

    std::error_code ec;
    if (fs::exists(result.folder)) {
        fs::remove_all(result.folder, ec);
        if (ec) {
            throw IOError("Cannot remove " + result.folder.string() + ": " + ec.message());
        }
    }
    fs::create_directories(result.folder, ec);
    if (ec) {
        throw IOError("Cannot create " + result.folder.string() + ": " + ec.message());
    }

    for (size_t i = 0; i < questionnaires.size(); ++i) {
        const auto& q = questionnaires[i];
        if (q.template_path.empty()) {
            continue;
        }

        const std::string survey_name = resolve_survey_name(q, i);
        const std::string ext = fs::path(q.template_path).extension().string();

        for (int n = 1; n <= q.copy_count; ++n) {
            fs::path dest = result.folder / copy_file_name(pid, survey_name, ext, n, q.copy_count);
            core::copy_file_with_metadata(q.template_path, dest);
            result.files.push_back(dest);
        }
    }

    return result;
}

BatchReport generate_batch(const std::vector<std::string>& participant_ids,
                           const fs::path& target_dir,
                           const std::vector<QuestionnaireSpec>& questionnaires,
                           core::EventEmitter* events) {
    if (participant_ids.empty()) {
        throw ValidationError("Please enter at least one participant ID!");
    }

    BatchReport report;
    report.total = static_cast<int>(participant_ids.size());

    for (const auto& pid : participant_ids) {
        if (events) events->participant_start(pid, "generate");
        try {
            GenerationResult r = generate_participant_folder(pid, target_dir, questionnaires);
            report.succeeded.push_back(pid);
            if (events) {
                events->participant_end(pid, "generate", "ok",
                                        {{"folder", r.folder.string()},
                                         {"files", static_cast<int>(r.files.size())}});
            }
        } catch (const std::exception& e) {
            report.failed.push_back({pid, e.what()});
            if (events) events->participant_end(pid, "generate", "failed", {{"error", e.what()}});
        }
    }

    return report;
}

} // namespace survey_workbench::generation
