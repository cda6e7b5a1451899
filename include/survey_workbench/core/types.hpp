#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace survey_workbench {

namespace fs = std::filesystem;

// Filename suffix of the per-survey exports consumed during extraction
inline constexpr const char* kExtractSuffix = "_Extract Data.csv";

// Column present in every export that is never merged
inline constexpr const char* kIgnoredColumn = "File";

inline constexpr const char* kParticipantIdField = "participant_id";

// One questionnaire row of the generation form
struct QuestionnaireSpec {
    std::string name;
    std::string template_path;
    int copy_count = 1;
};

// Flat record of all survey fields for one participant.
// Keys keep first-insertion order; re-setting a key overwrites the value in place.
class ParticipantRecord {
public:
    ParticipantRecord() = default;
    explicit ParticipantRecord(std::string participant_id)
        : participant_id_(std::move(participant_id)) {}

    const std::string& participant_id() const { return participant_id_; }

    void set(const std::string& key, const std::string& value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            fields_[it->second].second = value;
            return;
        }
        index_.emplace(key, fields_.size());
        fields_.emplace_back(key, value);
    }

    bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    std::string get(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? std::string() : fields_[it->second].second;
    }

    const std::vector<std::pair<std::string, std::string>>& fields() const {
        return fields_;
    }

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    // Column names as written to a masterfile: participant_id first
    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(fields_.size() + 1);
        out.push_back(kParticipantIdField);
        for (const auto& kv : fields_) {
            out.push_back(kv.first);
        }
        return out;
    }

    // Value lookup that also resolves the participant_id column
    std::string value_for(const std::string& column) const {
        if (column == kParticipantIdField) return participant_id_;
        return get(column);
    }

private:
    std::string participant_id_;
    std::vector<std::pair<std::string, std::string>> fields_;
    std::map<std::string, size_t> index_;
};

enum class MasterfileFormat {
    UNSUPPORTED,
    CSV,
    WORKBOOK
};

inline std::string masterfile_format_to_string(MasterfileFormat format) {
    switch (format) {
        case MasterfileFormat::CSV: return "csv";
        case MasterfileFormat::WORKBOOK: return "workbook";
        default: return "unsupported";
    }
}

inline MasterfileFormat detect_masterfile_format(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".csv") return MasterfileFormat::CSV;
    if (ext == ".xls" || ext == ".xlsx" || ext == ".xml") return MasterfileFormat::WORKBOOK;
    return MasterfileFormat::UNSUPPORTED;
}

struct CompletenessReport {
    bool complete = false;
    std::vector<fs::path> files;
    std::vector<std::string> issues;
};

struct ParticipantFailure {
    std::string participant_id;
    std::string message;
};

// Outcome of processing a list of participant ids
struct BatchReport {
    int total = 0;
    std::vector<std::string> succeeded;
    std::vector<ParticipantFailure> failed;
    std::vector<std::string> duplicates;
    std::vector<ParticipantFailure> incomplete;

    int success_count() const { return static_cast<int>(succeeded.size()); }
};

} // namespace survey_workbench
