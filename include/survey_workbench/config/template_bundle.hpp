#pragma once

#include "survey_workbench/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::config {

namespace fs = std::filesystem;

// A reusable, named set of questionnaire rows
struct TemplateBundle {
    std::string name;
    std::vector<QuestionnaireSpec> questionnaires;

    nlohmann::json to_json() const;
    static TemplateBundle from_json(const nlohmann::json& j);
};

/**
 * Bundles saved as <directory>/<name>.json.
 */
class TemplateBundleStore {
public:
    explicit TemplateBundleStore(fs::path directory);

    const fs::path& directory() const { return directory_; }

    // Sorted bundle names, empty when the directory does not exist
    std::vector<std::string> names() const;
    bool exists(const std::string& name) const;
    fs::path path_for(const std::string& name) const;

    // Throws BundleError when the bundle exists and overwrite is false
    fs::path save(const TemplateBundle& bundle, bool overwrite);
    TemplateBundle load(const std::string& name) const;

private:
    fs::path directory_;
};

} // namespace survey_workbench::config
