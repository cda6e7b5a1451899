#include "survey_workbench/config/template_bundle.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

#include <algorithm>
#include <utility>

namespace survey_workbench::config {

using json = nlohmann::json;

json TemplateBundle::to_json() const {
    json j;
    j["name"] = name;
    j["questionnaire_count"] = questionnaires.size();
    j["questionnaires"] = json::array();
    for (size_t i = 0; i < questionnaires.size(); ++i) {
        const auto& q = questionnaires[i];
        // copy_count is stored as the text of the form field
        j["questionnaires"].push_back({
            {"index", i},
            {"name", q.name},
            {"template_path", q.template_path},
            {"copy_count", std::to_string(q.copy_count)}
        });
    }
    return j;
}

TemplateBundle TemplateBundle::from_json(const json& j) {
    if (!j.is_object()) {
        throw BundleError("bundle must be a JSON object");
    }

    TemplateBundle bundle;
    bundle.name = j.value("name", std::string());

    const int count = j.value("questionnaire_count", 0);
    if (count < 0) {
        throw BundleError("questionnaire_count must be >= 0");
    }
    bundle.questionnaires.resize(static_cast<size_t>(count));

    if (!j.contains("questionnaires") || !j["questionnaires"].is_array()) {
        return bundle;
    }

    // Rows are placed by index; entries beyond questionnaire_count are ignored
    for (const auto& q : j["questionnaires"]) {
        const int idx = q.value("index", -1);
        if (idx < 0 || idx >= count) {
            continue;
        }

        QuestionnaireSpec row;
        row.name = q.value("name", std::string());
        row.template_path = q.value("template_path", std::string());
        if (q.contains("copy_count")) {
            const auto& cc = q["copy_count"];
            if (cc.is_number_integer()) {
                row.copy_count = cc.get<int>();
            } else if (cc.is_string()) {
                row.copy_count = core::parse_int_or(cc.get<std::string>(), 1);
            }
        }
        bundle.questionnaires[static_cast<size_t>(idx)] = row;
    }
    return bundle;
}

TemplateBundleStore::TemplateBundleStore(fs::path directory)
    : directory_(std::move(directory)) {}

std::vector<std::string> TemplateBundleStore::names() const {
    std::vector<std::string> out;
    for (const auto& p : core::discover_files(directory_, ".json")) {
        out.push_back(p.stem().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool TemplateBundleStore::exists(const std::string& name) const {
    return fs::exists(path_for(name));
}

fs::path TemplateBundleStore::path_for(const std::string& name) const {
    return directory_ / (name + ".json");
}

fs::path TemplateBundleStore::save(const TemplateBundle& bundle, bool overwrite) {
    const std::string name = core::trim(bundle.name);
    if (name.empty()) {
        throw ValidationError("Please enter a name for the template bundle!");
    }
    if (bundle.questionnaires.empty()) {
        throw ValidationError("No questionnaire configuration to save!");
    }

    const fs::path target = path_for(name);
    if (fs::exists(target) && !overwrite) {
        throw BundleError("Template bundle '" + name + "' already exists");
    }

    fs::create_directories(directory_);
    TemplateBundle normalized = bundle;
    normalized.name = name;
    core::write_text(target, normalized.to_json().dump(2) + "\n");
    return target;
}

TemplateBundle TemplateBundleStore::load(const std::string& name) const {
    const fs::path p = path_for(name);
    if (!fs::exists(p)) {
        throw BundleError("Template bundle '" + name + "' not found in " + directory_.string());
    }

    json j;
    try {
        j = json::parse(core::read_text(p));
    } catch (const json::exception& e) {
        throw BundleError("Cannot parse " + p.string() + ": " + e.what());
    }

    try {
        return TemplateBundle::from_json(j);
    } catch (const json::exception& e) {
        throw BundleError("Invalid bundle " + p.string() + ": " + e.what());
    }
}

} // namespace survey_workbench::config
