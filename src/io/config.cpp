#include "survey_workbench/config/configuration.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

namespace survey_workbench::config {

static std::string read_string(const YAML::Node& n, const std::string& fallback) {
    if (!n || n.IsNull()) return fallback;
    return n.as<std::string>();
}

// Copy counts arrive as integers or as the text of a form field
static int read_copy_count(const YAML::Node& n) {
    if (!n || n.IsNull()) return 1;
    return core::parse_int_or(n.as<std::string>(), 1);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("configuration must be a mapping");
    }

    try {
        if (node["generation"]) {
            auto g = node["generation"];
            cfg.generation.target_path = read_string(g["target_path"], "");
            if (g["questionnaires"]) {
                if (!g["questionnaires"].IsSequence()) {
                    throw ConfigError("generation.questionnaires must be a list");
                }
                for (const auto& q : g["questionnaires"]) {
                    QuestionnaireSpec row;
                    row.name = read_string(q["name"], "");
                    row.template_path = read_string(q["template_path"], "");
                    row.copy_count = read_copy_count(q["copy_count"]);
                    cfg.generation.questionnaires.push_back(row);
                }
            }
        }

        if (node["extraction"]) {
            auto e = node["extraction"];
            cfg.extraction.source_path = read_string(e["source_path"], "");
            cfg.extraction.masterfile_path = read_string(e["masterfile_path"], "");
            if (e["extract_suffix"]) cfg.extraction.extract_suffix = e["extract_suffix"].as<std::string>();
            if (e["ignored_column"]) cfg.extraction.ignored_column = e["ignored_column"].as<std::string>();
            if (e["data_sheet"]) cfg.extraction.data_sheet = e["data_sheet"].as<std::string>();
            if (e["duplicate_scan_first_row"]) {
                cfg.extraction.duplicate_scan_first_row = e["duplicate_scan_first_row"].as<int>();
            }
            if (e["duplicate_scan_last_row"]) {
                cfg.extraction.duplicate_scan_last_row = e["duplicate_scan_last_row"].as<int>();
            }
        }

        if (node["bundles"]) {
            auto b = node["bundles"];
            if (b["directory"]) cfg.bundles.directory = b["directory"].as<std::string>();
        }

        if (node["logging"]) {
            auto l = node["logging"];
            cfg.logging.log_file = read_string(l["log_file"], "");
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["generation"]["target_path"] = generation.target_path;
    YAML::Node quests(YAML::NodeType::Sequence);
    for (const auto& q : generation.questionnaires) {
        YAML::Node qn;
        qn["name"] = q.name;
        qn["template_path"] = q.template_path;
        qn["copy_count"] = q.copy_count;
        quests.push_back(qn);
    }
    node["generation"]["questionnaires"] = quests;

    node["extraction"]["source_path"] = extraction.source_path;
    node["extraction"]["masterfile_path"] = extraction.masterfile_path;
    node["extraction"]["extract_suffix"] = extraction.extract_suffix;
    node["extraction"]["ignored_column"] = extraction.ignored_column;
    node["extraction"]["data_sheet"] = extraction.data_sheet;
    node["extraction"]["duplicate_scan_first_row"] = extraction.duplicate_scan_first_row;
    node["extraction"]["duplicate_scan_last_row"] = extraction.duplicate_scan_last_row;

    node["bundles"]["directory"] = bundles.directory;

    node["logging"]["log_file"] = logging.log_file;

    return node;
}

void Config::validate() const {
    for (size_t i = 0; i < generation.questionnaires.size(); ++i) {
        if (generation.questionnaires[i].copy_count < 0) {
            throw ValidationError("generation.questionnaires[" + std::to_string(i) +
                                  "].copy_count must be >= 0");
        }
    }

    if (extraction.extract_suffix.empty()) {
        throw ValidationError("extraction.extract_suffix must not be empty");
    }
    if (extraction.data_sheet.empty()) {
        throw ValidationError("extraction.data_sheet must not be empty");
    }
    if (extraction.duplicate_scan_first_row < 1) {
        throw ValidationError("extraction.duplicate_scan_first_row must be >= 1");
    }
    if (extraction.duplicate_scan_last_row < extraction.duplicate_scan_first_row) {
        throw ValidationError("extraction.duplicate_scan_last_row must be >= duplicate_scan_first_row");
    }
    if (!extraction.masterfile_path.empty() &&
        detect_masterfile_format(extraction.masterfile_path) == MasterfileFormat::UNSUPPORTED) {
        throw ValidationError("extraction.masterfile_path must end in .csv, .xls, .xlsx or .xml");
    }

    if (bundles.directory.empty()) {
        throw ValidationError("bundles.directory must not be empty");
    }
}

// ============================================================================
// ConfigStore
// ============================================================================

ConfigStore::ConfigStore(fs::path path) : path_(std::move(path)) {}

YAML::Node ConfigStore::read_all() const {
    if (!fs::exists(path_)) {
        return YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path_.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        throw ConfigError(path_.string() + " must contain a mapping of named configurations");
    }
    return root;
}

void ConfigStore::write_all(const YAML::Node& root) const {
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }
    std::ofstream out(path_);
    if (!out) {
        throw ConfigError("Cannot write config store: " + path_.string());
    }
    out << root << "\n";
}

std::vector<std::string> ConfigStore::names() const {
    std::vector<std::string> out;
    for (const auto& entry : read_all()) {
        out.push_back(entry.first.as<std::string>());
    }
    return out;
}

bool ConfigStore::contains(const std::string& name) const {
    const auto all = names();
    return std::find(all.begin(), all.end(), name) != all.end();
}

void ConfigStore::save(const std::string& name, const Config& cfg) {
    if (core::trim(name).empty()) {
        throw ValidationError("No configuration name provided!");
    }

    // Rebuild so that a replaced name keeps the order of the others
    YAML::Node root = read_all();
    YAML::Node updated(YAML::NodeType::Map);
    bool replaced = false;
    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        if (key == name) {
            updated[key] = cfg.to_yaml();
            replaced = true;
        } else {
            updated[key] = entry.second;
        }
    }
    if (!replaced) {
        updated[name] = cfg.to_yaml();
    }
    write_all(updated);
}

Config ConfigStore::load(const std::string& name) const {
    YAML::Node root = read_all();
    if (!root[name]) {
        throw ConfigError("Configuration '" + name + "' not found!");
    }
    return Config::from_yaml(root[name]);
}

bool ConfigStore::remove(const std::string& name) {
    YAML::Node root = read_all();
    if (!root[name]) {
        return false;
    }
    root.remove(name);
    write_all(root);
    return true;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "generation": {
      "type": "object",
      "properties": {
        "target_path": {"type": "string"},
        "questionnaires": {
          "type": "array",
          "items": {
            "type": "object",
            "properties": {
              "name": {"type": "string"},
              "template_path": {"type": "string"},
              "copy_count": {"type": ["integer", "string"], "minimum": 0}
            }
          }
        }
      }
    },
    "extraction": {
      "type": "object",
      "properties": {
        "source_path": {"type": "string"},
        "masterfile_path": {"type": "string"},
        "extract_suffix": {"type": "string"},
        "ignored_column": {"type": "string"},
        "data_sheet": {"type": "string"},
        "duplicate_scan_first_row": {"type": "integer", "minimum": 1},
        "duplicate_scan_last_row": {"type": "integer", "minimum": 1}
      }
    },
    "bundles": {
      "type": "object",
      "properties": {
        "directory": {"type": "string"}
      }
    },
    "logging": {
      "type": "object",
      "properties": {
        "log_file": {"type": "string"}
      }
    }
  }
})";
}

} // namespace survey_workbench::config
