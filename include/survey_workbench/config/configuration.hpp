#pragma once

#include "survey_workbench/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace survey_workbench::config {

namespace fs = std::filesystem;

struct GenerationConfig {
  std::string target_path;
  std::vector<QuestionnaireSpec> questionnaires;
};

struct ExtractionConfig {
  std::string source_path;
  std::string masterfile_path;
  std::string extract_suffix = kExtractSuffix;
  std::string ignored_column = kIgnoredColumn;
  std::string data_sheet = "Data";
  int duplicate_scan_first_row = 2;
  int duplicate_scan_last_row = 1000;
};

struct BundlesConfig {
  std::string directory = "template_bundles";
};

struct LoggingConfig {
  std::string log_file; // empty: events go to stderr only
};

struct Config {
  GenerationConfig generation;
  ExtractionConfig extraction;
  BundlesConfig bundles;
  LoggingConfig logging;

  // Number of configured questionnaires, used as the expected export count
  int expected_survey_count() const {
    return static_cast<int>(generation.questionnaires.size());
  }

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

/**
 * Named configurations kept as top-level keys of a single YAML file.
 * Saving a name replaces any previous entry of that name.
 */
class ConfigStore {
public:
  explicit ConfigStore(fs::path path);

  const fs::path &path() const { return path_; }

  std::vector<std::string> names() const;
  bool contains(const std::string &name) const;

  void save(const std::string &name, const Config &cfg);
  Config load(const std::string &name) const;

  // Returns false when the name was not present
  bool remove(const std::string &name);

private:
  YAML::Node read_all() const;
  void write_all(const YAML::Node &root) const;

  fs::path path_;
};

inline constexpr const char *kDefaultConfigStore = "survey_workbench_configs.yaml";

std::string get_schema_json();

} // namespace survey_workbench::config
