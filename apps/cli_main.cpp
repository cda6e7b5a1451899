#include "survey_workbench/config/configuration.hpp"
#include "survey_workbench/config/template_bundle.hpp"
#include "survey_workbench/core/errors.hpp"
#include "survey_workbench/core/events.hpp"
#include "survey_workbench/core/report.hpp"
#include "survey_workbench/core/utils.hpp"
#include "survey_workbench/extraction/completeness.hpp"
#include "survey_workbench/extraction/extraction.hpp"
#include "survey_workbench/generation/folder_generator.hpp"
#include "survey_workbench/participants/participant_ids.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sw = survey_workbench;
namespace config = survey_workbench::config;
namespace core = survey_workbench::core;
namespace extraction = survey_workbench::extraction;
namespace generation = survey_workbench::generation;
namespace participants = survey_workbench::participants;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static json questionnaires_to_json(const std::vector<sw::QuestionnaireSpec>& qs) {
    json arr = json::array();
    for (size_t i = 0; i < qs.size(); ++i) {
        arr.push_back({
            {"index", i},
            {"name", qs[i].name},
            {"template_path", qs[i].template_path},
            {"copy_count", qs[i].copy_count}
        });
    }
    return arr;
}

// Owns the optional log file the emitter tees into
struct EventSink {
    std::unique_ptr<std::ofstream> log_file;
    std::unique_ptr<core::EventEmitter> emitter;
};

static EventSink open_events(const std::string& log_path) {
    EventSink sink;
    if (!log_path.empty()) {
        sink.log_file = std::make_unique<std::ofstream>(log_path, std::ios::app);
        if (!sink.log_file->is_open()) {
            throw sw::IOError("Cannot open log file: " + log_path);
        }
    }
    sink.emitter = std::make_unique<core::EventEmitter>(&std::cerr, sink.log_file.get());
    return sink;
}

// ============================================================================
// generate [<participant_id>] [--ids LIST | --ids-file PATH]
// ============================================================================
int cmd_generate(const config::Config& cfg, const std::string& participant_id,
                 const std::vector<std::string>& batch_ids, bool batch,
                 core::EventEmitter& events) {
    const fs::path target(cfg.generation.target_path);
    const auto& questionnaires = cfg.generation.questionnaires;

    json result;
    if (batch) {
        events.run_start("generate", {{"mode", "batch"}, {"participants", batch_ids.size()}});
        sw::BatchReport report = generation::generate_batch(batch_ids, target, questionnaires, &events);
        const std::string headline = "Generated " + std::to_string(report.success_count()) + " of " +
                                     std::to_string(report.total) + " folders successfully!";
        result["ok"] = report.failed.empty();
        result["batch"] = core::batch_report_to_json(report);
        result["message"] = core::format_batch_message(report, headline);
        events.run_end(report.failed.empty(), {{"success_count", report.success_count()}});
        print_json(result);
        return 0;
    }

    events.run_start("generate", {{"mode", "single"}, {"participant_id", participant_id}});
    generation::GenerationResult r =
        generation::generate_participant_folder(participant_id, target, questionnaires);

    result["ok"] = true;
    result["folder"] = r.folder.string();
    result["files"] = json::array();
    for (const auto& f : r.files) {
        result["files"].push_back(f.filename().string());
    }
    result["message"] = "Participant folder created successfully!\n" + r.folder.string();
    events.run_end(true, {{"files", r.files.size()}});
    print_json(result);
    return 0;
}

// ============================================================================
// extract [<participant_id>] [--ids LIST | --ids-file PATH] [--force]
// ============================================================================
int cmd_extract(const config::Config& cfg, const std::string& participant_id,
                const std::vector<std::string>& batch_ids, bool batch, bool force,
                config::ConfigStore* store, const std::string& config_name,
                core::EventEmitter& events) {
    extraction::Extractor extractor(extraction::ExtractionSettings::from_config(cfg), &events);
    const fs::path initial_masterfile = extractor.masterfile_path();

    json result;
    int exit_code = 0;
    if (batch) {
        events.run_start("extract", {{"mode", "batch"}, {"participants", batch_ids.size()}});
        sw::BatchReport report = extractor.extract_batch(batch_ids);
        const std::string headline = "Extracted " + std::to_string(report.success_count()) + " of " +
                                     std::to_string(report.total) + " participants successfully!";
        result["ok"] = report.failed.empty();
        result["batch"] = core::batch_report_to_json(report);
        result["message"] = core::format_batch_message(report, headline);
        events.run_end(report.failed.empty(), {{"success_count", report.success_count()}});
    } else {
        events.run_start("extract", {{"mode", "single"}, {"participant_id", participant_id},
                                     {"force", force}});
        extraction::ExtractionOutcome outcome = extractor.extract(participant_id, force);

        result["status"] = extraction::extraction_status_to_string(outcome.status);
        result["duplicate"] = outcome.duplicate;
        switch (outcome.status) {
            case extraction::ExtractionStatus::EXTRACTED:
                result["ok"] = true;
                result["fields"] = static_cast<int>(outcome.record.size());
                result["message"] = "Data extracted successfully for " + outcome.participant_id + "!";
                break;
            case extraction::ExtractionStatus::DUPLICATE:
                result["ok"] = false;
                result["message"] = "Participant " + outcome.participant_id +
                                    " already exists in masterfile. Re-run with --force to append anyway.";
                exit_code = 3;
                break;
            case extraction::ExtractionStatus::INCOMPLETE:
                result["ok"] = false;
                result["completeness"] = core::completeness_to_json(outcome.completeness);
                result["message"] = "Data completeness issues:\n" +
                                    core::join(outcome.completeness.issues, "\n") +
                                    "\nRe-run with --force to extract anyway.";
                exit_code = 3;
                break;
        }
        events.run_end(exit_code == 0, {{"status", result["status"]}});
    }

    result["masterfile_path"] = extractor.masterfile_path().string();
    if (extractor.masterfile_path() != initial_masterfile) {
        result["retargeted_from"] = initial_masterfile.string();
        events.warning("Masterfile retargeted to " + extractor.masterfile_path().string());
        // Keep the named configuration pointing at the file that now holds the data
        if (store && !config_name.empty()) {
            config::Config updated = cfg;
            updated.extraction.masterfile_path = extractor.masterfile_path().string();
            store->save(config_name, updated);
        }
    }

    print_json(result);
    return exit_code;
}

// ============================================================================
// preview <participant_id>
// ============================================================================
int cmd_preview(const config::Config& cfg, const std::string& participant_id) {
    const auto settings = extraction::ExtractionSettings::from_config(cfg);
    sw::ParticipantRecord record = extraction::prepare_participant_record(
        core::trim(participant_id), settings.source_dir, settings.merge);

    json result;
    result["ok"] = true;
    result["participant_id"] = participant_id;
    result["fields"] = core::record_to_json(record);
    print_json(result);
    return 0;
}

// ============================================================================
// check-duplicate <participant_id>
// ============================================================================
int cmd_check_duplicate(const config::Config& cfg, const std::string& participant_id) {
    if (cfg.extraction.masterfile_path.empty()) {
        throw sw::ValidationError("Please select a masterfile!");
    }

    extraction::DuplicateScanOptions scan;
    scan.first_row = cfg.extraction.duplicate_scan_first_row;
    scan.last_row = cfg.extraction.duplicate_scan_last_row;

    json result;
    result["ok"] = true;
    result["participant_id"] = participant_id;
    result["masterfile_path"] = cfg.extraction.masterfile_path;
    result["format"] = sw::masterfile_format_to_string(
        sw::detect_masterfile_format(cfg.extraction.masterfile_path));
    result["duplicate"] = extraction::check_duplicate(participant_id,
                                                      cfg.extraction.masterfile_path, scan);
    print_json(result);
    return 0;
}

// ============================================================================
// check-completeness <participant_id> [--expected N]
// ============================================================================
int cmd_check_completeness(const config::Config& cfg, const std::string& participant_id,
                           int expected_count) {
    if (cfg.extraction.source_path.empty()) {
        throw sw::ValidationError("Please select a source folder!");
    }

    sw::CompletenessReport report = extraction::check_data_completeness(
        participant_id, cfg.extraction.source_path, expected_count, cfg.extraction.extract_suffix);

    json result = core::completeness_to_json(report);
    result["ok"] = true;
    result["participant_id"] = participant_id;
    result["expected_count"] = expected_count;
    print_json(result);
    return 0;
}

// ============================================================================
// missing-report [--expected N]
// ============================================================================
int cmd_missing_report(const config::Config& cfg, int expected_count) {
    extraction::MissingDataReport report = extraction::generate_missing_data_report(
        cfg.extraction.source_path, expected_count, cfg.extraction.extract_suffix);

    json result;
    result["ok"] = true;
    result["source_path"] = cfg.extraction.source_path;
    result["complete_count"] = report.complete_count;
    result["incomplete_count"] = report.incomplete_count;
    result["total"] = report.total();
    result["summary"] = report.summary();
    result["lines"] = report.lines();
    result["participants"] = json::array();
    for (const auto& e : report.entries) {
        json p = core::completeness_to_json(e.report);
        p["participant_id"] = e.participant_id;
        result["participants"].push_back(p);
    }
    print_json(result);
    return 0;
}

// ============================================================================
// import-ids <path>
// ============================================================================
int cmd_import_ids(const std::string& path) {
    auto ids = participants::import_participant_list(path);
    if (ids.empty()) {
        throw sw::ValidationError("No participant IDs found in the file!");
    }

    json result;
    result["ok"] = true;
    result["path"] = path;
    result["count"] = ids.size();
    result["participant_ids"] = ids;
    result["message"] = "Imported " + std::to_string(ids.size()) +
                        " unique participant IDs from:\n" + fs::path(path).filename().string();
    print_json(result);
    return 0;
}

// ============================================================================
// save-bundle <name> [--overwrite]
// ============================================================================
int cmd_save_bundle(const config::Config& cfg, const std::string& name, bool overwrite) {
    config::TemplateBundleStore store(cfg.bundles.directory);
    config::TemplateBundle bundle;
    bundle.name = name;
    bundle.questionnaires = cfg.generation.questionnaires;

    fs::path saved = store.save(bundle, overwrite);

    json result;
    result["ok"] = true;
    result["path"] = saved.string();
    result["message"] = "Template bundle '" + core::trim(name) + "' saved successfully!";
    print_json(result);
    return 0;
}

// ============================================================================
// load-bundle <name> [--into CONFIG_YAML]
// ============================================================================
int cmd_load_bundle(const config::Config& cfg, const std::string& name, const std::string& into) {
    config::TemplateBundleStore store(cfg.bundles.directory);
    config::TemplateBundle bundle = store.load(name);

    json result;
    result["ok"] = true;
    result["bundle"] = bundle.to_json();

    if (!into.empty()) {
        config::Config target = fs::exists(into) ? config::Config::load(into) : config::Config();
        target.generation.questionnaires = bundle.questionnaires;
        target.save(into);
        result["applied_to"] = into;
    }

    result["message"] = "Template bundle '" + name + "' loaded successfully!";
    print_json(result);
    return 0;
}

// ============================================================================
// list-bundles
// ============================================================================
int cmd_list_bundles(const config::Config& cfg) {
    config::TemplateBundleStore store(cfg.bundles.directory);

    json result;
    result["ok"] = true;
    result["directory"] = store.directory().string();
    result["bundles"] = store.names();
    print_json(result);
    return 0;
}

// ============================================================================
// save-config <name>
// ============================================================================
int cmd_save_config(config::ConfigStore& store, const config::Config& cfg, const std::string& name) {
    cfg.validate();
    store.save(name, cfg);

    json result;
    result["ok"] = true;
    result["store"] = store.path().string();
    result["name"] = name;
    result["message"] = "Configuration '" + name + "' saved successfully!";
    print_json(result);
    return 0;
}

// ============================================================================
// load-config <name> [--output PATH]
// ============================================================================
int cmd_load_config(const config::ConfigStore& store, const std::string& name,
                    const std::string& output) {
    config::Config cfg = store.load(name);

    YAML::Emitter emitter;
    emitter << cfg.to_yaml();

    json result;
    result["ok"] = true;
    result["store"] = store.path().string();
    result["name"] = name;
    result["yaml"] = emitter.c_str();
    result["generation"] = {
        {"target_path", cfg.generation.target_path},
        {"questionnaires", questionnaires_to_json(cfg.generation.questionnaires)}
    };
    result["extraction"] = {
        {"source_path", cfg.extraction.source_path},
        {"masterfile_path", cfg.extraction.masterfile_path}
    };

    if (!output.empty()) {
        cfg.save(output);
        result["written_to"] = output;
    }

    print_json(result);
    return 0;
}

// ============================================================================
// delete-config <name>
// ============================================================================
int cmd_delete_config(config::ConfigStore& store, const std::string& name) {
    if (!store.remove(name)) {
        throw sw::ConfigError("Configuration '" + name + "' not found!");
    }

    json result;
    result["ok"] = true;
    result["name"] = name;
    result["message"] = "Configuration '" + name + "' deleted successfully!";
    print_json(result);
    return 0;
}

// ============================================================================
// list-configs
// ============================================================================
int cmd_list_configs(const config::ConfigStore& store) {
    json result;
    result["ok"] = true;
    result["store"] = store.path().string();
    result["configs"] = store.names();
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        config::Config cfg;
        if (!path.empty()) {
            cfg = config::Config::load(path);
        } else {
            const std::string yaml_text = use_stdin ? read_stdin() : yaml_arg;
            cfg = config::Config::from_yaml(YAML::Load(yaml_text));
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const sw::WorkbenchError& e) {
        result["errors"].push_back(e.what());
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("Config error: ") + e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

void print_usage() {
    std::cerr << "Usage: survey_workbench_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  generate [ID] [--ids LIST | --ids-file P]        Create participant folders\n"
              << "  extract [ID] [--ids LIST | --ids-file P] [--force]  Append participants to the masterfile\n"
              << "  preview ID                                       Show the record extract would append\n"
              << "  check-duplicate ID                               Look for ID in the masterfile\n"
              << "  check-completeness ID [--expected N]             Count a participant's exports\n"
              << "  missing-report [--expected N]                    Completeness of every participant folder\n"
              << "  import-ids PATH                                  Read a participant list (.txt or .csv)\n"
              << "  save-bundle NAME [--overwrite]                   Save questionnaires as a template bundle\n"
              << "  load-bundle NAME [--into CONFIG]                 Load a template bundle\n"
              << "  list-bundles                                     List template bundles\n"
              << "  save-config NAME                                 Store the current configuration by name\n"
              << "  load-config NAME [--output P]                    Show or export a named configuration\n"
              << "  delete-config NAME                               Delete a named configuration\n"
              << "  list-configs                                     List named configurations\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate a configuration\n"
              << "  get-schema                                       Print the configuration JSON schema\n\n"
              << "Configuration options:\n"
              << "  --config P          YAML configuration file\n"
              << "  --config-name N     Named configuration from the store\n"
              << "  --store P           Configuration store (default " << config::kDefaultConfigStore << ")\n"
              << "  --target P  --source P  --masterfile P  --bundles-dir P  --log-file P\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Options that consume the following argument
    static const std::set<std::string> kValueOptions = {
        "--config", "--config-name", "--store", "--target", "--source", "--masterfile",
        "--bundles-dir", "--log-file", "--ids", "--ids-file", "--expected", "--into",
        "--output", "--path", "--yaml"
    };

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (kValueOptions.count(argv[i]) && i + 1 < argc) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto get_int_arg = [&](const char* name, int fallback) -> int {
        const std::string raw = get_arg(name);
        if (raw.empty()) return fallback;
        const int v = core::parse_int_or(raw, -1);
        if (v < 0) {
            throw sw::ValidationError(std::string(name) + " expects a non-negative integer");
        }
        return v;
    };

    const std::string store_path = get_arg("--store").empty() ? config::kDefaultConfigStore
                                                               : get_arg("--store");
    config::ConfigStore store(store_path);
    const std::string config_name = get_arg("--config-name");

    // File or named configuration, then command line overrides
    auto load_config = [&]() -> config::Config {
        config::Config cfg;
        const std::string config_path = get_arg("--config");
        if (!config_path.empty()) {
            cfg = config::Config::load(config_path);
        } else if (!config_name.empty()) {
            cfg = store.load(config_name);
        }

        if (!get_arg("--target").empty()) cfg.generation.target_path = get_arg("--target");
        if (!get_arg("--source").empty()) cfg.extraction.source_path = get_arg("--source");
        if (!get_arg("--masterfile").empty()) cfg.extraction.masterfile_path = get_arg("--masterfile");
        if (!get_arg("--bundles-dir").empty()) cfg.bundles.directory = get_arg("--bundles-dir");
        if (!get_arg("--log-file").empty()) cfg.logging.log_file = get_arg("--log-file");
        return cfg;
    };

    auto batch_ids = [&]() -> std::vector<std::string> {
        if (!get_arg("--ids-file").empty()) {
            return participants::import_participant_list(get_arg("--ids-file"));
        }
        return participants::parse_participant_ids(get_arg("--ids"));
    };
    const bool batch = !get_arg("--ids").empty() || !get_arg("--ids-file").empty();

    auto require_positional = [&](const char* what) -> std::string {
        std::string value = get_positional(0);
        if (value.empty()) {
            throw sw::ValidationError(command + " requires " + what);
        }
        return value;
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            std::string yaml = get_arg("--yaml");
            bool use_stdin = has_flag("--stdin");
            if (path.empty() && yaml.empty() && !use_stdin) {
                std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
                return 1;
            }
            return cmd_validate_config(path, yaml, use_stdin, has_flag("--strict-exit-codes"));
        }

        if (command == "generate" || command == "extract") {
            config::Config cfg = load_config();
            EventSink sink = open_events(cfg.logging.log_file);
            const std::vector<std::string> ids = batch ? batch_ids() : std::vector<std::string>();
            const std::string pid = batch ? std::string() : core::trim(get_positional(0));
            if (!batch && pid.empty()) {
                throw sw::ValidationError("Please enter a participant ID!");
            }

            try {
                if (command == "generate") {
                    return cmd_generate(cfg, pid, ids, batch, *sink.emitter);
                }
                return cmd_extract(cfg, pid, ids, batch, has_flag("--force"),
                                   config_name.empty() ? nullptr : &store, config_name,
                                   *sink.emitter);
            } catch (const std::exception& e) {
                sink.emitter->error(e.what());
                sink.emitter->run_end(false);
                throw;
            }
        }

        if (command == "preview") {
            return cmd_preview(load_config(), require_positional("a participant ID"));
        }

        if (command == "check-duplicate") {
            return cmd_check_duplicate(load_config(), require_positional("a participant ID"));
        }

        if (command == "check-completeness") {
            config::Config cfg = load_config();
            const int expected = get_int_arg("--expected", cfg.expected_survey_count());
            return cmd_check_completeness(cfg, require_positional("a participant ID"), expected);
        }

        if (command == "missing-report") {
            config::Config cfg = load_config();
            return cmd_missing_report(cfg, get_int_arg("--expected", cfg.expected_survey_count()));
        }

        if (command == "import-ids") {
            return cmd_import_ids(require_positional("a list file path"));
        }

        if (command == "save-bundle") {
            return cmd_save_bundle(load_config(), require_positional("a bundle name"),
                                   has_flag("--overwrite"));
        }

        if (command == "load-bundle") {
            return cmd_load_bundle(load_config(), require_positional("a bundle name"),
                                   get_arg("--into"));
        }

        if (command == "list-bundles") {
            return cmd_list_bundles(load_config());
        }

        if (command == "save-config") {
            return cmd_save_config(store, load_config(), require_positional("a configuration name"));
        }

        if (command == "load-config") {
            return cmd_load_config(store, require_positional("a configuration name"),
                                   get_arg("--output"));
        }

        if (command == "delete-config") {
            return cmd_delete_config(store, require_positional("a configuration name"));
        }

        if (command == "list-configs") {
            return cmd_list_configs(store);
        }
    } catch (const sw::ValidationError& e) {
        print_json({{"ok", false}, {"error", e.what()}, {"kind", "input"}});
        return 2;
    } catch (const std::exception& e) {
        print_json({{"ok", false}, {"error", e.what()}});
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
