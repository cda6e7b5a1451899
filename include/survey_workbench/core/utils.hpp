#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace survey_workbench::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& suffix);
std::vector<fs::path> list_subdirectories(const fs::path& dir);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_file_with_metadata(const fs::path& src, const fs::path& dst);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string strip_utf8_bom(const std::string& s);

// Parses a whole-string integer, returning fallback for anything else
int parse_int_or(const std::string& text, int fallback);

} // namespace survey_workbench::core
