#pragma once

#include "survey_workbench/core/utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

namespace survey_workbench::test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("survey_workbench_" + tag + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path write(const fs::path& relative, const std::string& text) const {
        fs::path p = path_ / relative;
        fs::create_directories(p.parent_path());
        core::write_text(p, text);
        return p;
    }

private:
    fs::path path_;
};

} // namespace survey_workbench::test
