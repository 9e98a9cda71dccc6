/**
 * @file tool_locator.cpp
 * @brief Discovery of the external transfer tool binary
 */

#include "cloudxfer/process/tool_locator.h"

#include "cloudxfer/core/logging.h"

namespace cloudxfer::process {

namespace fs = std::filesystem;

namespace {

auto exists_quietly(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

}  // namespace

auto executable_directory() -> std::optional<fs::path> {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
}

auto discover_tool_path(const std::string& name, std::optional<fs::path> exe_dir) -> std::string {
    std::string found = name;

    if (!exe_dir) {
        exe_dir = executable_directory();
    }

    if (exe_dir) {
        auto bin_path = *exe_dir / "bin" / name;
        if (exists_quietly(bin_path)) {
            found = bin_path.string();
        }

        auto same_dir_path = *exe_dir / name;
        if (exists_quietly(same_dir_path)) {
            found = same_dir_path.string();
        }
    }

    if (found == name) {
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        if (!ec) {
            auto cwd_bin_path = cwd / "bin" / name;
            if (exists_quietly(cwd_bin_path)) {
                found = cwd_bin_path.string();
            }
        }
    }

    CX_LOG_DEBUG(log_category::supervisor, "Discovered transfer tool: " + found);
    return found;
}

}  // namespace cloudxfer::process
