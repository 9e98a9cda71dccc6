/**
 * @file tool_locator.h
 * @brief Discovery of the external transfer tool binary
 */

#ifndef CLOUDXFER_PROCESS_TOOL_LOCATOR_H
#define CLOUDXFER_PROCESS_TOOL_LOCATOR_H

#include <filesystem>
#include <optional>
#include <string>

namespace cloudxfer::process {

/// Tool invoked when nothing else is configured
inline constexpr const char* default_tool_name = "ossutil";

/**
 * @brief Locate a bundled tool binary
 *
 * Search order:
 * 1. <exe_dir>/bin/<name>
 * 2. <exe_dir>/<name> (takes precedence over 1 when both exist)
 * 3. <cwd>/bin/<name>
 * 4. the bare name, resolved through PATH at spawn time
 *
 * @param name Tool file name
 * @param exe_dir Directory of the running executable, detected when empty
 */
[[nodiscard]] auto discover_tool_path(const std::string& name = default_tool_name,
                                      std::optional<std::filesystem::path> exe_dir = std::nullopt)
    -> std::string;

/**
 * @brief Directory holding the running executable, if it can be determined
 */
[[nodiscard]] auto executable_directory() -> std::optional<std::filesystem::path>;

}  // namespace cloudxfer::process

#endif  // CLOUDXFER_PROCESS_TOOL_LOCATOR_H
