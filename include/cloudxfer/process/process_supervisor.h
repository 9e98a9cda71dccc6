/**
 * @file process_supervisor.h
 * @brief Runs the external transfer tool and streams its output lines
 */

#ifndef CLOUDXFER_PROCESS_PROCESS_SUPERVISOR_H
#define CLOUDXFER_PROCESS_PROCESS_SUPERVISOR_H

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cloudxfer/core/diagnostic_ring_buffer.h"
#include "cloudxfer/core/types.h"
#include "cloudxfer/process/child_process.h"

namespace cloudxfer::process {

/**
 * @brief Tuning for one supervised run
 */
struct supervisor_options {
    std::size_t read_chunk_size = 4096;
    std::size_t line_queue_capacity = 128;
    std::size_t diagnostic_capacity = diagnostic_ring_buffer::default_capacity;
};

/**
 * @brief Starts the transfer tool, pumps its output and reports the exit
 *
 * Owns the binary preference shared by all jobs: a configured path and an
 * auto-discovered fallback. When the configured binary cannot be started,
 * the fallback is tried once and, on success, becomes the configured path.
 * A process that starts and then fails is never retried.
 *
 * Thread-safe: run() may be called from several job threads at once.
 */
class process_supervisor {
public:
    /**
     * @brief Receives each output line on the calling thread of run()
     * @return true if the line carried progress, false if it is diagnostic
     */
    using line_handler = std::function<bool(std::string_view)>;

    process_supervisor(std::string configured_path,
                       std::string fallback_path,
                       supervisor_options options = {});

    process_supervisor(const process_supervisor&) = delete;
    auto operator=(const process_supervisor&) -> process_supervisor& = delete;

    /**
     * @brief Run the tool to completion
     *
     * stdout and stderr are read by two threads and funneled, as lines, to
     * on_line on the caller's thread while a third task waits for the exit.
     * Lines rejected by on_line are kept in a diagnostic tail that is
     * appended to the error message of a failed run.
     */
    [[nodiscard]] auto run(const std::vector<std::string>& args,
                           const line_handler& on_line) -> result<void>;

    /**
     * @brief Replace the configured path; empty resets to the fallback
     */
    auto set_tool_path(const std::string& path) -> void;

    [[nodiscard]] auto tool_path() const -> std::string;

    [[nodiscard]] auto fallback_tool_path() const -> std::string;

    [[nodiscard]] auto options() const noexcept -> const supervisor_options& { return options_; }

private:
    auto start(const std::vector<std::string>& args)
        -> result<std::pair<child_process, std::string>>;

    auto resolve_paths() const -> std::pair<std::string, std::string>;

    mutable std::mutex path_mutex_;
    std::string configured_path_;
    std::string fallback_path_;
    supervisor_options options_;
};

}  // namespace cloudxfer::process

#endif  // CLOUDXFER_PROCESS_PROCESS_SUPERVISOR_H
