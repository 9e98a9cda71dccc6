/**
 * @file child_process.h
 * @brief POSIX child process with piped stdout and stderr
 */

#ifndef CLOUDXFER_PROCESS_CHILD_PROCESS_H
#define CLOUDXFER_PROCESS_CHILD_PROCESS_H

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "cloudxfer/core/output_line_splitter.h"
#include "cloudxfer/core/types.h"

namespace cloudxfer::process {

/**
 * @brief Reads from an owned file descriptor
 *
 * The descriptor is closed on destruction. Interrupted reads are retried.
 */
class fd_byte_source : public byte_source {
public:
    explicit fd_byte_source(int fd) noexcept;
    ~fd_byte_source() override;

    fd_byte_source(const fd_byte_source&) = delete;
    auto operator=(const fd_byte_source&) -> fd_byte_source& = delete;

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> result<std::size_t> override;

    [[nodiscard]] auto fd() const noexcept -> int { return fd_; }

private:
    int fd_;
};

/**
 * @brief A spawned process whose stdout and stderr are pipes
 *
 * stdin is connected to /dev/null. The process is reaped by wait(), or by
 * the destructor (after SIGKILL) if wait() was never called.
 */
class child_process {
public:
    /**
     * @brief Start a program with arguments
     *
     * The program is looked up on PATH when it contains no '/'.
     * Start failures map to tool_not_found, tool_permission_denied,
     * tool_not_executable or process_spawn_failed.
     */
    [[nodiscard]] static auto spawn(const std::string& program,
                                    const std::vector<std::string>& args)
        -> result<child_process>;

    child_process(child_process&& other) noexcept;
    auto operator=(child_process&& other) noexcept -> child_process&;
    ~child_process();

    child_process(const child_process&) = delete;
    auto operator=(const child_process&) -> child_process& = delete;

    /**
     * @brief Hand over the stdout reader (callable once)
     */
    [[nodiscard]] auto take_stdout() -> std::unique_ptr<fd_byte_source>;

    /**
     * @brief Hand over the stderr reader (callable once)
     */
    [[nodiscard]] auto take_stderr() -> std::unique_ptr<fd_byte_source>;

    /**
     * @brief Block until the process exits
     * @return Exit status, or process_signaled / process_wait_failed
     */
    [[nodiscard]] auto wait() -> result<int>;

    /**
     * @brief Send SIGKILL if the process has not been reaped
     *
     * Must not race with a concurrent wait().
     */
    auto kill() noexcept -> void;

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

private:
    child_process(pid_t pid, int stdout_fd, int stderr_fd) noexcept;

    auto reap_on_destroy() noexcept -> void;

    pid_t pid_ = -1;
    std::unique_ptr<fd_byte_source> stdout_;
    std::unique_ptr<fd_byte_source> stderr_;
    bool reaped_ = false;
};

/**
 * @brief Map a spawn errno to an error code
 */
[[nodiscard]] auto spawn_errno_to_code(int err) noexcept -> error_code;

}  // namespace cloudxfer::process

#endif  // CLOUDXFER_PROCESS_CHILD_PROCESS_H
