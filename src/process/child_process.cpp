/**
 * @file child_process.cpp
 * @brief POSIX child process with piped stdout and stderr
 */

#include "cloudxfer/process/child_process.h"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace cloudxfer::process {

namespace {

auto errno_message(const std::string& what, int err) -> std::string {
    return what + ": " + std::strerror(err);
}

auto close_fd(int& fd) noexcept -> void {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Closes both ends of any pipe still owned on scope exit
struct pipe_pair {
    int read_end = -1;
    int write_end = -1;

    ~pipe_pair() {
        close_fd(read_end);
        close_fd(write_end);
    }

    auto open() -> int {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return errno;
        }
        read_end = fds[0];
        write_end = fds[1];
        return 0;
    }

    auto release_read() noexcept -> int {
        int fd = read_end;
        read_end = -1;
        return fd;
    }
};

struct spawn_attributes {
    posix_spawn_file_actions_t actions;
    bool initialized = false;

    ~spawn_attributes() {
        if (initialized) {
            posix_spawn_file_actions_destroy(&actions);
        }
    }
};

}  // namespace

// ============================================================================
// fd_byte_source
// ============================================================================

fd_byte_source::fd_byte_source(int fd) noexcept : fd_(fd) {}

fd_byte_source::~fd_byte_source() {
    close_fd(fd_);
}

auto fd_byte_source::read(char* buffer, std::size_t size) -> result<std::size_t> {
    while (true) {
        auto n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return unexpected(error(error_code::stream_read_error,
                                errno_message("read failed", errno)));
    }
}

// ============================================================================
// child_process
// ============================================================================

auto spawn_errno_to_code(int err) noexcept -> error_code {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return error_code::tool_not_found;
        case EACCES:
        case EPERM:
            return error_code::tool_permission_denied;
        case ENOEXEC:
            return error_code::tool_not_executable;
        default:
            return error_code::process_spawn_failed;
    }
}

child_process::child_process(pid_t pid, int stdout_fd, int stderr_fd) noexcept
    : pid_(pid)
    , stdout_(std::make_unique<fd_byte_source>(stdout_fd))
    , stderr_(std::make_unique<fd_byte_source>(stderr_fd)) {}

child_process::child_process(child_process&& other) noexcept
    : pid_(other.pid_)
    , stdout_(std::move(other.stdout_))
    , stderr_(std::move(other.stderr_))
    , reaped_(other.reaped_) {
    other.pid_ = -1;
    other.reaped_ = true;
}

auto child_process::operator=(child_process&& other) noexcept -> child_process& {
    if (this != &other) {
        reap_on_destroy();
        pid_ = other.pid_;
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
        reaped_ = other.reaped_;
        other.pid_ = -1;
        other.reaped_ = true;
    }
    return *this;
}

child_process::~child_process() {
    reap_on_destroy();
}

auto child_process::spawn(const std::string& program,
                          const std::vector<std::string>& args) -> result<child_process> {
    pipe_pair out_pipe;
    pipe_pair err_pipe;
    if (int err = out_pipe.open(); err != 0) {
        return unexpected(error(error_code::process_spawn_failed,
                                errno_message("stdout pipe", err)));
    }
    if (int err = err_pipe.open(); err != 0) {
        return unexpected(error(error_code::process_spawn_failed,
                                errno_message("stderr pipe", err)));
    }

    spawn_attributes attrs;
    if (int err = posix_spawn_file_actions_init(&attrs.actions); err != 0) {
        return unexpected(error(error_code::process_spawn_failed,
                                errno_message("spawn file actions", err)));
    }
    attrs.initialized = true;

    int rc = posix_spawn_file_actions_addopen(&attrs.actions, STDIN_FILENO, "/dev/null",
                                              O_RDONLY, 0);
    if (rc == 0) {
        rc = posix_spawn_file_actions_adddup2(&attrs.actions, out_pipe.write_end, STDOUT_FILENO);
    }
    if (rc == 0) {
        rc = posix_spawn_file_actions_adddup2(&attrs.actions, err_pipe.write_end, STDERR_FILENO);
    }
    if (rc != 0) {
        return unexpected(error(error_code::process_spawn_failed,
                                errno_message("spawn file actions", rc)));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    rc = posix_spawnp(&pid, program.c_str(), &attrs.actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        return unexpected(error(spawn_errno_to_code(rc),
                                errno_message("failed to start " + program, rc)));
    }

    // The child holds its own copies; EOF arrives once it exits.
    close_fd(out_pipe.write_end);
    close_fd(err_pipe.write_end);

    return child_process(pid, out_pipe.release_read(), err_pipe.release_read());
}

auto child_process::take_stdout() -> std::unique_ptr<fd_byte_source> {
    return std::move(stdout_);
}

auto child_process::take_stderr() -> std::unique_ptr<fd_byte_source> {
    return std::move(stderr_);
}

auto child_process::wait() -> result<int> {
    if (pid_ <= 0 || reaped_) {
        return unexpected(error(error_code::process_wait_failed, "process already reaped"));
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return unexpected(error(error_code::process_wait_failed,
                                errno_message("waitpid failed", errno)));
    }
    reaped_ = true;

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return unexpected(error(error_code::process_signaled,
                                "terminated by signal " + std::to_string(WTERMSIG(status))));
    }
    return unexpected(error(error_code::process_wait_failed, "unexpected wait status"));
}

auto child_process::kill() noexcept -> void {
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
    }
}

auto child_process::reap_on_destroy() noexcept -> void {
    if (pid_ <= 0 || reaped_) {
        return;
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
}

}  // namespace cloudxfer::process
