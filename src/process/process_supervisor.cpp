/**
 * @file process_supervisor.cpp
 * @brief Runs the external transfer tool and streams its output lines
 */

#include "cloudxfer/process/process_supervisor.h"

#include "cloudxfer/core/logging.h"
#include "cloudxfer/core/output_line_splitter.h"
#include "cloudxfer/core/string_utils.h"
#include "cloudxfer/process/tool_locator.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <optional>
#include <thread>
#include <vector>

namespace cloudxfer::process {

namespace {

/**
 * @brief Bounded multi-producer, single-consumer queue of output lines
 *
 * pop() returns nullopt once every opened producer has closed and the queue
 * is drained.
 */
class line_channel {
public:
    explicit line_channel(std::size_t capacity)
        : capacity_(std::max<std::size_t>(capacity, 1)) {}

    auto open_producer() -> void {
        std::lock_guard lock(mutex_);
        ++open_producers_;
    }

    auto push(std::string_view line) -> void {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return lines_.size() < capacity_; });
        lines_.emplace_back(line);
        not_empty_.notify_one();
    }

    auto close_producer() -> void {
        std::lock_guard lock(mutex_);
        if (open_producers_ > 0) {
            --open_producers_;
        }
        not_empty_.notify_all();
    }

    auto pop() -> std::optional<std::string> {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return !lines_.empty() || open_producers_ == 0; });
        if (lines_.empty()) {
            return std::nullopt;
        }
        auto line = std::move(lines_.front());
        lines_.pop_front();
        not_full_.notify_one();
        return line;
    }

    /**
     * @brief Drop queued and future lines until every producer has closed
     */
    auto discard_remaining() -> void {
        std::unique_lock lock(mutex_);
        while (true) {
            lines_.clear();
            not_full_.notify_all();
            if (open_producers_ == 0) {
                return;
            }
            not_empty_.wait(lock);
        }
    }

private:
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> lines_;
    std::size_t capacity_;
    std::size_t open_producers_ = 0;
};

/**
 * @brief Owns the stream reader threads of one run
 *
 * If destroyed with readers still running (an exception unwinding run()),
 * kills the child and drains the channel so every reader reaches end of
 * stream, then joins them.
 */
class reader_group {
public:
    reader_group(line_channel& channel, child_process& child)
        : channel_(channel), child_(child) {
        threads_.reserve(2);
    }

    ~reader_group() {
        if (threads_.empty()) {
            return;
        }
        child_.kill();
        channel_.discard_remaining();
        join();
    }

    reader_group(const reader_group&) = delete;
    auto operator=(const reader_group&) -> reader_group& = delete;

    template <typename Reader>
    auto start(Reader reader) -> void {
        channel_.open_producer();
        try {
            threads_.emplace_back(std::move(reader));
        } catch (...) {
            channel_.close_producer();
            throw;
        }
    }

    auto join() -> void {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        threads_.clear();
    }

private:
    line_channel& channel_;
    child_process& child_;
    std::vector<std::thread> threads_;
};

auto describe_handler_failure(const std::exception_ptr& failure) -> error {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return error(error_code::internal_error,
                     std::string("output handler failed: ") + e.what());
    } catch (...) {
        return error(error_code::internal_error, "output handler failed: unknown exception");
    }
}

auto compose_failure(error err, const std::string& tail) -> error {
    if (!tail.empty()) {
        err.message += ": " + tail;
    }
    return err;
}

}  // namespace

process_supervisor::process_supervisor(std::string configured_path,
                                       std::string fallback_path,
                                       supervisor_options options)
    : configured_path_(std::string(trim(configured_path)))
    , fallback_path_(std::string(trim(fallback_path)))
    , options_(options) {}

auto process_supervisor::set_tool_path(const std::string& path) -> void {
    std::lock_guard lock(path_mutex_);
    auto trimmed = trim(path);
    configured_path_ = trimmed.empty() ? fallback_path_ : std::string(trimmed);
    CX_LOG_INFO(log_category::supervisor, "Transfer tool path set to " + configured_path_);
}

auto process_supervisor::tool_path() const -> std::string {
    std::lock_guard lock(path_mutex_);
    return configured_path_;
}

auto process_supervisor::fallback_tool_path() const -> std::string {
    std::lock_guard lock(path_mutex_);
    return fallback_path_;
}

auto process_supervisor::resolve_paths() const -> std::pair<std::string, std::string> {
    std::lock_guard lock(path_mutex_);
    std::string primary = configured_path_;
    if (primary.empty()) {
        primary = fallback_path_;
    }
    if (primary.empty()) {
        primary = default_tool_name;
    }
    return {primary, fallback_path_};
}

auto process_supervisor::start(const std::vector<std::string>& args)
    -> result<std::pair<child_process, std::string>> {
    auto [primary, fallback] = resolve_paths();

    auto child = child_process::spawn(primary, args);
    if (child) {
        return std::make_pair(std::move(child).value(), primary);
    }

    if (!is_start_failure(child.error().code) || fallback.empty() || fallback == primary) {
        return unexpected(child.error());
    }

    CX_LOG_WARN(log_category::supervisor,
                "Could not start " + primary + " (" + child.error().message +
                "), retrying with " + fallback);

    auto retry = child_process::spawn(fallback, args);
    if (!retry) {
        return unexpected(retry.error());
    }

    {
        std::lock_guard lock(path_mutex_);
        configured_path_ = fallback;
    }
    CX_LOG_INFO(log_category::supervisor, "Using fallback transfer tool " + fallback);
    return std::make_pair(std::move(retry).value(), fallback);
}

auto process_supervisor::run(const std::vector<std::string>& args,
                             const line_handler& on_line) -> result<void> {
    auto started = start(args);
    if (!started) {
        return unexpected(started.error());
    }

    auto running = std::move(started).value();
    auto& child = running.first;
    const auto& tool = running.second;
    CX_LOG_DEBUG(log_category::supervisor,
                 "Started " + tool + " (pid " + std::to_string(child.pid()) + ")");

    line_channel channel(options_.line_queue_capacity);
    auto pump = [this, &channel](std::unique_ptr<fd_byte_source> source, const char* stream) {
        try {
            auto push = [&channel](std::string_view line) { channel.push(line); };
            auto split = split_lines(*source, push, options_.read_chunk_size);
            if (!split) {
                CX_LOG_WARN(log_category::supervisor,
                            std::string(stream) + " reader stopped: " + split.error().message);
            }
        } catch (const std::exception& e) {
            CX_LOG_ERROR(log_category::supervisor,
                         std::string(stream) + " reader failed: " + e.what());
        }
        channel.close_producer();
    };

    reader_group readers(channel, child);
    readers.start([pump, source = child.take_stdout()]() mutable {
        pump(std::move(source), "stdout");
    });
    readers.start([pump, source = child.take_stderr()]() mutable {
        pump(std::move(source), "stderr");
    });
    auto exit_status = std::async(std::launch::async, [&child] { return child.wait(); });

    // A failing handler stops consumption but the channel is still drained,
    // so the readers reach end of stream and the tool runs to exit.
    diagnostic_ring_buffer tail(options_.diagnostic_capacity);
    std::exception_ptr handler_failure;
    while (auto line = channel.pop()) {
        if (handler_failure) {
            continue;
        }
        try {
            if (!on_line || !on_line(*line)) {
                tail.append_line(*line);
            }
        } catch (...) {
            handler_failure = std::current_exception();
        }
    }

    readers.join();
    auto exited = exit_status.get();

    if (handler_failure) {
        return unexpected(describe_handler_failure(handler_failure));
    }

    if (!exited) {
        return unexpected(compose_failure(exited.error(), tail.snapshot()));
    }

    if (exited.value() != 0) {
        error err(error_code::process_exit_failure,
                  tool + " exited with status " + std::to_string(exited.value()));
        return unexpected(compose_failure(std::move(err), tail.snapshot()));
    }

    return {};
}

}  // namespace cloudxfer::process
