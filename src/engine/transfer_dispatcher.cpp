/**
 * @file transfer_dispatcher.cpp
 * @brief Public entry point of the transfer execution engine
 */

#include "cloudxfer/engine/transfer_dispatcher.h"

#include "cloudxfer/core/concurrency_limiter.h"
#include "cloudxfer/core/logging.h"
#include "cloudxfer/core/progress_aggregator.h"
#include "cloudxfer/core/string_utils.h"
#include "cloudxfer/engine/transfer_command.h"
#include "cloudxfer/process/process_supervisor.h"
#include "cloudxfer/process/tool_locator.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <future>
#include <mutex>
#include <vector>

namespace cloudxfer {

namespace {

auto make_context(const transfer_update& record) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = record.id;
    ctx.name = record.name;
    ctx.bucket = record.bucket;
    ctx.key = record.key;
    ctx.local_path = record.local_path;
    if (record.total_bytes > 0) {
        ctx.total_bytes = record.total_bytes;
    }
    ctx.done_bytes = record.done_bytes;
    if (record.finished_at_ms > 0 && record.started_at_ms > 0) {
        ctx.duration_ms = static_cast<uint64_t>(record.finished_at_ms - record.started_at_ms);
    }
    if (!record.message.empty()) {
        ctx.error_message = record.message;
    }
    return ctx;
}

}  // namespace

auto derive_upload_key(const std::string& prefix, const std::string& file_name) -> std::string {
    std::string key(trim_prefix(prefix, "/"));
    if (!key.empty() && !ends_with(key, "/")) {
        key += '/';
    }
    key += file_name;
    return key;
}

// ============================================================================
// transfer_dispatcher::impl
// ============================================================================

struct transfer_dispatcher::impl {
    impl(engine_config cfg,
         std::shared_ptr<event_sink> event_consumer,
         std::shared_ptr<const progress_line_parser> line_parser,
         std::shared_ptr<adapters::transfer_thread_pool_interface> job_pool)
        : config(std::move(cfg))
        , sink(std::move(event_consumer))
        , parser(std::move(line_parser))
        , pool(std::move(job_pool))
        , limiter(config.max_concurrent)
        , supervisor(config.tool_path,
                     config.fallback_tool_path.value_or(std::string{}),
                     process::supervisor_options{config.read_chunk_size,
                                                 config.line_queue_capacity,
                                                 config.diagnostic_capacity})
        , profile(config.profile) {}

    engine_config config;
    std::shared_ptr<event_sink> sink;
    std::shared_ptr<const progress_line_parser> parser;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;

    concurrency_limiter limiter;
    process::process_supervisor supervisor;

    mutable std::mutex profile_mutex;
    storage_profile profile;

    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> active{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> failed{0};

    std::mutex jobs_mutex;
    std::condition_variable idle_cv;
    std::size_t in_flight = 0;
    std::vector<std::future<void>> jobs;

    auto publish(const transfer_update& update) -> void {
        if (!sink) {
            return;
        }
        try {
            sink->on_transfer_update(update);
        } catch (const std::exception& e) {
            CX_LOG_ERROR(log_category::dispatcher,
                         "Event sink threw for " + update.id + ": " + e.what());
        }
    }

    auto current_profile() const -> storage_profile {
        std::lock_guard lock(profile_mutex);
        return profile;
    }

    auto submit(transfer_update record) -> std::string {
        auto id = record.id;
        auto kind = record.kind;
        auto aggregator = std::make_shared<progress_aggregator>(
            std::move(record),
            [this](const transfer_update& update) { publish(update); },
            config.emit_interval);

        {
            std::lock_guard lock(jobs_mutex);
            ++in_flight;
        }
        submitted.fetch_add(1, std::memory_order_relaxed);

        aggregator->announce();

        auto job_profile = current_profile();
        auto job = [this, aggregator, job_profile]() { run_job(*aggregator, job_profile); };

        std::string launch_failure;
        {
            std::lock_guard lock(jobs_mutex);
            jobs.erase(std::remove_if(jobs.begin(), jobs.end(),
                                      [](const std::future<void>& f) {
                                          return f.wait_for(std::chrono::seconds(0)) ==
                                                 std::future_status::ready;
                                      }),
                       jobs.end());
            if (!pool->is_running()) {
                launch_failure = "worker pool is not running";
            } else {
                try {
                    jobs.reserve(jobs.size() + 1);
                    jobs.push_back(pool->submit_to_stage(std::move(job), to_string(kind)));
                    return id;
                } catch (const std::exception& e) {
                    launch_failure = e.what();
                }
            }
        }

        abandon_launch(*aggregator, launch_failure);
        return id;
    }

    // The job never reached run_job, so its bookkeeping is settled here.
    auto abandon_launch(progress_aggregator& aggregator, const std::string& reason) -> void {
        aggregator.fail("failed to launch job: " + reason);
        failed.fetch_add(1, std::memory_order_relaxed);
        auto ctx = make_context(aggregator.record());
        CX_LOG_ERROR_CTX(log_category::dispatcher, "Transfer could not be launched", ctx);

        std::lock_guard lock(jobs_mutex);
        if (in_flight > 0) {
            --in_flight;
        }
        idle_cv.notify_all();
    }

    auto run_job(progress_aggregator& aggregator, const storage_profile& job_profile) -> void {
        {
            scoped_slot slot(limiter);
            active.fetch_add(1, std::memory_order_relaxed);

            aggregator.begin();
            try {
                execute(aggregator, job_profile);
            } catch (const std::exception& e) {
                aggregator.fail(std::string(to_string(error_code::internal_error)) + ": " +
                                e.what());
            }

            active.fetch_sub(1, std::memory_order_relaxed);
        }

        const auto& record = aggregator.record();
        auto ctx = make_context(record);
        if (record.status == transfer_status::success) {
            succeeded.fetch_add(1, std::memory_order_relaxed);
            CX_LOG_INFO_CTX(log_category::job, "Transfer completed", ctx);
        } else {
            failed.fetch_add(1, std::memory_order_relaxed);
            CX_LOG_ERROR_CTX(log_category::job, "Transfer failed", ctx);
        }

        std::lock_guard lock(jobs_mutex);
        if (in_flight > 0) {
            --in_flight;
        }
        idle_cv.notify_all();
    }

    auto execute(progress_aggregator& aggregator, const storage_profile& job_profile) -> void {
        const auto& record = aggregator.record();

        auto command = make_transfer_command(record.kind);
        if (!command) {
            aggregator.fail(to_string(error_code::unknown_transfer_kind));
            return;
        }

        auto args = command->build_arguments(record, job_profile);
        if (get_logger().is_enabled(log_level::debug)) {
            CX_LOG_DEBUG(log_category::job, record.id + ": " + describe_arguments(args));
        }

        auto outcome = supervisor.run(args, [this, &aggregator](std::string_view line) {
            if (!aggregator.apply(parser->parse(line))) {
                return false;
            }
            aggregator.publish();
            return true;
        });

        if (outcome) {
            aggregator.complete();
        } else {
            aggregator.fail(outcome.error().message);
        }
    }

    auto wait_idle() -> void {
        std::unique_lock lock(jobs_mutex);
        idle_cv.wait(lock, [this] { return in_flight == 0; });
    }

    auto join_all() -> void {
        wait_idle();
        std::vector<std::future<void>> finished;
        {
            std::lock_guard lock(jobs_mutex);
            finished.swap(jobs);
        }
        for (auto& f : finished) {
            f.wait();
        }
    }
};

// ============================================================================
// transfer_dispatcher::builder
// ============================================================================

transfer_dispatcher::builder::builder() = default;

auto transfer_dispatcher::builder::with_tool_path(std::string path) -> builder& {
    config_.tool_path = std::move(path);
    return *this;
}

auto transfer_dispatcher::builder::with_fallback_tool_path(std::string path) -> builder& {
    config_.fallback_tool_path = std::move(path);
    return *this;
}

auto transfer_dispatcher::builder::with_max_concurrent(std::size_t count) -> builder& {
    config_.max_concurrent = std::max<std::size_t>(count, 1);
    return *this;
}

auto transfer_dispatcher::builder::with_emit_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.emit_interval = interval;
    return *this;
}

auto transfer_dispatcher::builder::with_diagnostic_capacity(std::size_t bytes) -> builder& {
    config_.diagnostic_capacity = bytes;
    return *this;
}

auto transfer_dispatcher::builder::with_read_chunk_size(std::size_t bytes) -> builder& {
    config_.read_chunk_size = bytes;
    return *this;
}

auto transfer_dispatcher::builder::with_line_queue_capacity(std::size_t lines) -> builder& {
    config_.line_queue_capacity = lines;
    return *this;
}

auto transfer_dispatcher::builder::with_profile(storage_profile profile) -> builder& {
    config_.profile = std::move(profile);
    return *this;
}

auto transfer_dispatcher::builder::with_event_sink(std::shared_ptr<event_sink> sink) -> builder& {
    sink_ = std::move(sink);
    return *this;
}

auto transfer_dispatcher::builder::with_progress_parser(
    std::shared_ptr<const progress_line_parser> parser) -> builder& {
    parser_ = std::move(parser);
    return *this;
}

auto transfer_dispatcher::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_dispatcher::builder::build() -> result<transfer_dispatcher> {
    if (config_.emit_interval < std::chrono::milliseconds::zero()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Emit interval must not be negative"}};
    }
    if (config_.read_chunk_size == 0 || config_.line_queue_capacity == 0 ||
        config_.diagnostic_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Chunk size, line queue and diagnostic capacity must be positive"}};
    }

    if (!config_.fallback_tool_path) {
        config_.fallback_tool_path = process::discover_tool_path();
    }
    if (!parser_) {
        parser_ = make_default_progress_parser();
    }
    if (!pool_) {
        pool_ = adapters::transfer_pool_factory::create();
    }

    return transfer_dispatcher{std::make_unique<impl>(
        std::move(config_), std::move(sink_), std::move(parser_), std::move(pool_))};
}

// ============================================================================
// transfer_dispatcher
// ============================================================================

transfer_dispatcher::transfer_dispatcher(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {
    get_logger().initialize();
    CX_LOG_INFO(log_category::dispatcher,
                "Transfer dispatcher created (max concurrent " +
                std::to_string(impl_->limiter.max()) + ", tool " +
                impl_->supervisor.tool_path() + ", fallback " +
                impl_->supervisor.fallback_tool_path() + ")");
}

transfer_dispatcher::transfer_dispatcher(transfer_dispatcher&&) noexcept = default;

auto transfer_dispatcher::operator=(transfer_dispatcher&& other) noexcept
    -> transfer_dispatcher& {
    if (this != &other) {
        if (impl_) {
            impl_->join_all();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

transfer_dispatcher::~transfer_dispatcher() {
    if (impl_) {
        impl_->join_all();
    }
}

auto transfer_dispatcher::enqueue_upload(const std::string& local_path,
                                         const std::string& bucket,
                                         const std::string& prefix) -> result<std::string> {
    namespace fs = std::filesystem;

    std::string path(trim(local_path));
    if (path.empty()) {
        return unexpected{error{error_code::empty_local_path}};
    }
    std::string bucket_name(trim(bucket));
    if (bucket_name.empty()) {
        return unexpected{error{error_code::empty_bucket}};
    }

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        auto reason = ec ? ec.message() : std::string("no such file");
        return unexpected{error{error_code::local_path_not_found,
                                "stat local file failed: " + reason}};
    }
    if (fs::is_directory(status)) {
        return unexpected{error{error_code::local_path_is_directory}};
    }
    if (!fs::is_regular_file(status)) {
        return unexpected{error{error_code::local_path_not_regular}};
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::local_path_not_found,
                                "stat local file failed: " + ec.message()}};
    }

    auto file_name = fs::path(path).filename().string();

    transfer_update record;
    record.id = next_transfer_id();
    record.kind = transfer_kind::upload;
    record.status = transfer_status::queued;
    record.name = file_name;
    record.bucket = bucket_name;
    record.key = derive_upload_key(prefix, file_name);
    record.local_path = path;
    record.total_bytes = size;
    record.updated_at_ms = unix_time_ms();

    CX_LOG_INFO(log_category::dispatcher,
                "Queued upload " + record.id + " -> " + record.bucket + "/" + record.key);
    return impl_->submit(std::move(record));
}

auto transfer_dispatcher::enqueue_download(const std::string& bucket,
                                           const std::string& object_key,
                                           const std::string& local_path,
                                           uint64_t total_bytes_hint) -> result<std::string> {
    std::string path(trim(local_path));
    std::string key(trim_prefix(trim(object_key), "/"));
    if (path.empty()) {
        return unexpected{error{error_code::empty_local_path}};
    }
    std::string bucket_name(trim(bucket));
    if (bucket_name.empty()) {
        return unexpected{error{error_code::empty_bucket}};
    }
    if (key.empty()) {
        return unexpected{error{error_code::empty_object_key}};
    }

    transfer_update record;
    record.id = next_transfer_id();
    record.kind = transfer_kind::download;
    record.status = transfer_status::queued;
    record.name = object_base_name(key);
    record.bucket = bucket_name;
    record.key = key;
    record.local_path = path;
    record.total_bytes = total_bytes_hint;
    record.updated_at_ms = unix_time_ms();

    CX_LOG_INFO(log_category::dispatcher,
                "Queued download " + record.id + " <- " + record.bucket + "/" + record.key);
    return impl_->submit(std::move(record));
}

auto transfer_dispatcher::set_concurrency_limit(std::size_t count) -> void {
    impl_->limiter.set_max(count);
    CX_LOG_INFO(log_category::limiter,
                "Concurrency limit set to " + std::to_string(impl_->limiter.max()));
}

auto transfer_dispatcher::get_concurrency_limit() const -> std::size_t {
    return impl_->limiter.max();
}

auto transfer_dispatcher::set_tool_path(const std::string& path) -> void {
    impl_->supervisor.set_tool_path(path);
}

auto transfer_dispatcher::tool_path() const -> std::string {
    return impl_->supervisor.tool_path();
}

auto transfer_dispatcher::set_profile(const storage_profile& profile) -> void {
    std::lock_guard lock(impl_->profile_mutex);
    impl_->profile = profile;
}

auto transfer_dispatcher::profile() const -> storage_profile {
    return impl_->current_profile();
}

auto transfer_dispatcher::get_statistics() const -> dispatcher_statistics {
    dispatcher_statistics stats;
    stats.submitted = impl_->submitted.load(std::memory_order_relaxed);
    stats.active = impl_->active.load(std::memory_order_relaxed);
    stats.succeeded = impl_->succeeded.load(std::memory_order_relaxed);
    stats.failed = impl_->failed.load(std::memory_order_relaxed);
    return stats;
}

auto transfer_dispatcher::wait_idle() -> void {
    impl_->wait_idle();
}

}  // namespace cloudxfer
