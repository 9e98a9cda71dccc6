/**
 * @file transfer_dispatcher.h
 * @brief Public entry point of the transfer execution engine
 */

#ifndef CLOUDXFER_ENGINE_TRANSFER_DISPATCHER_H
#define CLOUDXFER_ENGINE_TRANSFER_DISPATCHER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "cloudxfer/adapters/thread_pool_adapter.h"
#include "cloudxfer/core/progress_parser.h"
#include "cloudxfer/core/types.h"
#include "cloudxfer/engine/engine_config.h"
#include "cloudxfer/engine/event_sink.h"
#include "cloudxfer/engine/storage_profile.h"

namespace cloudxfer {

/**
 * @brief Accepts transfer requests and runs each one as an independent job
 *
 * enqueue_upload() and enqueue_download() validate synchronously, publish a
 * queued snapshot and return the transfer id at once. Each job then waits
 * for a concurrency slot, runs the external tool and publishes throttled
 * progress snapshots followed by exactly one terminal snapshot.
 *
 * @code
 * auto dispatcher = transfer_dispatcher::builder()
 *     .with_profile(profile)
 *     .with_max_concurrent(2)
 *     .with_event_sink(sink)
 *     .build();
 * if (dispatcher) {
 *     auto id = dispatcher.value().enqueue_upload("/tmp/a.bin", "bucket", "backups/");
 * }
 * @endcode
 */
class transfer_dispatcher {
public:
    class builder {
    public:
        builder();

        /**
         * @brief Set the tool binary to run; empty means the fallback
         * @return Reference to builder for chaining
         */
        auto with_tool_path(std::string path) -> builder&;

        /**
         * @brief Set the fallback binary instead of discovering it
         * @return Reference to builder for chaining
         */
        auto with_fallback_tool_path(std::string path) -> builder&;

        /**
         * @brief Set the number of jobs allowed to run at once (min 1)
         * @return Reference to builder for chaining
         */
        auto with_max_concurrent(std::size_t count) -> builder&;

        /**
         * @brief Set the minimum gap between progress snapshots
         * @return Reference to builder for chaining
         */
        auto with_emit_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_diagnostic_capacity(std::size_t bytes) -> builder&;

        auto with_read_chunk_size(std::size_t bytes) -> builder&;

        auto with_line_queue_capacity(std::size_t lines) -> builder&;

        /**
         * @brief Set credentials and endpoint
         * @return Reference to builder for chaining
         */
        auto with_profile(storage_profile profile) -> builder&;

        /**
         * @brief Set the snapshot consumer
         * @return Reference to builder for chaining
         */
        auto with_event_sink(std::shared_ptr<event_sink> sink) -> builder&;

        /**
         * @brief Replace the output dialect parser
         * @return Reference to builder for chaining
         */
        auto with_progress_parser(std::shared_ptr<const progress_line_parser> parser) -> builder&;

        /**
         * @brief Replace the job launcher
         * @return Reference to builder for chaining
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Build the dispatcher
         * @return Result containing the dispatcher or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_dispatcher>;

    private:
        engine_config config_;
        std::shared_ptr<event_sink> sink_;
        std::shared_ptr<const progress_line_parser> parser_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    };

    // Non-copyable, movable
    transfer_dispatcher(const transfer_dispatcher&) = delete;
    auto operator=(const transfer_dispatcher&) -> transfer_dispatcher& = delete;
    transfer_dispatcher(transfer_dispatcher&&) noexcept;
    auto operator=(transfer_dispatcher&&) noexcept -> transfer_dispatcher&;

    /**
     * @brief Waits for every submitted job to finish
     */
    ~transfer_dispatcher();

    /**
     * @brief Upload one local file to <bucket>/<prefix><file name>
     * @param local_path Existing regular file
     * @param bucket Destination bucket
     * @param prefix Key prefix; a leading '/' is dropped and a trailing '/' added
     * @return Transfer id, or a validation error (no job is created)
     */
    [[nodiscard]] auto enqueue_upload(const std::string& local_path,
                                      const std::string& bucket,
                                      const std::string& prefix) -> result<std::string>;

    /**
     * @brief Download one object to a local path
     * @param bucket Source bucket
     * @param object_key Object key; a leading '/' is dropped
     * @param local_path Destination file
     * @param total_bytes_hint Object size if known, 0 otherwise
     * @return Transfer id, or a validation error (no job is created)
     */
    [[nodiscard]] auto enqueue_download(const std::string& bucket,
                                        const std::string& object_key,
                                        const std::string& local_path,
                                        uint64_t total_bytes_hint = 0) -> result<std::string>;

    /**
     * @brief Change how many jobs may run at once (clamped to at least 1)
     *
     * Takes effect immediately for waiting jobs.
     */
    auto set_concurrency_limit(std::size_t count) -> void;

    [[nodiscard]] auto get_concurrency_limit() const -> std::size_t;

    /**
     * @brief Set the tool binary for subsequent jobs; empty resets to the fallback
     */
    auto set_tool_path(const std::string& path) -> void;

    [[nodiscard]] auto tool_path() const -> std::string;

    /**
     * @brief Replace credentials for subsequent submissions
     */
    auto set_profile(const storage_profile& profile) -> void;

    [[nodiscard]] auto profile() const -> storage_profile;

    [[nodiscard]] auto get_statistics() const -> dispatcher_statistics;

    /**
     * @brief Block until every submitted job has published its terminal snapshot
     */
    auto wait_idle() -> void;

private:
    struct impl;

    explicit transfer_dispatcher(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Destination key for an upload
 *
 * A leading '/' is dropped from the prefix; a non-empty prefix without a
 * trailing '/' gets one; the file name is appended.
 */
[[nodiscard]] auto derive_upload_key(const std::string& prefix,
                                     const std::string& file_name) -> std::string;

}  // namespace cloudxfer

#endif  // CLOUDXFER_ENGINE_TRANSFER_DISPATCHER_H
