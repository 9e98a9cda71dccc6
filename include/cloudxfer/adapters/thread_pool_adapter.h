// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Job launcher abstraction for the transfer dispatcher
 *
 * Every submitted transfer job gets its own thread of execution. Admission
 * control is done by the concurrency limiter inside the job, not by the
 * pool, so a job blocked waiting for a slot never starves another job of a
 * worker.
 *
 * Features:
 * - Kind-based task tracking ("upload", "download") for statistics
 * - Exceptions thrown by a task are captured in its future
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cloudxfer::adapters {

/**
 * @brief Interface for launching transfer jobs
 *
 * This abstraction allows tests and embedders to control how job threads
 * are created while the dispatcher stays unaware of the mechanism.
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task tagged with a stage name for tracking
     * @param task The task to execute
     * @param stage_name Tag used for per-stage counts (e.g., "upload")
     * @return Future for the task completion
     * @throws std::runtime_error if the pool has been shut down
     * @throws std::system_error if no thread could be started
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Stop accepting tasks
     *
     * Tasks already submitted keep running.
     */
    virtual void shutdown() = 0;

    /**
     * @brief Number of submitted tasks that have not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Number of unfinished tasks submitted under a stage name
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

/**
 * @brief Implementation using std::async with one thread per task
 *
 * @note There is no queue: a task starts as soon as it is submitted.
 *       pending_tasks() counts tasks that are still running.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    async_transfer_pool();
    ~async_transfer_pool() override;

    // Non-copyable
    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] bool is_running() const override;
    void shutdown() override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the job launcher
 */
class transfer_pool_factory {
public:
    /**
     * @brief Create the default launcher
     * @return Shared pointer to the launcher
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create();
};

}  // namespace cloudxfer::adapters
