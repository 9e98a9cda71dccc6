// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Job launcher implementation for cloudxfer
 */

#include "cloudxfer/adapters/thread_pool_adapter.h"

#include <stdexcept>

namespace cloudxfer::adapters {

// ============================================================================
// Stage tracking helper
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end()) {
            return it->second;
        }
        return 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

}  // namespace

// ============================================================================
// async_transfer_pool implementation
// ============================================================================

// Shared with running tasks so the counters outlive the pool object
struct async_transfer_pool::impl {
    std::atomic<bool> running{true};
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;

    void finish(const std::string& stage_name) {
        active_tasks.fetch_sub(1, std::memory_order_relaxed);
        tracker.decrement(stage_name);
    }
};

async_transfer_pool::async_transfer_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    if (!pimpl_->running.load(std::memory_order_acquire)) {
        throw std::runtime_error("transfer pool is shut down");
    }

    pimpl_->tracker.increment(stage_name);
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    try {
        return std::async(std::launch::async,
                          [pimpl = pimpl_, task = std::move(task), stage = stage_name]() {
                              try {
                                  task();
                              } catch (...) {
                                  pimpl->finish(stage);
                                  throw;
                              }
                              pimpl->finish(stage);
                          });
    } catch (...) {
        pimpl_->finish(stage_name);
        throw;
    }
}

bool async_transfer_pool::is_running() const {
    return pimpl_->running.load(std::memory_order_acquire);
}

void async_transfer_pool::shutdown() {
    pimpl_->running.store(false, std::memory_order_release);
}

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create() {
    return std::make_shared<async_transfer_pool>();
}

}  // namespace cloudxfer::adapters
