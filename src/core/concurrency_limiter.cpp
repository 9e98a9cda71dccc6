/**
 * @file concurrency_limiter.cpp
 * @brief Admission gate bounding the number of running transfers
 */

#include "cloudxfer/core/concurrency_limiter.h"

#include <algorithm>

namespace cloudxfer {

concurrency_limiter::concurrency_limiter(std::size_t max_active)
    : active_(0)
    , max_(std::max<std::size_t>(max_active, 1)) {}

auto concurrency_limiter::acquire() -> void {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return active_ < max_; });
    ++active_;
}

auto concurrency_limiter::try_acquire() -> bool {
    std::lock_guard lock(mutex_);
    if (active_ >= max_) {
        return false;
    }
    ++active_;
    return true;
}

auto concurrency_limiter::release() -> void {
    {
        std::lock_guard lock(mutex_);
        if (active_ == 0) {
            return;
        }
        --active_;
    }
    // One slot opened up, so one waiter can claim it
    cv_.notify_one();
}

auto concurrency_limiter::set_max(std::size_t max_active) -> void {
    {
        std::lock_guard lock(mutex_);
        max_ = std::max<std::size_t>(max_active, 1);
    }
    cv_.notify_all();
}

auto concurrency_limiter::max() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return max_;
}

auto concurrency_limiter::active() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return active_;
}

scoped_slot::scoped_slot(concurrency_limiter& limiter)
    : limiter_(limiter) {
    limiter_.acquire();
}

scoped_slot::~scoped_slot() {
    limiter_.release();
}

}  // namespace cloudxfer
