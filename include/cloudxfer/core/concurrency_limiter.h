/**
 * @file concurrency_limiter.h
 * @brief Admission gate bounding the number of running transfers
 */

#ifndef CLOUDXFER_CORE_CONCURRENCY_LIMITER_H
#define CLOUDXFER_CORE_CONCURRENCY_LIMITER_H

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace cloudxfer {

/**
 * @brief Counting gate with a runtime-adjustable capacity
 *
 * Invariant: 0 <= active <= max, max >= 1. Lowering the capacity below the
 * current active count does not preempt running holders; new acquisitions
 * simply wait until enough slots have been released.
 *
 * @code
 * concurrency_limiter limiter(2);
 *
 * {
 *     scoped_slot slot(limiter);  // Blocks while 2 slots are taken
 *     // Run the transfer...
 * }
 *
 * limiter.set_max(4);  // Wakes waiters immediately
 * @endcode
 */
class concurrency_limiter {
public:
    /**
     * @brief Construct a limiter
     * @param max_active Capacity, clamped to at least 1
     */
    explicit concurrency_limiter(std::size_t max_active = 1);

    concurrency_limiter(const concurrency_limiter&) = delete;
    auto operator=(const concurrency_limiter&) -> concurrency_limiter& = delete;

    /**
     * @brief Block until a slot is free, then take it
     *
     * Must be paired with release().
     */
    auto acquire() -> void;

    /**
     * @brief Take a slot if one is free right now
     * @return true if a slot was taken
     */
    [[nodiscard]] auto try_acquire() -> bool;

    /**
     * @brief Give back a slot taken by acquire()/try_acquire()
     */
    auto release() -> void;

    /**
     * @brief Change the capacity
     * @param max_active New capacity, clamped to at least 1
     */
    auto set_max(std::size_t max_active) -> void;

    [[nodiscard]] auto max() const -> std::size_t;

    [[nodiscard]] auto active() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_;
    std::size_t max_;
};

/**
 * @brief RAII holder of one limiter slot
 */
class scoped_slot {
public:
    explicit scoped_slot(concurrency_limiter& limiter);
    ~scoped_slot();

    scoped_slot(const scoped_slot&) = delete;
    auto operator=(const scoped_slot&) -> scoped_slot& = delete;
    scoped_slot(scoped_slot&&) = delete;
    auto operator=(scoped_slot&&) -> scoped_slot& = delete;

private:
    concurrency_limiter& limiter_;
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_CONCURRENCY_LIMITER_H
