/**
 * @file progress_aggregator.h
 * @brief Progress accumulation and throttled snapshot emission for one job
 */

#ifndef CLOUDXFER_CORE_PROGRESS_AGGREGATOR_H
#define CLOUDXFER_CORE_PROGRESS_AGGREGATOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "cloudxfer/core/progress_parser.h"
#include "cloudxfer/core/transfer_types.h"

namespace cloudxfer {

/**
 * @brief Rate gate for snapshot emission
 *
 * State is the time of the last emission. A forced request always passes
 * and restarts the interval.
 */
class emission_throttle {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds default_interval{250};

    explicit emission_throttle(std::chrono::milliseconds interval = default_interval);

    /**
     * @brief Decide whether to emit at the given time
     *
     * Records the emission when returning true.
     */
    [[nodiscard]] auto should_emit(clock::time_point now, bool force) -> bool;

    auto reset() -> void { last_emit_.reset(); }

    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds { return interval_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<clock::time_point> last_emit_;
};

/**
 * @brief Owns one job's transfer record and publishes snapshots of it
 *
 * Used by a single job thread only. Every published snapshot is a copy, so
 * the consumer never observes later mutations.
 *
 * Forced emissions: the queued snapshot, the first in-progress snapshot and
 * the terminal snapshot. Progress snapshots in between are throttled.
 */
class progress_aggregator {
public:
    using publish_callback = std::function<void(const transfer_update&)>;

    progress_aggregator(transfer_update record,
                        publish_callback publish,
                        std::chrono::milliseconds interval = emission_throttle::default_interval);

    /**
     * @brief Publish the queued snapshot
     */
    auto announce() -> void;

    /**
     * @brief Move to in-progress, stamp the start time and publish
     */
    auto begin() -> void;

    /**
     * @brief Fold one parsed line into the record
     *
     * An absolute byte count wins over a percentage; a percentage is only
     * used when the total size is known. Bytes never decrease and never
     * exceed a known total.
     *
     * @return true if the sample carried any progress figure
     */
    auto apply(const progress_sample& sample) -> bool;

    /**
     * @brief Publish a snapshot unless one went out within the interval
     * @return true if a snapshot was published
     */
    auto publish(bool force = false) -> bool;

    /**
     * @brief Move to success, fill bytes to the total and publish
     */
    auto complete() -> void;

    /**
     * @brief Move to error with a message and publish
     */
    auto fail(const std::string& message) -> void;

    [[nodiscard]] auto record() const noexcept -> const transfer_update& { return record_; }

    [[nodiscard]] auto published_count() const noexcept -> uint64_t { return published_; }

private:
    auto advance(transfer_status next) -> bool;
    auto recompute_eta() -> void;
    auto stamp_now() -> int64_t;

    transfer_update record_;
    publish_callback publish_;
    emission_throttle throttle_;
    uint64_t published_ = 0;
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_PROGRESS_AGGREGATOR_H
