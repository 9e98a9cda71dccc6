/**
 * @file progress_aggregator.cpp
 * @brief Progress accumulation and throttled snapshot emission for one job
 */

#include "cloudxfer/core/progress_aggregator.h"

#include "cloudxfer/core/logging.h"

#include <algorithm>

namespace cloudxfer {

emission_throttle::emission_throttle(std::chrono::milliseconds interval)
    : interval_(std::max(interval, std::chrono::milliseconds::zero())) {}

auto emission_throttle::should_emit(clock::time_point now, bool force) -> bool {
    if (!force && last_emit_ && now - *last_emit_ < interval_) {
        return false;
    }
    last_emit_ = now;
    return true;
}

progress_aggregator::progress_aggregator(transfer_update record,
                                         publish_callback publish,
                                         std::chrono::milliseconds interval)
    : record_(std::move(record))
    , publish_(std::move(publish))
    , throttle_(interval) {}

auto progress_aggregator::announce() -> void {
    if (record_.updated_at_ms == 0) {
        record_.updated_at_ms = unix_time_ms();
    }
    publish(true);
}

auto progress_aggregator::begin() -> void {
    if (!advance(transfer_status::in_progress)) {
        return;
    }
    record_.started_at_ms = stamp_now();
    record_.updated_at_ms = record_.started_at_ms;
    publish(true);
}

auto progress_aggregator::apply(const progress_sample& sample) -> bool {
    if (!sample.matched()) {
        return false;
    }

    std::optional<uint64_t> candidate;
    if (sample.done_bytes) {
        candidate = *sample.done_bytes;
    } else if (sample.percent && record_.total_bytes > 0) {
        auto fraction = std::clamp(*sample.percent, 0.0, 100.0) / 100.0;
        candidate = static_cast<uint64_t>(static_cast<double>(record_.total_bytes) * fraction);
    }

    if (candidate) {
        auto done = *candidate;
        if (record_.total_bytes > 0) {
            done = std::min(done, record_.total_bytes);
        }
        record_.done_bytes = std::max(record_.done_bytes, done);
    }

    if (sample.speed_bps) {
        record_.speed_bytes_per_sec = std::max(*sample.speed_bps, 0.0);
    }

    recompute_eta();
    return true;
}

auto progress_aggregator::publish(bool force) -> bool {
    if (!throttle_.should_emit(emission_throttle::clock::now(), force)) {
        return false;
    }

    if (!is_terminal_status(record_.status) && record_.status != transfer_status::queued) {
        record_.updated_at_ms = stamp_now();
    }

    ++published_;
    if (publish_) {
        transfer_update snapshot = record_;
        publish_(snapshot);
    }
    return true;
}

auto progress_aggregator::complete() -> void {
    if (!advance(transfer_status::success)) {
        return;
    }
    record_.finished_at_ms = stamp_now();
    record_.updated_at_ms = record_.finished_at_ms;
    if (record_.total_bytes > 0) {
        record_.done_bytes = record_.total_bytes;
    }
    recompute_eta();
    publish(true);
}

auto progress_aggregator::fail(const std::string& message) -> void {
    if (!advance(transfer_status::error)) {
        return;
    }
    record_.finished_at_ms = stamp_now();
    record_.updated_at_ms = record_.finished_at_ms;
    record_.message = message;
    publish(true);
}

auto progress_aggregator::advance(transfer_status next) -> bool {
    if (!is_valid_transition(record_.status, next)) {
        CX_LOG_WARN(log_category::job,
                    "Ignoring status change " + std::string(to_string(record_.status)) +
                    " -> " + to_string(next) + " for " + record_.id);
        return false;
    }
    record_.status = next;
    return true;
}

auto progress_aggregator::recompute_eta() -> void {
    const auto total = record_.total_bytes;
    const auto done = record_.done_bytes;
    const auto speed = record_.speed_bytes_per_sec;

    if (total > 0 && speed > 0.0 && done <= total) {
        record_.eta_seconds = static_cast<uint64_t>(static_cast<double>(total - done) / speed);
    } else {
        record_.eta_seconds = 0;
    }
}

auto progress_aggregator::stamp_now() -> int64_t {
    return std::max(unix_time_ms(), record_.updated_at_ms);
}

}  // namespace cloudxfer
