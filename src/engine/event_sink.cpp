/**
 * @file event_sink.cpp
 * @brief Consumers of transfer snapshots
 */

#include "cloudxfer/engine/event_sink.h"

#include "cloudxfer/core/logging.h"

#include <exception>

namespace cloudxfer {

// ============================================================================
// callback_event_sink
// ============================================================================

callback_event_sink::callback_event_sink(callback cb) : callback_(std::move(cb)) {}

auto callback_event_sink::on_transfer_update(const transfer_update& update) -> void {
    if (callback_) {
        callback_(update);
    }
}

// ============================================================================
// queued_event_sink
// ============================================================================

queued_event_sink::queued_event_sink(std::shared_ptr<event_sink> target)
    : target_(std::move(target))
    , worker_([this] { deliver_loop(); }) {}

queued_event_sink::~queued_event_sink() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto queued_event_sink::on_transfer_update(const transfer_update& update) -> void {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(update);
    }
    queue_cv_.notify_one();
}

auto queued_event_sink::flush() -> void {
    std::unique_lock lock(mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

auto queued_event_sink::pending() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

auto queued_event_sink::deliver_loop() -> void {
    std::unique_lock lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping with nothing left to deliver
            break;
        }

        auto update = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        if (target_) {
            try {
                target_->on_transfer_update(update);
            } catch (const std::exception& e) {
                CX_LOG_ERROR(log_category::dispatcher,
                             "Event sink threw while delivering " + update.id + ": " + e.what());
            }
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            drained_cv_.notify_all();
        }
    }
    drained_cv_.notify_all();
}

// ============================================================================
// json_lines_event_sink
// ============================================================================

json_lines_event_sink::json_lines_event_sink(std::ostream& out) : out_(out) {}

auto json_lines_event_sink::on_transfer_update(const transfer_update& update) -> void {
    auto line = update.to_json();
    std::lock_guard lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace cloudxfer
