/**
 * @file event_sink.h
 * @brief Consumers of transfer snapshots
 */

#ifndef CLOUDXFER_ENGINE_EVENT_SINK_H
#define CLOUDXFER_ENGINE_EVENT_SINK_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

#include "cloudxfer/core/transfer_types.h"

namespace cloudxfer {

/**
 * @brief Receives transfer snapshots
 *
 * Called from job threads, concurrently for different jobs. Delivery is
 * fire-and-forget: there is no acknowledgment and no retry.
 */
class event_sink {
public:
    virtual ~event_sink() = default;

    virtual auto on_transfer_update(const transfer_update& update) -> void = 0;
};

/**
 * @brief Forwards snapshots to a callable
 *
 * The callable runs on the job thread; keep it short or wrap this sink in a
 * queued_event_sink.
 */
class callback_event_sink : public event_sink {
public:
    using callback = std::function<void(const transfer_update&)>;

    explicit callback_event_sink(callback cb);

    auto on_transfer_update(const transfer_update& update) -> void override;

private:
    callback callback_;
};

/**
 * @brief Decouples job threads from a slow consumer
 *
 * Snapshots are queued and delivered to the wrapped sink by a single
 * delivery thread, in submission order. on_transfer_update() never waits
 * on the consumer.
 */
class queued_event_sink : public event_sink {
public:
    explicit queued_event_sink(std::shared_ptr<event_sink> target);
    ~queued_event_sink() override;

    queued_event_sink(const queued_event_sink&) = delete;
    auto operator=(const queued_event_sink&) -> queued_event_sink& = delete;

    auto on_transfer_update(const transfer_update& update) -> void override;

    /**
     * @brief Block until every queued snapshot has been delivered
     */
    auto flush() -> void;

    [[nodiscard]] auto pending() const -> std::size_t;

private:
    auto deliver_loop() -> void;

    std::shared_ptr<event_sink> target_;
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<transfer_update> queue_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

/**
 * @brief Writes each snapshot as one line of JSON
 */
class json_lines_event_sink : public event_sink {
public:
    explicit json_lines_event_sink(std::ostream& out);

    auto on_transfer_update(const transfer_update& update) -> void override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_ENGINE_EVENT_SINK_H
