/**
 * @file engine_config.h
 * @brief Transfer engine configuration
 */

#ifndef CLOUDXFER_ENGINE_ENGINE_CONFIG_H
#define CLOUDXFER_ENGINE_ENGINE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "cloudxfer/core/diagnostic_ring_buffer.h"
#include "cloudxfer/core/progress_aggregator.h"
#include "cloudxfer/engine/storage_profile.h"

namespace cloudxfer {

/**
 * @brief Dispatcher configuration
 */
struct engine_config {
    std::string tool_path;                             // empty: use the fallback
    std::optional<std::string> fallback_tool_path;     // nullopt: discover_tool_path()
    std::size_t max_concurrent = 1;
    std::chrono::milliseconds emit_interval = emission_throttle::default_interval;
    std::size_t diagnostic_capacity = diagnostic_ring_buffer::default_capacity;
    std::size_t read_chunk_size = 4096;
    std::size_t line_queue_capacity = 128;
    storage_profile profile;
};

/**
 * @brief Dispatcher counters
 */
struct dispatcher_statistics {
    uint64_t submitted = 0;   ///< Jobs accepted by enqueue_*
    uint64_t active = 0;      ///< Jobs holding a concurrency slot
    uint64_t succeeded = 0;
    uint64_t failed = 0;

    [[nodiscard]] auto in_flight() const noexcept -> uint64_t {
        return submitted - succeeded - failed;
    }
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_ENGINE_ENGINE_CONFIG_H
