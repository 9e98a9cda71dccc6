/**
 * @file transfer_types.cpp
 * @brief Transfer id generation and snapshot serialization
 */

#include "cloudxfer/core/transfer_types.h"

#include "cloudxfer/core/logging.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace cloudxfer {

namespace {

std::atomic<uint64_t> transfer_sequence{0};

}  // namespace

auto unix_time_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto next_transfer_id() -> std::string {
    auto seq = transfer_sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return "tr-" + std::to_string(unix_time_ms()) + "-" + std::to_string(seq);
}

auto transfer_update::to_json() const -> std::string {
    std::ostringstream oss;

    auto add_string = [&](const char* field, const std::string& value) {
        oss << ",\"" << field << "\":\"" << detail::escape_json(value) << "\"";
    };
    auto add_int = [&](const char* field, auto value) {
        if (value != 0) {
            oss << ",\"" << field << "\":" << value;
        }
    };

    oss << "{\"id\":\"" << detail::escape_json(id) << "\"";
    add_string("type", to_string(kind));
    add_string("status", to_string(status));
    add_string("name", name);
    add_string("bucket", bucket);
    add_string("key", key);
    if (!local_path.empty()) add_string("localPath", local_path);
    add_int("totalBytes", total_bytes);
    add_int("doneBytes", done_bytes);
    if (speed_bytes_per_sec > 0.0) {
        oss << ",\"speedBytesPerSec\":" << std::fixed << std::setprecision(2)
            << speed_bytes_per_sec;
    }
    add_int("etaSeconds", eta_seconds);
    if (!message.empty()) add_string("message", message);
    add_int("startedAtMs", started_at_ms);
    add_int("updatedAtMs", updated_at_ms);
    add_int("finishedAtMs", finished_at_ms);
    oss << "}";

    return oss.str();
}

}  // namespace cloudxfer
