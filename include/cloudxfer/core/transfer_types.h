/**
 * @file transfer_types.h
 * @brief Transfer record, status and kind definitions
 *
 * A transfer_update is both the mutable record a job works on and the
 * immutable snapshot handed to event sinks (sinks always receive a copy).
 */

#ifndef CLOUDXFER_CORE_TRANSFER_TYPES_H
#define CLOUDXFER_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <string>

namespace cloudxfer {

/**
 * @brief Direction of a transfer
 */
enum class transfer_kind {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_kind kind) noexcept -> const char* {
    switch (kind) {
        case transfer_kind::upload: return "upload";
        case transfer_kind::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Lifecycle status of a transfer
 *
 * Only moves forward: queued -> in_progress -> success | error.
 */
enum class transfer_status {
    queued,
    in_progress,
    success,
    error
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> const char* {
    switch (status) {
        case transfer_status::queued: return "queued";
        case transfer_status::in_progress: return "in-progress";
        case transfer_status::success: return "success";
        case transfer_status::error: return "error";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept -> bool {
    return status == transfer_status::success || status == transfer_status::error;
}

/**
 * @brief Check whether a status change respects the forward-only lifecycle
 */
[[nodiscard]] constexpr auto is_valid_transition(transfer_status from,
                                                 transfer_status to) noexcept -> bool {
    switch (from) {
        case transfer_status::queued:
            return to == transfer_status::in_progress || to == transfer_status::error;
        case transfer_status::in_progress:
            return to == transfer_status::success || to == transfer_status::error;
        default:
            return false;
    }
}

/**
 * @brief State of one transfer job at a point in time
 */
struct transfer_update {
    std::string id;
    transfer_kind kind = transfer_kind::upload;
    transfer_status status = transfer_status::queued;
    std::string name;
    std::string bucket;
    std::string key;
    std::string local_path;
    uint64_t total_bytes = 0;
    uint64_t done_bytes = 0;
    double speed_bytes_per_sec = 0.0;
    uint64_t eta_seconds = 0;
    std::string message;
    int64_t started_at_ms = 0;
    int64_t updated_at_ms = 0;
    int64_t finished_at_ms = 0;

    /**
     * @brief Render as a JSON object
     *
     * Field names are camelCase. Empty strings and zero numbers among the
     * optional fields are omitted.
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Current wall-clock time in Unix milliseconds
 */
[[nodiscard]] auto unix_time_ms() -> int64_t;

/**
 * @brief Allocate a process-unique transfer id
 *
 * Format: "tr-<unix-ms>-<seq>" where seq increases monotonically for the
 * lifetime of the process.
 */
[[nodiscard]] auto next_transfer_id() -> std::string;

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_TRANSFER_TYPES_H
