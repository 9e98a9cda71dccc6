/**
 * @file types.h
 * @brief Core type definitions for cloudxfer
 */

#ifndef CLOUDXFER_CORE_TYPES_H
#define CLOUDXFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cloudxfer {

/**
 * @brief Error codes for transfer engine operations
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    empty_local_path = -100,
    local_path_not_found = -101,
    local_path_is_directory = -102,
    local_path_not_regular = -103,
    empty_bucket = -104,
    empty_object_key = -105,

    // Process start errors (-120 to -139)
    tool_not_found = -120,
    tool_permission_denied = -121,
    tool_not_executable = -122,
    process_spawn_failed = -123,

    // Process execution errors (-140 to -159)
    process_exit_failure = -140,
    process_signaled = -141,
    process_wait_failed = -142,
    stream_read_error = -143,

    // Internal errors (-200 to -219)
    internal_error = -200,
    unknown_transfer_kind = -201,
    invalid_configuration = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::empty_local_path:
            return "local path is empty";
        case error_code::local_path_not_found:
            return "local path not found";
        case error_code::local_path_is_directory:
            return "upload currently supports files only";
        case error_code::local_path_not_regular:
            return "local path is not a regular file";
        case error_code::empty_bucket:
            return "bucket is empty";
        case error_code::empty_object_key:
            return "object key is empty";
        case error_code::tool_not_found:
            return "transfer tool not found";
        case error_code::tool_permission_denied:
            return "transfer tool permission denied";
        case error_code::tool_not_executable:
            return "transfer tool is not executable";
        case error_code::process_spawn_failed:
            return "process spawn failed";
        case error_code::process_exit_failure:
            return "process exited with non-zero status";
        case error_code::process_signaled:
            return "process terminated by signal";
        case error_code::process_wait_failed:
            return "process wait failed";
        case error_code::stream_read_error:
            return "stream read error";
        case error_code::internal_error:
            return "internal error";
        case error_code::unknown_transfer_kind:
            return "unknown transfer type";
        case error_code::invalid_configuration:
            return "invalid configuration";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error means the tool binary could not be started
 *
 * Only these codes make the supervisor retry with the fallback binary.
 * A process that started and then failed is never retried.
 */
[[nodiscard]] constexpr auto is_start_failure(error_code code) noexcept -> bool {
    return code == error_code::tool_not_found ||
           code == error_code::tool_permission_denied ||
           code == error_code::tool_not_executable;
}

/**
 * @brief Check whether an error is a synchronous input validation failure
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) noexcept -> bool {
    const auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_TYPES_H
