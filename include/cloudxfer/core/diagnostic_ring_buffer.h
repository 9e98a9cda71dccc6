/**
 * @file diagnostic_ring_buffer.h
 * @brief Bounded tail of non-progress tool output
 */

#ifndef CLOUDXFER_CORE_DIAGNOSTIC_RING_BUFFER_H
#define CLOUDXFER_CORE_DIAGNOSTIC_RING_BUFFER_H

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace cloudxfer {

/**
 * @brief Keeps the most recent output lines up to a fixed byte capacity
 *
 * The retained content is always a suffix of everything appended, never
 * longer than the capacity. Oldest bytes are evicted first.
 */
class diagnostic_ring_buffer {
public:
    static constexpr std::size_t default_capacity = 16 * 1024;

    /**
     * @param capacity Capacity in bytes, clamped to at least 1
     */
    explicit diagnostic_ring_buffer(std::size_t capacity = default_capacity);

    /**
     * @brief Append one line, newline-terminated
     *
     * Empty lines are ignored. A line longer than the capacity replaces the
     * whole content with its own trailing bytes.
     */
    auto append_line(std::string_view line) -> void;

    /**
     * @brief Current content with surrounding whitespace trimmed
     */
    [[nodiscard]] auto snapshot() const -> std::string;

    /**
     * @brief Untrimmed retained bytes
     */
    [[nodiscard]] auto raw() const -> std::string;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    auto clear() -> void;

private:
    mutable std::mutex mutex_;
    std::string data_;
    std::size_t capacity_;
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_DIAGNOSTIC_RING_BUFFER_H
