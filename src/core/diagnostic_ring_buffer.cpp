/**
 * @file diagnostic_ring_buffer.cpp
 * @brief Bounded tail of non-progress tool output
 */

#include "cloudxfer/core/diagnostic_ring_buffer.h"

#include "cloudxfer/core/string_utils.h"

#include <algorithm>

namespace cloudxfer {

diagnostic_ring_buffer::diagnostic_ring_buffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto diagnostic_ring_buffer::append_line(std::string_view line) -> void {
    if (line.empty()) {
        return;
    }

    std::string raw(line);
    if (raw.back() != '\n') {
        raw += '\n';
    }

    std::lock_guard lock(mutex_);

    if (raw.size() >= capacity_) {
        data_.assign(raw, raw.size() - capacity_, capacity_);
        return;
    }

    if (data_.size() + raw.size() > capacity_) {
        data_.erase(0, data_.size() + raw.size() - capacity_);
    }
    data_ += raw;
}

auto diagnostic_ring_buffer::snapshot() const -> std::string {
    std::lock_guard lock(mutex_);
    return std::string(trim(data_));
}

auto diagnostic_ring_buffer::raw() const -> std::string {
    std::lock_guard lock(mutex_);
    return data_;
}

auto diagnostic_ring_buffer::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return data_.size();
}

auto diagnostic_ring_buffer::clear() -> void {
    std::lock_guard lock(mutex_);
    data_.clear();
}

}  // namespace cloudxfer
