/**
 * @file output_line_splitter.cpp
 * @brief Reassembles chunked process output into logical lines
 */

#include "cloudxfer/core/output_line_splitter.h"

#include "cloudxfer/core/string_utils.h"

#include <algorithm>
#include <vector>

namespace cloudxfer {

output_line_splitter::output_line_splitter(line_callback on_line)
    : on_line_(std::move(on_line)) {}

auto output_line_splitter::feed(std::string_view chunk) -> void {
    if (chunk.empty()) {
        return;
    }

    pending_.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    while (true) {
        auto idx = pending_.find_first_of("\r\n", start);
        if (idx == std::string::npos) {
            break;
        }
        emit_segment(std::string_view(pending_).substr(start, idx - start));
        start = idx + 1;
    }

    if (start > 0) {
        pending_.erase(0, start);
    }
}

auto output_line_splitter::finish() -> void {
    if (!pending_.empty()) {
        std::string rest;
        rest.swap(pending_);
        emit_segment(rest);
    }
}

auto output_line_splitter::emit_segment(std::string_view segment) -> void {
    auto line = trim(segment);
    if (!line.empty() && on_line_) {
        on_line_(line);
    }
}

auto split_lines(byte_source& source,
                 const output_line_splitter::line_callback& on_line,
                 std::size_t chunk_size) -> result<void> {
    std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
    output_line_splitter splitter(on_line);

    while (true) {
        auto read_result = source.read(buffer.data(), buffer.size());
        if (!read_result) {
            return unexpected(read_result.error());
        }

        auto n = read_result.value();
        if (n == 0) {
            splitter.finish();
            return {};
        }
        splitter.feed(std::string_view(buffer.data(), n));
    }
}

}  // namespace cloudxfer
