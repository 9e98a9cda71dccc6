/**
 * @file output_line_splitter.h
 * @brief Reassembles chunked process output into logical lines
 *
 * Transfer tools redraw progress with bare carriage returns, so both '\r'
 * and '\n' terminate a line. Lines are trimmed and empty lines dropped.
 */

#ifndef CLOUDXFER_CORE_OUTPUT_LINE_SPLITTER_H
#define CLOUDXFER_CORE_OUTPUT_LINE_SPLITTER_H

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "cloudxfer/core/types.h"

namespace cloudxfer {

/**
 * @brief Source of raw bytes (a pipe, a file, a test buffer)
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Read up to size bytes
     * @return Number of bytes read, 0 at end of stream, or an error
     */
    [[nodiscard]] virtual auto read(char* buffer, std::size_t size) -> result<std::size_t> = 0;
};

/**
 * @brief Incremental CR/LF line splitter
 *
 * Bytes of one line may arrive across any number of feed() calls.
 *
 * @code
 * output_line_splitter splitter([](std::string_view line) { handle(line); });
 * splitter.feed("Progress: 4");
 * splitter.feed("5%\rSpeed: 1MB/s\n");   // emits both lines
 * splitter.finish();
 * @endcode
 */
class output_line_splitter {
public:
    using line_callback = std::function<void(std::string_view)>;

    explicit output_line_splitter(line_callback on_line);

    /**
     * @brief Consume one chunk, emitting every line it completes
     */
    auto feed(std::string_view chunk) -> void;

    /**
     * @brief Emit the trailing partial line, if any
     *
     * Call once the stream ended cleanly.
     */
    auto finish() -> void;

    [[nodiscard]] auto pending_size() const noexcept -> std::size_t { return pending_.size(); }

private:
    auto emit_segment(std::string_view segment) -> void;

    line_callback on_line_;
    std::string pending_;
};

/**
 * @brief Drain a byte source into lines until end of stream
 *
 * @param source Stream to read
 * @param on_line Called once per non-empty trimmed line, in order
 * @param chunk_size Size of each read
 * @return Success at end of stream, or the first read error (the partial
 *         line is then discarded)
 */
[[nodiscard]] auto split_lines(byte_source& source,
                               const output_line_splitter::line_callback& on_line,
                               std::size_t chunk_size = 4096) -> result<void>;

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_OUTPUT_LINE_SPLITTER_H
