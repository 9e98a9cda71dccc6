/**
 * @file progress_parser.h
 * @brief Extraction of progress figures from transfer tool output lines
 */

#ifndef CLOUDXFER_CORE_PROGRESS_PARSER_H
#define CLOUDXFER_CORE_PROGRESS_PARSER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cloudxfer {

/**
 * @brief Figures found in one output line
 *
 * Each field is extracted independently; any combination may be present.
 */
struct progress_sample {
    std::optional<uint64_t> done_bytes;   ///< Cumulative bytes transferred
    std::optional<double> percent;        ///< Completion percentage
    std::optional<double> speed_bps;      ///< Instantaneous rate, bytes per second

    [[nodiscard]] auto matched() const noexcept -> bool {
        return done_bytes.has_value() || percent.has_value() || speed_bps.has_value();
    }
};

/**
 * @brief Classifies tool output lines as progress or diagnostics
 *
 * One implementation per output dialect. A line for which parse() returns a
 * sample with matched() == false is diagnostic output.
 */
class progress_line_parser {
public:
    virtual ~progress_line_parser() = default;

    [[nodiscard]] virtual auto parse(std::string_view line) const -> progress_sample = 0;
};

/**
 * @brief Parser for ossutil-style output
 *
 * Recognizes, case-insensitively:
 * - "OK size: 1,048,576"   cumulative bytes, thousands separators allowed
 * - "Progress: 45.5%"      percentage
 * - "Speed: 2.50MB/s"      speed with optional K/M/G/T/P prefix (base 1024)
 *
 * Lines longer than max_line_length are not matched and fall through to
 * diagnostics; std::regex recursion depth grows with the input length.
 */
class ossutil_progress_parser : public progress_line_parser {
public:
    static constexpr std::size_t max_line_length = 4096;

    [[nodiscard]] auto parse(std::string_view line) const -> progress_sample override;
};

/**
 * @brief Remove ANSI CSI escape sequences (ESC [ ... final-byte)
 */
[[nodiscard]] auto strip_ansi(std::string_view line) -> std::string;

/**
 * @brief Multiply a value by the base-1024 factor of a unit prefix
 *
 * Unknown or empty prefixes leave the value unchanged.
 */
[[nodiscard]] auto apply_binary_prefix(double value, char prefix) noexcept -> double;

/**
 * @brief Parse a decimal integer that may contain ',' separators
 */
[[nodiscard]] auto parse_grouped_uint(std::string_view digits) -> std::optional<uint64_t>;

[[nodiscard]] auto make_default_progress_parser() -> std::unique_ptr<progress_line_parser>;

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_PROGRESS_PARSER_H
