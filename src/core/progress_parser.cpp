/**
 * @file progress_parser.cpp
 * @brief Extraction of progress figures from transfer tool output lines
 */

#include "cloudxfer/core/progress_parser.h"

#include "cloudxfer/core/string_utils.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>

namespace cloudxfer {

namespace {

constexpr auto icase = std::regex::ECMAScript | std::regex::icase;

auto ok_size_pattern() -> const std::regex& {
    static const std::regex pattern(R"(\bOK\s*size:\s*([0-9][0-9,]*))", icase);
    return pattern;
}

auto progress_pattern() -> const std::regex& {
    static const std::regex pattern(R"(\bProgress:\s*([0-9]+(?:\.[0-9]+)?)\s*%)", icase);
    return pattern;
}

auto speed_pattern() -> const std::regex& {
    static const std::regex pattern(
        R"(\bSpeed:\s*([0-9]+(?:\.[0-9]+)?)\s*([kmgtp]?)i?b/s)", icase);
    return pattern;
}

auto parse_double(const std::string& text) -> std::optional<double> {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto strip_ansi(std::string_view line) -> std::string {
    std::string out;
    out.reserve(line.size());

    std::size_t i = 0;
    while (i < line.size()) {
        if (line[i] != '\x1b' || i + 1 >= line.size() || line[i + 1] != '[') {
            out += line[i++];
            continue;
        }

        // ESC [ parameters(0x30-0x3F)* intermediates(0x20-0x2F)* final(0x40-0x7E)
        std::size_t j = i + 2;
        while (j < line.size() && line[j] >= 0x30 && line[j] <= 0x3F) ++j;
        while (j < line.size() && line[j] >= 0x20 && line[j] <= 0x2F) ++j;
        if (j < line.size() && line[j] >= 0x40 && line[j] <= 0x7E) {
            i = j + 1;
        } else {
            out += line[i++];
        }
    }
    return out;
}

auto apply_binary_prefix(double value, char prefix) noexcept -> double {
    switch (std::toupper(static_cast<unsigned char>(prefix))) {
        case 'K': return value * 1024.0;
        case 'M': return value * 1024.0 * 1024.0;
        case 'G': return value * 1024.0 * 1024.0 * 1024.0;
        case 'T': return value * 1024.0 * 1024.0 * 1024.0 * 1024.0;
        case 'P': return value * 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0;
        default: return value;
    }
}

auto parse_grouped_uint(std::string_view digits) -> std::optional<uint64_t> {
    constexpr auto max_value = std::numeric_limits<uint64_t>::max();

    uint64_t value = 0;
    bool any_digit = false;
    for (char c : digits) {
        if (c == ',') {
            continue;
        }
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        auto digit = static_cast<uint64_t>(c - '0');
        if (value > (max_value - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        any_digit = true;
    }

    if (!any_digit) {
        return std::nullopt;
    }
    return value;
}

auto ossutil_progress_parser::parse(std::string_view line) const -> progress_sample {
    progress_sample sample;
    if (line.size() > max_line_length) {
        return sample;
    }

    const std::string clean(trim(strip_ansi(line)));

    std::smatch match;
    if (std::regex_search(clean, match, ok_size_pattern())) {
        sample.done_bytes = parse_grouped_uint(match.str(1));
    }

    if (std::regex_search(clean, match, progress_pattern())) {
        sample.percent = parse_double(match.str(1));
    }

    if (std::regex_search(clean, match, speed_pattern())) {
        if (auto value = parse_double(match.str(1))) {
            auto prefix = match.length(2) > 0 ? match.str(2).front() : '\0';
            sample.speed_bps = apply_binary_prefix(*value, prefix);
        }
    }

    return sample;
}

auto make_default_progress_parser() -> std::unique_ptr<progress_line_parser> {
    return std::make_unique<ossutil_progress_parser>();
}

}  // namespace cloudxfer
