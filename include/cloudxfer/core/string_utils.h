/**
 * @file string_utils.h
 * @brief Small string helpers shared by the parser, splitter and dispatcher
 */

#ifndef CLOUDXFER_CORE_STRING_UTILS_H
#define CLOUDXFER_CORE_STRING_UTILS_H

#include <string>
#include <string_view>

namespace cloudxfer {

[[nodiscard]] inline auto is_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
[[nodiscard]] inline auto trim(std::string_view s) noexcept -> std::string_view {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

[[nodiscard]] inline auto trim_prefix(std::string_view s, std::string_view prefix) noexcept
    -> std::string_view {
    if (s.substr(0, prefix.size()) == prefix) {
        s.remove_prefix(prefix.size());
    }
    return s;
}

[[nodiscard]] inline auto ends_with(std::string_view s, std::string_view suffix) noexcept -> bool {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/**
 * @brief Last element of a slash-separated object key
 *
 * Trailing slashes are ignored. Returns the whole key when the last element
 * degenerates to empty or ".".
 */
[[nodiscard]] inline auto object_base_name(const std::string& key) -> std::string {
    std::string_view view(key);
    while (!view.empty() && view.back() == '/') {
        view.remove_suffix(1);
    }
    auto slash = view.find_last_of('/');
    auto base = slash == std::string_view::npos ? view : view.substr(slash + 1);
    if (base.empty() || base == ".") {
        return key;
    }
    return std::string(base);
}

}  // namespace cloudxfer

#endif  // CLOUDXFER_CORE_STRING_UTILS_H
