/**
 * @file storage_profile.cpp
 * @brief Object store credentials and endpoint settings
 */

#include "cloudxfer/engine/storage_profile.h"

#include "cloudxfer/core/string_utils.h"

namespace cloudxfer {

namespace {

// Host part of "scheme://[userinfo@]host[:port][/path][?query][#fragment]"
auto url_host(std::string_view url) -> std::string_view {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return {};
    }
    auto authority = url.substr(scheme_end + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    return authority;
}

}  // namespace

auto normalize_region(std::string_view region) -> std::string {
    return std::string(trim_prefix(trim(region), "oss-"));
}

auto normalize_endpoint(std::string_view endpoint) -> std::string {
    auto value = trim(endpoint);
    if (value.empty()) {
        return {};
    }

    if (value.find("://") != std::string_view::npos) {
        if (auto host = url_host(value); !host.empty()) {
            value = host;
        }
    }

    value = value.substr(0, value.find('?'));
    value = value.substr(0, value.find('#'));
    value = value.substr(0, value.find('/'));
    if (ends_with(value, ".")) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

auto remote_locator(const storage_profile& profile,
                    const std::string& bucket,
                    const std::string& key) -> std::string {
    const auto& scheme = profile.scheme.empty() ? std::string("oss") : profile.scheme;
    return scheme + "://" + bucket + "/" + key;
}

}  // namespace cloudxfer
