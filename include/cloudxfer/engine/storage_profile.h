/**
 * @file storage_profile.h
 * @brief Object store credentials and endpoint settings
 */

#ifndef CLOUDXFER_ENGINE_STORAGE_PROFILE_H
#define CLOUDXFER_ENGINE_STORAGE_PROFILE_H

#include <string>
#include <string_view>

namespace cloudxfer {

/**
 * @brief Credentials and location of the remote object store
 */
struct storage_profile {
    std::string access_key_id;
    std::string access_key_secret;
    std::string region;
    std::string endpoint;
    std::string scheme = "oss";
};

/**
 * @brief Trim a region and drop a leading "oss-"
 *
 * "oss-cn-hangzhou" and "cn-hangzhou" both yield "cn-hangzhou".
 */
[[nodiscard]] auto normalize_region(std::string_view region) -> std::string;

/**
 * @brief Reduce a user-supplied endpoint to a bare host
 *
 * A full URL keeps only its host. Anything after the first '?', '#' or '/'
 * is dropped, then one trailing '.'.
 */
[[nodiscard]] auto normalize_endpoint(std::string_view endpoint) -> std::string;

/**
 * @brief Build "<scheme>://<bucket>/<key>"
 */
[[nodiscard]] auto remote_locator(const storage_profile& profile,
                                  const std::string& bucket,
                                  const std::string& key) -> std::string;

}  // namespace cloudxfer

#endif  // CLOUDXFER_ENGINE_STORAGE_PROFILE_H
