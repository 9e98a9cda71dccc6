/**
 * @file cloudxfer.h
 * @brief Main header for the cloudxfer library
 * @version 0.1.0
 *
 * Include this header to access the transfer execution engine.
 *
 * @code
 * #include <cloudxfer/cloudxfer.h>
 *
 * using namespace cloudxfer;
 *
 * auto sink = std::make_shared<json_lines_event_sink>(std::cout);
 * auto dispatcher = transfer_dispatcher::builder()
 *     .with_profile({"key-id", "key-secret", "cn-hangzhou"})
 *     .with_event_sink(sink)
 *     .build();
 *
 * auto id = dispatcher.value().enqueue_upload("report.pdf", "my-bucket", "docs/");
 * dispatcher.value().wait_idle();
 * @endcode
 */

#ifndef CLOUDXFER_CLOUDXFER_H
#define CLOUDXFER_CLOUDXFER_H

#include <cstdint>
#include <string>

// Core types
#include "cloudxfer/core/types.h"
#include "cloudxfer/core/transfer_types.h"
#include "cloudxfer/core/logging.h"

// Engine
#include "cloudxfer/engine/storage_profile.h"
#include "cloudxfer/engine/engine_config.h"
#include "cloudxfer/engine/event_sink.h"
#include "cloudxfer/engine/transfer_command.h"
#include "cloudxfer/engine/transfer_dispatcher.h"

// Adapters
#include "cloudxfer/adapters/thread_pool_adapter.h"

namespace cloudxfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace cloudxfer

#endif  // CLOUDXFER_CLOUDXFER_H
