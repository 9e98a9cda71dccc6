/**
 * @file transfer_cli.cpp
 * @brief Command-line front end for the transfer engine
 *
 * This example demonstrates:
 * - Building a dispatcher from environment-provided credentials
 * - Streaming snapshots as JSON lines through a queued sink
 * - Reporting validation errors returned by enqueue_*
 * - Waiting for all jobs before exiting
 */

#include <cloudxfer/cloudxfer.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace cloudxfer;

namespace {

auto env_or_empty(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

auto profile_from_environment() -> storage_profile {
    storage_profile profile;
    profile.access_key_id = env_or_empty("CLOUDXFER_ACCESS_KEY_ID");
    profile.access_key_secret = env_or_empty("CLOUDXFER_ACCESS_KEY_SECRET");
    profile.region = env_or_empty("CLOUDXFER_REGION");
    profile.endpoint = env_or_empty("CLOUDXFER_ENDPOINT");
    return profile;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "cloudxfer " << version::to_string() << " - object store transfer CLI" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program << " [options] upload <local_file> <bucket> [prefix]" << std::endl;
    std::cout << "  " << program << " [options] download <key> <bucket> <local_file> [size]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>          Concurrent transfers (default: 1)" << std::endl;
    std::cout << "  -v, --verbose           Debug logging on stderr" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  CLOUDXFER_ACCESS_KEY_ID, CLOUDXFER_ACCESS_KEY_SECRET," << std::endl;
    std::cout << "  CLOUDXFER_REGION, CLOUDXFER_ENDPOINT, CLOUDXFER_TOOL" << std::endl;
}

int main(int argc, char* argv[]) {
    std::size_t jobs = 1;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            try {
                jobs = static_cast<std::size_t>(std::stoul(argv[i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --jobs value: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(verbose ? log_level::debug : log_level::warn);

    auto sink = std::make_shared<queued_event_sink>(
        std::make_shared<json_lines_event_sink>(std::cout));

    auto dispatcher_result = transfer_dispatcher::builder()
        .with_tool_path(env_or_empty("CLOUDXFER_TOOL"))
        .with_profile(profile_from_environment())
        .with_max_concurrent(jobs)
        .with_event_sink(sink)
        .build();

    if (!dispatcher_result.has_value()) {
        std::cerr << "Error: " << dispatcher_result.error().message << std::endl;
        return 1;
    }
    auto& dispatcher = dispatcher_result.value();

    const auto& command = positional[0];
    result<std::string> submitted = unexpected{error{error_code::internal_error, "no command"}};

    if (command == "upload" && (positional.size() == 3 || positional.size() == 4)) {
        auto prefix = positional.size() == 4 ? positional[3] : std::string();
        submitted = dispatcher.enqueue_upload(positional[1], positional[2], prefix);
    } else if (command == "download" && (positional.size() == 4 || positional.size() == 5)) {
        uint64_t size = 0;
        if (positional.size() == 5) {
            try {
                size = std::stoull(positional[4]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid size: " << positional[4] << std::endl;
                return 1;
            }
        }
        submitted = dispatcher.enqueue_download(positional[2], positional[1], positional[3], size);
    } else {
        print_usage(argv[0]);
        return 1;
    }

    if (!submitted.has_value()) {
        std::cerr << "Error: " << submitted.error().message << std::endl;
        return 1;
    }

    dispatcher.wait_idle();
    sink->flush();

    auto stats = dispatcher.get_statistics();
    return stats.failed == 0 ? 0 : 2;
}
