/**
 * @file transfer_command.cpp
 * @brief Argument construction for the external transfer tool, per kind
 */

#include "cloudxfer/engine/transfer_command.h"

namespace cloudxfer {

namespace {

constexpr const char* secret_flag = "--access-key-secret";

}  // namespace

auto transfer_command::build_arguments(const transfer_update& record,
                                       const storage_profile& profile) const
    -> std::vector<std::string> {
    auto [source, destination] = operands(record, profile);

    std::vector<std::string> args{
        "cp",
        std::move(source),
        std::move(destination),
        "--access-key-id", profile.access_key_id,
        secret_flag, profile.access_key_secret,
        "--region", normalize_region(profile.region),
        "-f",
    };

    auto endpoint = normalize_endpoint(profile.endpoint);
    if (!endpoint.empty()) {
        args.emplace_back("--endpoint");
        args.push_back(std::move(endpoint));
    }
    return args;
}

auto upload_command::operands(const transfer_update& record,
                              const storage_profile& profile) const
    -> std::pair<std::string, std::string> {
    return {record.local_path, remote_locator(profile, record.bucket, record.key)};
}

auto download_command::operands(const transfer_update& record,
                                const storage_profile& profile) const
    -> std::pair<std::string, std::string> {
    return {remote_locator(profile, record.bucket, record.key), record.local_path};
}

auto make_transfer_command(transfer_kind kind) -> std::unique_ptr<transfer_command> {
    switch (kind) {
        case transfer_kind::upload:
            return std::make_unique<upload_command>();
        case transfer_kind::download:
            return std::make_unique<download_command>();
        default:
            return nullptr;
    }
}

auto describe_arguments(const std::vector<std::string>& args) -> std::string {
    std::string out;
    bool mask_next = false;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        if (mask_next) {
            out += "******";
            mask_next = false;
            continue;
        }
        out += arg;
        mask_next = (arg == secret_flag);
    }
    return out;
}

}  // namespace cloudxfer
