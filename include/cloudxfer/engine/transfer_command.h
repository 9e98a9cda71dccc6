/**
 * @file transfer_command.h
 * @brief Argument construction for the external transfer tool, per kind
 */

#ifndef CLOUDXFER_ENGINE_TRANSFER_COMMAND_H
#define CLOUDXFER_ENGINE_TRANSFER_COMMAND_H

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cloudxfer/core/transfer_types.h"
#include "cloudxfer/engine/storage_profile.h"

namespace cloudxfer {

/**
 * @brief Builds the tool invocation for one transfer kind
 *
 * Adding a transfer kind or a different backend tool means adding an
 * implementation here; the supervisor only sees an argument list.
 */
class transfer_command {
public:
    virtual ~transfer_command() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> transfer_kind = 0;

    /**
     * @brief Full argument list, excluding the program itself
     *
     * "cp <src> <dst> --access-key-id <k> --access-key-secret <s>
     *  --region <r> -f [--endpoint <e>]"
     */
    [[nodiscard]] auto build_arguments(const transfer_update& record,
                                       const storage_profile& profile) const
        -> std::vector<std::string>;

protected:
    /**
     * @brief Source and destination operands of "cp"
     */
    [[nodiscard]] virtual auto operands(const transfer_update& record,
                                        const storage_profile& profile) const
        -> std::pair<std::string, std::string> = 0;
};

class upload_command : public transfer_command {
public:
    [[nodiscard]] auto kind() const noexcept -> transfer_kind override {
        return transfer_kind::upload;
    }

protected:
    [[nodiscard]] auto operands(const transfer_update& record,
                                const storage_profile& profile) const
        -> std::pair<std::string, std::string> override;
};

class download_command : public transfer_command {
public:
    [[nodiscard]] auto kind() const noexcept -> transfer_kind override {
        return transfer_kind::download;
    }

protected:
    [[nodiscard]] auto operands(const transfer_update& record,
                                const storage_profile& profile) const
        -> std::pair<std::string, std::string> override;
};

/**
 * @brief Command for a transfer kind, or nullptr if the kind is unknown
 */
[[nodiscard]] auto make_transfer_command(transfer_kind kind) -> std::unique_ptr<transfer_command>;

/**
 * @brief Render an argument list for logs with the secret value masked
 */
[[nodiscard]] auto describe_arguments(const std::vector<std::string>& args) -> std::string;

}  // namespace cloudxfer

#endif  // CLOUDXFER_ENGINE_TRANSFER_COMMAND_H
