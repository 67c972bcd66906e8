#pragma once

// file_transfer.hpp - push/pull over an SFTP channel layered on the transport

#include "common.hpp"
#include "transport_session.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mfdlink::ssh
{

    // every transfer fault ends up as one transfer_error cause
    [[nodiscard]] constexpr auto to_transfer_cause(fault const f) noexcept -> transfer_cause
    {
        switch (f)
        {
        case fault::local_not_found:
            return transfer_cause::local_not_found;
        case fault::permission_denied:
            return transfer_cause::permission_denied;
        case fault::timeout:
            return transfer_cause::timeout;
        case fault::os_error:
            return transfer_cause::os_error;
        case fault::remote_path_invalid:
        case fault::protocol_error:
            return transfer_cause::remote_path_invalid;
        case fault::transport_lost:
        case fault::network_unreachable:
        case fault::host_unreachable:
        case fault::socket_error:
            return transfer_cause::transport_failure;
        case fault::auth_rejected:
        case fault::host_key_rejected:
        case fault::unexpected:
            return transfer_cause::unexpected;
        }
        return transfer_cause::unexpected;
    }

    /// @brief Remote target for a push: a directory gets the local file name appended
    [[nodiscard]] auto join_remote_path(std::string_view remote_dir, std::string_view file_name) -> std::string;

    /// @brief Last component of a remote path, "" for a path ending in '/'
    [[nodiscard]] auto remote_file_name(std::string_view remote_path) -> std::string_view;

    class file_transfer
    {
    public:
        explicit file_transfer(transport_session &transport) noexcept;
        ~file_transfer();

        file_transfer(file_transfer const &) = delete;
        auto operator=(file_transfer const &) -> file_transfer & = delete;
        file_transfer(file_transfer &&) = delete;
        auto operator=(file_transfer &&) -> file_transfer & = delete;

        [[nodiscard]] auto open_channel() -> void_result;
        [[nodiscard]] auto close_channel() -> void_result;

        // remote_path may name an existing directory
        [[nodiscard]] auto push(std::filesystem::path const &local_path, std::string_view remote_path) -> void_result;

        // local_path may name an existing directory
        [[nodiscard]] auto pull(std::filesystem::path const &local_path, std::string_view remote_path) -> void_result;

        // a channel opened on a transport that has since gone away reports disconnected
        [[nodiscard]] auto status() const noexcept -> connection_status;

        [[nodiscard]] auto link() const noexcept -> transfer_link *;

    private:
        [[nodiscard]] auto is_stale() const noexcept -> bool;
        void drop_if_stale();
        [[nodiscard]] auto require_channel() -> void_result;

        transport_session &transport_;
        connection_status status_{connection_status::disconnected};
        std::unique_ptr<transfer_link> link_{};
        std::uint64_t generation_{0};
    };

} // namespace mfdlink::ssh
