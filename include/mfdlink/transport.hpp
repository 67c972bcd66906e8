#pragma once

// transport.hpp - the seam between the session layer and the SSH library
// drivers report library failures as faults, the session layer turns faults into errors

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mfdlink::ssh
{

    // =============================================================================
    // faults - what went wrong underneath, independent of the SSH library
    // =============================================================================

    enum class fault : std::uint8_t
    {
        auth_rejected = 1,
        network_unreachable,
        host_unreachable,
        socket_error,
        timeout,
        protocol_error,
        local_not_found,
        permission_denied,
        os_error,
        remote_path_invalid,
        transport_lost,
        unexpected,
        host_key_rejected,
    };

    [[nodiscard]] constexpr auto to_string(fault const f) noexcept -> std::string_view
    {
        switch (f)
        {
        case fault::auth_rejected:
            return "auth_rejected";
        case fault::network_unreachable:
            return "network_unreachable";
        case fault::host_unreachable:
            return "host_unreachable";
        case fault::socket_error:
            return "socket_error";
        case fault::timeout:
            return "timeout";
        case fault::protocol_error:
            return "protocol_error";
        case fault::local_not_found:
            return "local_not_found";
        case fault::permission_denied:
            return "permission_denied";
        case fault::os_error:
            return "os_error";
        case fault::remote_path_invalid:
            return "remote_path_invalid";
        case fault::transport_lost:
            return "transport_lost";
        case fault::unexpected:
            return "unexpected";
        case fault::host_key_rejected:
            return "host_key_rejected";
        }
        return "unknown_fault";
    }

    // socket-level faults: the host or the route to it is the problem
    [[nodiscard]] constexpr auto is_socket_level(fault const f) noexcept -> bool
    {
        switch (f)
        {
        case fault::network_unreachable:
        case fault::host_unreachable:
        case fault::socket_error:
        case fault::timeout:
            return true;
        case fault::auth_rejected:
        case fault::protocol_error:
        case fault::local_not_found:
        case fault::permission_denied:
        case fault::os_error:
        case fault::remote_path_invalid:
        case fault::transport_lost:
        case fault::unexpected:
        case fault::host_key_rejected:
            return false;
        }
        return false;
    }

    struct fault_info
    {
        fault kind{fault::unexpected};
        std::string message{};
    };

    template <typename T>
    using fault_result = std::expected<T, fault_info>;

    using fault_void = std::expected<void, fault_info>;

    [[nodiscard]] inline auto make_fault(fault const kind, std::string message) -> std::unexpected<fault_info>
    {
        return std::unexpected{fault_info{kind, std::move(message)}};
    }

    // =============================================================================
    // dial parameters
    // =============================================================================

    struct endpoint
    {
        std::string host;
        int port{22};
        std::string username;
        std::chrono::seconds connect_timeout{30};
        bool strict_host_key_checking{false};
        int verbosity{0};
    };

    // detached: no pty, output ignored
    // captured: pty allocated so stderr arrives merged into stdout
    enum class command_mode : std::uint8_t
    {
        detached,
        captured,
    };

    // =============================================================================
    // live objects handed out by a driver
    // =============================================================================

    // one remote command, closed when destroyed
    class command_stream
    {
    public:
        virtual ~command_stream() = default;

        // blocks until the remote side closes its output
        [[nodiscard]] virtual auto read_all() -> fault_result<std::string> = 0;

        [[nodiscard]] virtual auto close_input() -> fault_void = 0;
        [[nodiscard]] virtual auto shutdown_write() -> fault_void = 0;

        // nullopt when the remote never reported a status
        [[nodiscard]] virtual auto exit_status() -> std::optional<int> = 0;
    };

    // file-copy channel sharing the transport of the link that opened it
    class transfer_link
    {
    public:
        virtual ~transfer_link() = default;

        [[nodiscard]] virtual auto put(std::filesystem::path const &local_path, std::string_view remote_path)
            -> fault_void = 0;

        [[nodiscard]] virtual auto get(std::string_view remote_path, std::filesystem::path const &local_path)
            -> fault_void = 0;

        [[nodiscard]] virtual auto is_remote_directory(std::string_view remote_path) -> bool = 0;

        [[nodiscard]] virtual auto close() -> fault_void = 0;
    };

    // a dialled transport, authenticated once one of the authenticate_* calls succeeds
    class transport_link
    {
    public:
        virtual ~transport_link() = default;

        [[nodiscard]] virtual auto authenticate_with_key(std::filesystem::path const &key_path,
                                                         std::string_view passphrase) -> fault_void = 0;

        [[nodiscard]] virtual auto authenticate_with_password(std::string_view password) -> fault_void = 0;

        [[nodiscard]] virtual auto authenticate_none() -> fault_void = 0;

        [[nodiscard]] virtual auto open_command(std::string_view command, command_mode mode)
            -> fault_result<std::unique_ptr<command_stream>> = 0;

        [[nodiscard]] virtual auto open_transfer() -> fault_result<std::unique_ptr<transfer_link>> = 0;

        // tears down every transfer link opened from this one before the transport itself
        [[nodiscard]] virtual auto close() -> fault_void = 0;
    };

    class transport_driver
    {
    public:
        virtual ~transport_driver() = default;

        // tcp connect plus protocol handshake, no authentication yet
        [[nodiscard]] virtual auto dial(endpoint const &target) -> fault_result<std::unique_ptr<transport_link>> = 0;
    };

} // namespace mfdlink::ssh
