#pragma once

// common.hpp - error taxonomy, result types and connection status
// everything the session layer hands back to a caller is one of these

#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mfdlink
{

    // ============================================================================
    // connection status - shared by the transport session and transfer channel
    // ============================================================================

    enum class connection_status : std::uint8_t
    {
        disconnected = 0,
        connected,
        failed,
    };

    [[nodiscard]] constexpr auto to_string(connection_status const status) noexcept -> std::string_view
    {
        switch (status)
        {
        case connection_status::disconnected:
            return "disconnected";
        case connection_status::connected:
            return "connected";
        case connection_status::failed:
            return "failed";
        }
        return "unknown";
    }

    // ============================================================================
    // error kinds - callers branch on these, never on message text
    // ============================================================================

    enum class error_kind : std::uint8_t
    {
        authentication_failed = 1,
        network_error,
        connection_error,
        unknown_error,
        already_connected,
        execute_command_error,
        transfer_error,
        session_error,
    };

    // cause tag for transfer_error, diagnostics only
    enum class transfer_cause : std::uint8_t
    {
        none = 0,
        local_not_found,
        permission_denied,
        timeout,
        os_error,
        remote_path_invalid,
        transport_failure,
        unexpected,
    };

    [[nodiscard]] constexpr auto to_string(error_kind const kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case error_kind::authentication_failed:
            return "authentication_failed";
        case error_kind::network_error:
            return "network_error";
        case error_kind::connection_error:
            return "connection_error";
        case error_kind::unknown_error:
            return "unknown_error";
        case error_kind::already_connected:
            return "already_connected";
        case error_kind::execute_command_error:
            return "execute_command_error";
        case error_kind::transfer_error:
            return "transfer_error";
        case error_kind::session_error:
            return "session_error";
        }
        return "unknown_error_kind";
    }

    [[nodiscard]] constexpr auto to_string(transfer_cause const cause) noexcept -> std::string_view
    {
        switch (cause)
        {
        case transfer_cause::none:
            return "none";
        case transfer_cause::local_not_found:
            return "local_not_found";
        case transfer_cause::permission_denied:
            return "permission_denied";
        case transfer_cause::timeout:
            return "timeout";
        case transfer_cause::os_error:
            return "os_error";
        case transfer_cause::remote_path_invalid:
            return "remote_path_invalid";
        case transfer_cause::transport_failure:
            return "transport_failure";
        case transfer_cause::unexpected:
            return "unexpected";
        }
        return "unknown_cause";
    }

    [[nodiscard]] auto make_error_code(error_kind kind) noexcept -> std::error_code;

    // ============================================================================
    // error value
    // ============================================================================

    struct error
    {
        error_kind kind{error_kind::unknown_error};
        transfer_cause cause{transfer_cause::none};
        std::string message{};

        [[nodiscard]] static auto make(error_kind const kind, std::string message) -> error
        {
            return error{kind, transfer_cause::none, std::move(message)};
        }

        [[nodiscard]] static auto transfer(transfer_cause const cause, std::string message) -> error
        {
            return error{error_kind::transfer_error, cause, std::move(message)};
        }

        [[nodiscard]] auto is(error_kind const k) const noexcept -> bool { return kind == k; }

        [[nodiscard]] auto code() const noexcept -> std::error_code { return make_error_code(kind); }

        // "kind: message" or "transfer_error(cause): message"
        [[nodiscard]] auto describe() const -> std::string;
    };

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    [[nodiscard]] inline auto fail(error_kind const kind, std::string message) -> std::unexpected<error>
    {
        return std::unexpected{error::make(kind, std::move(message))};
    }

    [[nodiscard]] inline auto fail_transfer(transfer_cause const cause, std::string message)
        -> std::unexpected<error>
    {
        return std::unexpected{error::transfer(cause, std::move(message))};
    }

} // namespace mfdlink

// enable std::error_code integration
template <>
struct std::is_error_code_enum<mfdlink::error_kind> : std::true_type
{
};

template <>
struct fmt::formatter<mfdlink::connection_status> : fmt::formatter<std::string_view>
{
    auto format(mfdlink::connection_status const status, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(mfdlink::to_string(status), ctx);
    }
};

template <>
struct fmt::formatter<mfdlink::error_kind> : fmt::formatter<std::string_view>
{
    auto format(mfdlink::error_kind const kind, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(mfdlink::to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<mfdlink::transfer_cause> : fmt::formatter<std::string_view>
{
    auto format(mfdlink::transfer_cause const cause, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(mfdlink::to_string(cause), ctx);
    }
};

template <>
struct fmt::formatter<mfdlink::error> : fmt::formatter<std::string_view>
{
    auto format(mfdlink::error const &err, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(err.describe(), ctx);
    }
};
