#pragma once

// transport_session.hpp - the authenticated connection every other operation rides on

#include "common.hpp"
#include "session_config.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mfdlink::ssh
{

    // =============================================================================
    // retry classification
    // =============================================================================

    enum class failure_class : std::uint8_t
    {
        terminal,
        retryable,
    };

    // a rejected credential or host key stays rejected, everything else may be transient
    [[nodiscard]] constexpr auto classify(fault const f) noexcept -> failure_class
    {
        switch (f)
        {
        case fault::auth_rejected:
        case fault::host_key_rejected:
            return failure_class::terminal;
        case fault::network_unreachable:
        case fault::host_unreachable:
        case fault::socket_error:
        case fault::timeout:
        case fault::protocol_error:
        case fault::local_not_found:
        case fault::permission_denied:
        case fault::os_error:
        case fault::remote_path_invalid:
        case fault::transport_lost:
        case fault::unexpected:
            return failure_class::retryable;
        }
        return failure_class::retryable;
    }

    // error reported once every attempt has failed, decided by the last fault seen
    [[nodiscard]] constexpr auto exhausted_error_kind(fault const last) noexcept -> error_kind
    {
        if (is_socket_level(last))
        {
            return error_kind::network_error;
        }
        switch (last)
        {
        case fault::protocol_error:
        case fault::transport_lost:
        case fault::host_key_rejected:
            return error_kind::connection_error;
        case fault::auth_rejected:
            return error_kind::authentication_failed;
        default:
            return error_kind::unknown_error;
        }
    }

    // =============================================================================
    // transport session
    // =============================================================================

    class transport_session
    {
    public:
        using sleep_function = std::function<void(std::chrono::milliseconds)>;

        // an empty sleeper means std::this_thread::sleep_for
        explicit transport_session(transport_driver &driver, sleep_function sleeper = {});
        ~transport_session();

        // sub-sessions hold references to this object
        transport_session(transport_session const &) = delete;
        auto operator=(transport_session const &) -> transport_session & = delete;
        transport_session(transport_session &&) = delete;
        auto operator=(transport_session &&) -> transport_session & = delete;

        [[nodiscard]] auto connect(session_config const &config, bool force_reconnect = false) -> void_result;
        [[nodiscard]] auto disconnect() -> void_result;

        [[nodiscard]] auto status() const noexcept -> connection_status { return status_; }
        [[nodiscard]] auto is_connected() const noexcept -> bool;

        // live handle, nullptr unless connected
        [[nodiscard]] auto link() const noexcept -> transport_link *;

        // bumped by every successful connect, lets dependents spot a replaced transport
        [[nodiscard]] auto generation() const noexcept -> std::uint64_t { return generation_; }

        [[nodiscard]] auto host() const noexcept -> std::string_view { return host_; }
        [[nodiscard]] auto principal() const noexcept -> std::string_view { return principal_; }

        // attempts spent by the most recent connect that reached the network
        [[nodiscard]] auto attempts_used() const noexcept -> int { return attempts_used_; }

    private:
        [[nodiscard]] auto attempt(session_config const &config) -> fault_result<std::unique_ptr<transport_link>>;
        void release_link(std::string_view reason);

        transport_driver &driver_;
        sleep_function sleeper_;
        connection_status status_{connection_status::disconnected};
        std::unique_ptr<transport_link> link_{};
        std::string host_{};
        std::string principal_{};
        std::uint64_t generation_{0};
        int attempts_used_{0};
    };

} // namespace mfdlink::ssh
