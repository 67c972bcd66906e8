// transport_session.cpp - connect with bounded retry, disconnect, status bookkeeping

#include "mfdlink/transport_session.hpp"

#include "mfdlink/log.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

namespace mfdlink::ssh
{

    transport_session::transport_session(transport_driver &driver, sleep_function sleeper)
        : driver_{driver}, sleeper_{std::move(sleeper)}
    {
        if (!sleeper_)
        {
            sleeper_ = [](std::chrono::milliseconds const delay) { std::this_thread::sleep_for(delay); };
        }
    }

    transport_session::~transport_session()
    {
        release_link("session destroyed");
    }

    auto transport_session::is_connected() const noexcept -> bool
    {
        switch (status_)
        {
        case connection_status::connected:
            return true;
        case connection_status::disconnected:
        case connection_status::failed:
            return false;
        }
        return false;
    }

    auto transport_session::link() const noexcept -> transport_link *
    {
        return is_connected() ? link_.get() : nullptr;
    }

    auto transport_session::connect(session_config const &config, bool const force_reconnect) -> void_result
    {
        log::info("establishing SSH connection to {}@{}:{}", config.username, config.host, config.port);

        switch (status_)
        {
        case connection_status::connected:
            if (!force_reconnect)
            {
                log::warn("already connected to {}, refusing to replace the live session", host_);
                return fail(error_kind::already_connected,
                            fmt::format("SSH connection to {} already established", host_));
            }
            release_link("forced reconnect");
            break;
        case connection_status::disconnected:
        case connection_status::failed:
            break;
        }

        host_ = config.host;
        principal_ = config.username;

        auto const max_attempts = std::max(1, config.retry.max_attempts);
        std::optional<fault_info> last_fault;

        for (int attempt_no = 1; attempt_no <= max_attempts; ++attempt_no)
        {
            attempts_used_ = attempt_no;

            auto link = attempt(config);
            if (link.has_value())
            {
                link_ = std::move(*link);
                status_ = connection_status::connected;
                ++generation_;
                log::info("SSH connection to {} established", host_);
                return {};
            }

            auto const &f = link.error();
            switch (classify(f.kind))
            {
            case failure_class::terminal:
                status_ = connection_status::failed;
                if (f.kind == fault::host_key_rejected)
                {
                    log::error("host key of {} rejected: {}", host_, f.message);
                    return fail(error_kind::connection_error,
                                fmt::format("host key verification failed for {}, check known_hosts: {}", host_,
                                            f.message));
                }
                log::error("authentication to {} as {} rejected: {}", host_, principal_, f.message);
                return fail(error_kind::authentication_failed,
                            fmt::format("authentication failed for {}@{}, verify SSH key and credentials: {}",
                                        principal_, host_, f.message));
            case failure_class::retryable:
                log::warn("connection attempt {} of {} to {} failed ({}): {}", attempt_no, max_attempts, host_,
                          to_string(f.kind), f.message);
                last_fault = f;
                break;
            }

            if (attempt_no < max_attempts)
            {
                log::info("retrying in {} ms", config.retry.delay.count());
                sleeper_(config.retry.delay);
            }
        }

        status_ = connection_status::failed;

        auto const kind = exhausted_error_kind(last_fault->kind);
        switch (kind)
        {
        case error_kind::network_error:
            return fail(kind, fmt::format("network error occurred: {}", last_fault->message));
        case error_kind::connection_error:
            return fail(kind, fmt::format("SSH connection failed: {}", last_fault->message));
        default:
            return fail(error_kind::unknown_error,
                        fmt::format("SSH connection failed due to an unknown reason after {} attempts: {}",
                                    max_attempts, last_fault->message));
        }
    }

    auto transport_session::attempt(session_config const &config) -> fault_result<std::unique_ptr<transport_link>>
    {
        auto dialled = driver_.dial(config.to_endpoint());
        if (!dialled.has_value())
        {
            return std::unexpected(dialled.error());
        }

        auto &link = *dialled;

        if (config.private_key_path.has_value())
        {
            auto auth = link->authenticate_with_key(*config.private_key_path, config.private_key_passphrase);
            if (!auth.has_value())
            {
                return std::unexpected(auth.error());
            }
            return std::move(link);
        }

        // keyless devices: an empty password may be refused, identity alone must then do
        log::debug("no SSH key supplied for {}, trying keyless authentication", config.host);
        auto password = link->authenticate_with_password("");
        if (password.has_value())
        {
            return std::move(link);
        }
        if (password.error().kind != fault::auth_rejected)
        {
            return std::unexpected(password.error());
        }

        auto none = link->authenticate_none();
        if (!none.has_value())
        {
            return std::unexpected(none.error());
        }
        return std::move(link);
    }

    auto transport_session::disconnect() -> void_result
    {
        log::info("disconnecting SSH session");

        switch (status_)
        {
        case connection_status::connected:
            break;
        case connection_status::disconnected:
        case connection_status::failed:
            log::warn("SSH not connected, cannot disconnect (status {})", status_);
            return fail(error_kind::connection_error, "SSH disconnection failed: no SSH session to close");
        }

        auto closed = link_->close();
        link_.reset();
        status_ = connection_status::disconnected;

        if (!closed.has_value())
        {
            log::error("error while closing the SSH connection to {}: {}", host_, closed.error().message);
            return fail(error_kind::connection_error,
                        fmt::format("SSH disconnection failed: {}", closed.error().message));
        }

        log::info("SSH session to {} closed", host_);
        return {};
    }

    void transport_session::release_link(std::string_view const reason)
    {
        if (!link_)
        {
            return;
        }

        auto closed = link_->close();
        if (!closed.has_value())
        {
            log::warn("closing SSH connection to {} ({}) failed: {}", host_, reason, closed.error().message);
        }
        link_.reset();
        status_ = connection_status::disconnected;
    }

} // namespace mfdlink::ssh
