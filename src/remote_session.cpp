// remote_session.cpp - facade wiring: owns the driver and transport, lends them to the sub-sessions

#include "mfdlink/remote_session.hpp"

#include "mfdlink/libssh_driver.hpp"
#include "mfdlink/log.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop

#include <cstdio>
#include <exception>
#include <utility>

namespace mfdlink::ssh
{

    namespace
    {

        [[nodiscard]] auto moved_from() -> std::unexpected<error>
        {
            return fail(error_kind::session_error, "remote session has been moved from");
        }

    } // anonymous namespace

    // =============================================================================
    // impl - heap allocated so the sub-sessions' references survive moves
    // =============================================================================

    class remote_session::impl
    {
    public:
        impl(session_config config, std::unique_ptr<transport_driver> driver,
             transport_session::sleep_function sleeper)
            : config_{std::move(config)}, driver_{std::move(driver)}, transport_{*driver_, std::move(sleeper)},
              commands_{transport_}, transfers_{transport_}
        {
        }

        impl(impl const &) = delete;
        auto operator=(impl const &) -> impl & = delete;
        impl(impl &&) = delete;
        auto operator=(impl &&) -> impl & = delete;

        // declaration order is teardown order in reverse: transfers, commands, transport, driver
        session_config config_;
        std::unique_ptr<transport_driver> driver_;
        transport_session transport_;
        command_session commands_;
        file_transfer transfers_;
    };

    remote_session::remote_session(std::unique_ptr<impl> pimpl) : impl_(std::move(pimpl)) {}

    remote_session::remote_session(remote_session &&other) noexcept = default;

    auto remote_session::operator=(remote_session &&other) noexcept -> remote_session &
    {
        if (this != &other)
        {
            if (impl_)
            {
                teardown("replaced session");
            }
            impl_ = std::move(other.impl_);
        }
        return *this;
    }

    remote_session::~remote_session()
    {
        if (!impl_)
        {
            return;
        }

        teardown("session");
    }

    void remote_session::teardown(std::string_view const what) noexcept
    {
        try
        {
            if (auto done = disconnect_all(); !done.has_value())
            {
                log::warn("teardown of {} to {} failed: {}", what, impl_->transport_.host(), done.error().message);
            }
        }
        catch (std::exception const &e)
        {
            // formatting may throw again, stick to stdio
            std::fputs("[mfdlink error] session teardown aborted: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
    }

    auto remote_session::open(session_config const &config) -> result<remote_session>
    {
        return open(config, make_libssh_driver());
    }

    auto remote_session::open(session_config const &config, std::unique_ptr<transport_driver> driver,
                              transport_session::sleep_function sleeper) -> result<remote_session>
    {
        if (!driver)
        {
            return fail(error_kind::session_error, "no transport driver supplied");
        }

        auto pimpl = std::make_unique<impl>(config, std::move(driver), std::move(sleeper));

        auto connected = pimpl->transport_.connect(pimpl->config_);
        if (!connected.has_value())
        {
            return std::unexpected(std::move(connected.error()));
        }

        return remote_session(std::move(pimpl));
    }

    auto remote_session::reconnect() -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transport_.connect(impl_->config_, true);
    }

    auto remote_session::disconnect() -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transport_.disconnect();
    }

    auto remote_session::open_transfer_channel() -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transfers_.open_channel();
    }

    auto remote_session::close_transfer_channel() -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transfers_.close_channel();
    }

    auto remote_session::disconnect_all() -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }

        std::vector<std::string> failures;

        if (impl_->transfers_.status() == connection_status::connected)
        {
            if (auto closed = impl_->transfers_.close_channel(); !closed.has_value())
            {
                failures.push_back(closed.error().describe());
            }
        }

        if (impl_->transport_.status() == connection_status::connected)
        {
            if (auto closed = impl_->transport_.disconnect(); !closed.has_value())
            {
                failures.push_back(closed.error().describe());
            }
        }

        if (!failures.empty())
        {
            return fail(error_kind::session_error, fmt::format("an error occurred when disconnecting all sessions: {}",
                                                               fmt::join(failures, "; ")));
        }

        log::info("disconnected from SSH and transfer sessions, SSH status: {}, transfer status: {}",
                  impl_->transport_.status(), impl_->transfers_.status());
        return {};
    }

    auto remote_session::status() const noexcept -> connection_status
    {
        return impl_ ? impl_->transport_.status() : connection_status::disconnected;
    }

    auto remote_session::transfer_status() const noexcept -> connection_status
    {
        return impl_ ? impl_->transfers_.status() : connection_status::disconnected;
    }

    auto remote_session::host() const noexcept -> std::string_view
    {
        return impl_ ? impl_->transport_.host() : std::string_view{};
    }

    auto remote_session::principal() const noexcept -> std::string_view
    {
        return impl_ ? impl_->transport_.principal() : std::string_view{};
    }

    auto remote_session::run(std::string_view const command) -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->commands_.run(command);
    }

    auto remote_session::run_captured(std::string_view const command) -> result<std::vector<std::string>>
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->commands_.run_captured(command);
    }

    auto remote_session::run_captured_with_status(std::string_view const command) -> result<captured_output>
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->commands_.run_captured_with_status(command);
    }

    auto remote_session::push(std::filesystem::path const &local_path, std::string_view const remote_path)
        -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transfers_.push(local_path, remote_path);
    }

    auto remote_session::pull(std::filesystem::path const &local_path, std::string_view const remote_path)
        -> void_result
    {
        if (!impl_)
        {
            return moved_from();
        }
        return impl_->transfers_.pull(local_path, remote_path);
    }

    // component accessors must not be used on a moved-from session
    auto remote_session::transport() noexcept -> transport_session &
    {
        return impl_->transport_;
    }

    auto remote_session::commands() noexcept -> command_session &
    {
        return impl_->commands_;
    }

    auto remote_session::transfers() noexcept -> file_transfer &
    {
        return impl_->transfers_;
    }

} // namespace mfdlink::ssh
