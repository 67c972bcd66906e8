#pragma once

// remote_session.hpp - one handle per device: transport, commands and transfers
// opening it connects straight away, dropping it tears everything down

#include "command_session.hpp"
#include "common.hpp"
#include "file_transfer.hpp"
#include "session_config.hpp"
#include "transport.hpp"
#include "transport_session.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mfdlink::ssh
{

    class remote_session
    {
    public:
        ~remote_session();

        // move-only type
        remote_session(remote_session const &) = delete;
        auto operator=(remote_session const &) -> remote_session & = delete;
        remote_session(remote_session &&) noexcept;
        auto operator=(remote_session &&) noexcept -> remote_session &;

        // -------------------------------------------------------------------------
        // construction - connects immediately
        // -------------------------------------------------------------------------

        [[nodiscard]] static auto open(session_config const &config) -> result<remote_session>;

        [[nodiscard]] static auto open(session_config const &config, std::unique_ptr<transport_driver> driver,
                                       transport_session::sleep_function sleeper = {}) -> result<remote_session>;

        // -------------------------------------------------------------------------
        // connection management
        // -------------------------------------------------------------------------

        // connect again with the stored configuration, replacing any live transport
        [[nodiscard]] auto reconnect() -> void_result;
        [[nodiscard]] auto disconnect() -> void_result;

        [[nodiscard]] auto open_transfer_channel() -> void_result;
        [[nodiscard]] auto close_transfer_channel() -> void_result;

        // transfer channel first, then the transport; a no-op when nothing is open
        [[nodiscard]] auto disconnect_all() -> void_result;

        [[nodiscard]] auto status() const noexcept -> connection_status;
        [[nodiscard]] auto transfer_status() const noexcept -> connection_status;
        [[nodiscard]] auto host() const noexcept -> std::string_view;
        [[nodiscard]] auto principal() const noexcept -> std::string_view;

        // -------------------------------------------------------------------------
        // command execution
        // -------------------------------------------------------------------------

        [[nodiscard]] auto run(std::string_view command) -> void_result;
        [[nodiscard]] auto run_captured(std::string_view command) -> result<std::vector<std::string>>;
        [[nodiscard]] auto run_captured_with_status(std::string_view command) -> result<captured_output>;

        // -------------------------------------------------------------------------
        // file transfer
        // -------------------------------------------------------------------------

        [[nodiscard]] auto push(std::filesystem::path const &local_path, std::string_view remote_path)
            -> void_result;
        [[nodiscard]] auto pull(std::filesystem::path const &local_path, std::string_view remote_path)
            -> void_result;

        // -------------------------------------------------------------------------
        // component access
        // -------------------------------------------------------------------------

        [[nodiscard]] auto transport() noexcept -> transport_session &;
        [[nodiscard]] auto commands() noexcept -> command_session &;
        [[nodiscard]] auto transfers() noexcept -> file_transfer &;

    private:
        class impl;
        std::unique_ptr<impl> impl_;

        explicit remote_session(std::unique_ptr<impl> impl);

        // closes whatever is still open, never throws
        void teardown(std::string_view what) noexcept;
    };

} // namespace mfdlink::ssh
