#pragma once

// libssh_driver.hpp - transport driver backed by libssh
// uses SFTP for file transfer (libssh deprecated SCP in 0.10.x)

#include "transport.hpp"

#include <memory>
#include <string_view>

namespace mfdlink::ssh
{

    /// @brief Map a libssh error text from connect or authentication to a fault
    /// libssh only reports socket failures as strerror() text inside its message.
    [[nodiscard]] auto classify_libssh_error(std::string_view message) -> fault;

    /// @brief Map an SFTP status code (SSH_FX_*) to a fault
    [[nodiscard]] auto classify_sftp_status(int status) noexcept -> fault;

    class libssh_driver final : public transport_driver
    {
    public:
        libssh_driver() = default;
        ~libssh_driver() override = default;

        libssh_driver(libssh_driver const &) = delete;
        auto operator=(libssh_driver const &) -> libssh_driver & = delete;
        libssh_driver(libssh_driver &&) = delete;
        auto operator=(libssh_driver &&) -> libssh_driver & = delete;

        [[nodiscard]] auto dial(endpoint const &target) -> fault_result<std::unique_ptr<transport_link>> override;
    };

    [[nodiscard]] auto make_libssh_driver() -> std::unique_ptr<transport_driver>;

} // namespace mfdlink::ssh
