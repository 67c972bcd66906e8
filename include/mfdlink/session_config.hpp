#pragma once

// session_config.hpp - everything needed to reach and authenticate one device

#include "transport.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace mfdlink::ssh
{

    struct retry_policy
    {
        int max_attempts{2};
        std::chrono::milliseconds delay{1000};
    };

    struct session_config
    {
        std::string host;
        int port{22};
        std::string username{"root"};
        std::optional<std::filesystem::path> private_key_path{}; // nullopt = keyless hosts
        std::string private_key_passphrase{};                    // optional
        std::chrono::seconds connect_timeout{30};
        bool strict_host_key_checking{false}; // devices are reflashed often, keys change
        int verbosity{0};                     // 2+ turns on libssh protocol logging, the log level is the caller's
        retry_policy retry{};

        [[nodiscard]] auto to_endpoint() const -> endpoint
        {
            return endpoint{.host = host,
                            .port = port,
                            .username = username,
                            .connect_timeout = connect_timeout,
                            .strict_host_key_checking = strict_host_key_checking,
                            .verbosity = verbosity};
        }
    };

} // namespace mfdlink::ssh
