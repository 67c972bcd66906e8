// libssh_driver.cpp - transport driver implementation using libssh and its SFTP subsystem
// every libssh failure leaves this file as a fault, never as a libssh type

#include "mfdlink/libssh_driver.hpp"

#include "mfdlink/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

// libssh headers - order matters due to internal dependencies
#include <libssh/libssh.h>
#include <libssh/sftp.h>

// some libssh versions have issues with fcntl.h order
#include <fcntl.h>

namespace mfdlink::ssh
{

    namespace
    {

        // SFTP chunk size - 32KB is safe for most servers
        constexpr std::size_t SFTP_CHUNK_SIZE = 32 * 1024;

        constexpr std::size_t COMMAND_READ_SIZE = 4096;

        [[nodiscard]] auto libssh_ready() noexcept -> bool
        {
            static int const rc = ssh_init();
            return rc == SSH_OK;
        }

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct sftp_handle
        {
            sftp_session session{nullptr};

            sftp_handle() = default;
            explicit sftp_handle(sftp_session s) : session(s) {}
            ~sftp_handle() { release(); }

            sftp_handle(sftp_handle const &) = delete;
            auto operator=(sftp_handle const &) -> sftp_handle & = delete;
            sftp_handle(sftp_handle &&) = delete;
            auto operator=(sftp_handle &&) -> sftp_handle & = delete;

            void release() noexcept
            {
                if (session != nullptr)
                {
                    sftp_free(session);
                    session = nullptr;
                }
            }
        };

        // the ssh_session plus every SFTP session derived from it, shared by all of them
        struct ssh_handle
        {
            ssh_session session{nullptr};
            bool disconnected{false};
            std::vector<std::weak_ptr<sftp_handle>> transfers{};

            ssh_handle() = default;
            ~ssh_handle()
            {
                if (session != nullptr)
                {
                    if (!disconnected)
                    {
                        ssh_disconnect(session);
                    }
                    ssh_free(session);
                }
            }

            ssh_handle(ssh_handle const &) = delete;
            auto operator=(ssh_handle const &) -> ssh_handle & = delete;
            ssh_handle(ssh_handle &&) = delete;
            auto operator=(ssh_handle &&) -> ssh_handle & = delete;

            [[nodiscard]] auto alive() const noexcept -> bool
            {
                return session != nullptr && !disconnected && ssh_is_connected(session) != 0;
            }

            [[nodiscard]] auto last_error() const -> std::string
            {
                return session != nullptr ? std::string{ssh_get_error(session)} : std::string{"no SSH session"};
            }
        };

        struct sftp_file_guard
        {
            sftp_file file{nullptr};

            sftp_file_guard() = default;
            explicit sftp_file_guard(sftp_file f) : file(f) {}
            ~sftp_file_guard()
            {
                if (file != nullptr)
                {
                    sftp_close(file);
                }
            }

            sftp_file_guard(sftp_file_guard const &) = delete;
            auto operator=(sftp_file_guard const &) -> sftp_file_guard & = delete;
            sftp_file_guard(sftp_file_guard &&) = delete;
            auto operator=(sftp_file_guard &&) -> sftp_file_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> sftp_file { return file; }
            [[nodiscard]] explicit operator bool() const noexcept { return file != nullptr; }
        };

        struct channel_guard
        {
            ssh_channel channel{nullptr};

            channel_guard() = default;
            explicit channel_guard(ssh_channel c) : channel(c) {}
            ~channel_guard()
            {
                if (channel != nullptr)
                {
                    ssh_channel_close(channel);
                    ssh_channel_free(channel);
                }
            }

            channel_guard(channel_guard const &) = delete;
            auto operator=(channel_guard const &) -> channel_guard & = delete;

            channel_guard(channel_guard &&other) noexcept : channel(other.channel) { other.channel = nullptr; }

            auto operator=(channel_guard &&other) noexcept -> channel_guard &
            {
                if (this != &other)
                {
                    if (channel != nullptr)
                    {
                        ssh_channel_close(channel);
                        ssh_channel_free(channel);
                    }
                    channel = other.channel;
                    other.channel = nullptr;
                }
                return *this;
            }

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel; }
            [[nodiscard]] explicit operator bool() const noexcept { return channel != nullptr; }
        };

        // =============================================================================
        // fault helpers
        // =============================================================================

        [[nodiscard]] auto lowercase(std::string_view const text) -> std::string
        {
            std::string out{text};
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char const c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // channel failures: a dead transport is the usual suspect
        [[nodiscard]] auto channel_fault(ssh_handle const &handle, std::string_view const what)
            -> std::unexpected<fault_info>
        {
            auto const kind = handle.alive() ? fault::protocol_error : fault::transport_lost;
            return make_fault(kind, fmt::format("{}: {}", what, handle.last_error()));
        }

        [[nodiscard]] auto auth_outcome(ssh_handle const &handle, int const rc, std::string_view const method)
            -> fault_void
        {
            switch (rc)
            {
            case SSH_AUTH_SUCCESS:
                return {};
            case SSH_AUTH_DENIED:
            case SSH_AUTH_PARTIAL:
                return make_fault(fault::auth_rejected, fmt::format("{} authentication denied", method));
            default:
                break;
            }
            auto message = handle.last_error();
            return make_fault(classify_libssh_error(message),
                              fmt::format("{} authentication error: {}", method, message));
        }

        [[nodiscard]] auto local_fault(int const err, std::filesystem::path const &path, std::string_view const what)
            -> std::unexpected<fault_info>
        {
            auto kind = fault::os_error;
            switch (err)
            {
            case ENOENT:
            case ENOTDIR:
                kind = fault::local_not_found;
                break;
            case EACCES:
            case EPERM:
            case EROFS:
                kind = fault::permission_denied;
                break;
            default:
                break;
            }
            return make_fault(kind, fmt::format("{} {}: {}", what, path.string(),
                                                std::generic_category().message(err)));
        }

        // =============================================================================
        // command stream
        // =============================================================================

        class libssh_command_stream final : public command_stream
        {
        public:
            libssh_command_stream(std::shared_ptr<ssh_handle> handle, channel_guard channel) noexcept
                : handle_{std::move(handle)}, channel_{std::move(channel)}
            {
            }

            [[nodiscard]] auto read_all() -> fault_result<std::string> override
            {
                std::string output;
                std::array<char, COMMAND_READ_SIZE> buffer{};

                // with a pty stderr already arrives on stdout, without one it is appended
                for (int const is_stderr : {0, 1})
                {
                    auto const count = static_cast<std::uint32_t>(buffer.size());
                    int nbytes = 0;
                    while ((nbytes = ssh_channel_read(channel_.get(), buffer.data(), count, is_stderr)) > 0)
                    {
                        output.append(buffer.data(), static_cast<std::size_t>(nbytes));
                    }
                    if (nbytes == SSH_ERROR)
                    {
                        return channel_fault(*handle_, "reading command output failed");
                    }
                }

                return output;
            }

            [[nodiscard]] auto close_input() -> fault_void override
            {
                return send_eof();
            }

            // SSH has a single EOF message for the write direction, sent at most once
            [[nodiscard]] auto shutdown_write() -> fault_void override
            {
                return send_eof();
            }

            [[nodiscard]] auto exit_status() -> std::optional<int> override
            {
                auto const status = ssh_channel_get_exit_status(channel_.get());
                if (status < 0)
                {
                    return std::nullopt;
                }
                return status;
            }

        private:
            [[nodiscard]] auto send_eof() -> fault_void
            {
                if (eof_sent_ || ssh_channel_is_closed(channel_.get()) != 0)
                {
                    eof_sent_ = true;
                    return {};
                }
                if (ssh_channel_send_eof(channel_.get()) != SSH_OK)
                {
                    return channel_fault(*handle_, "sending EOF failed");
                }
                eof_sent_ = true;
                return {};
            }

            std::shared_ptr<ssh_handle> handle_;
            channel_guard channel_;
            bool eof_sent_{false};
        };

        // =============================================================================
        // transfer link
        // =============================================================================

        class libssh_transfer_link final : public transfer_link
        {
        public:
            libssh_transfer_link(std::shared_ptr<ssh_handle> handle, std::shared_ptr<sftp_handle> sftp) noexcept
                : handle_{std::move(handle)}, sftp_{std::move(sftp)}
            {
            }

            ~libssh_transfer_link() override
            {
                sftp_->release();
            }

            libssh_transfer_link(libssh_transfer_link const &) = delete;
            auto operator=(libssh_transfer_link const &) -> libssh_transfer_link & = delete;
            libssh_transfer_link(libssh_transfer_link &&) = delete;
            auto operator=(libssh_transfer_link &&) -> libssh_transfer_link & = delete;

            [[nodiscard]] auto put(std::filesystem::path const &local_path, std::string_view const remote_path)
                -> fault_void override
            {
                if (sftp_->session == nullptr)
                {
                    return make_fault(fault::transport_lost, "SFTP session already released");
                }

                errno = 0;
                std::ifstream in(local_path, std::ios::binary);
                if (!in)
                {
                    return local_fault(errno != 0 ? errno : ENOENT, local_path, "failed to open local file");
                }

                // keep the local permission bits like scp does
                std::error_code ec;
                auto const perms = std::filesystem::status(local_path, ec).permissions();
                auto const mode = ec ? static_cast<mode_t>(0644)
                                     : static_cast<mode_t>(static_cast<unsigned>(perms) & 0777U);

                auto const remote = std::string(remote_path);
                sftp_file_guard file{sftp_open(sftp_->session, remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode)};
                if (!file)
                {
                    return sftp_fault("failed to open remote file for writing");
                }

                std::vector<char> chunk(SFTP_CHUNK_SIZE);
                while (in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0)
                {
                    auto const count = static_cast<std::size_t>(in.gcount());
                    std::size_t offset = 0;
                    while (offset < count)
                    {
                        auto const written = sftp_write(file.get(), chunk.data() + offset, count - offset);
                        if (written < 0)
                        {
                            return sftp_fault("failed to write to remote file");
                        }
                        offset += static_cast<std::size_t>(written);
                    }
                }

                if (in.bad())
                {
                    return local_fault(errno != 0 ? errno : EIO, local_path, "failed to read local file");
                }

                return {};
            }

            [[nodiscard]] auto get(std::string_view const remote_path, std::filesystem::path const &local_path)
                -> fault_void override
            {
                if (sftp_->session == nullptr)
                {
                    return make_fault(fault::transport_lost, "SFTP session already released");
                }

                auto const remote = std::string(remote_path);
                sftp_file_guard file{sftp_open(sftp_->session, remote.c_str(), O_RDONLY, 0)};
                if (!file)
                {
                    return sftp_fault("failed to open remote file for reading");
                }

                errno = 0;
                std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
                if (!out)
                {
                    return local_fault(errno != 0 ? errno : EIO, local_path, "failed to open local file");
                }

                std::vector<char> chunk(SFTP_CHUNK_SIZE);
                ssize_t nbytes = 0;
                while ((nbytes = sftp_read(file.get(), chunk.data(), chunk.size())) > 0)
                {
                    if (!out.write(chunk.data(), static_cast<std::streamsize>(nbytes)))
                    {
                        auto const err = errno != 0 ? errno : EIO;
                        discard_partial(out, local_path);
                        return local_fault(err, local_path, "failed to write local file");
                    }
                }

                if (nbytes < 0)
                {
                    auto failure = sftp_fault("failed to read from remote file");
                    discard_partial(out, local_path);
                    return failure;
                }

                out.close();
                if (!out)
                {
                    return local_fault(errno != 0 ? errno : EIO, local_path, "failed to flush local file");
                }

                return {};
            }

            [[nodiscard]] auto is_remote_directory(std::string_view const remote_path) -> bool override
            {
                if (sftp_->session == nullptr)
                {
                    return false;
                }

                sftp_attributes attrs = sftp_stat(sftp_->session, std::string(remote_path).c_str());
                if (attrs == nullptr)
                {
                    return false;
                }
                auto const directory = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
                sftp_attributes_free(attrs);
                return directory;
            }

            [[nodiscard]] auto close() -> fault_void override
            {
                if (sftp_->session == nullptr)
                {
                    return make_fault(fault::transport_lost, "SFTP session already released");
                }
                sftp_->release();
                return {};
            }

        private:
            [[nodiscard]] auto sftp_fault(std::string_view const what) const -> std::unexpected<fault_info>
            {
                if (!handle_->alive())
                {
                    return make_fault(fault::transport_lost, fmt::format("{}: SSH transport lost", what));
                }

                auto const status = sftp_get_error(sftp_->session);
                auto const message = handle_->last_error();
                auto const text = fmt::format("{} (sftp status {}): {}", what, status, message);

                if (status == SSH_FX_OK)
                {
                    // not an SFTP status, the SSH layer underneath failed
                    auto const underlying = classify_libssh_error(message);
                    if (underlying == fault::timeout)
                    {
                        return make_fault(fault::timeout, text);
                    }
                    if (is_socket_level(underlying))
                    {
                        return make_fault(fault::transport_lost, text);
                    }
                    return make_fault(fault::unexpected, text);
                }

                return make_fault(classify_sftp_status(status), text);
            }

            static void discard_partial(std::ofstream &out, std::filesystem::path const &local_path)
            {
                out.close();
                std::error_code ec;
                std::filesystem::remove(local_path, ec);
                if (ec)
                {
                    log::warn("could not remove partial download {}: {}", local_path.string(), ec.message());
                }
            }

            std::shared_ptr<ssh_handle> handle_;
            std::shared_ptr<sftp_handle> sftp_;
        };

        // =============================================================================
        // transport link
        // =============================================================================

        class libssh_transport_link final : public transport_link
        {
        public:
            explicit libssh_transport_link(std::shared_ptr<ssh_handle> handle) noexcept : handle_{std::move(handle)} {}

            [[nodiscard]] auto authenticate_with_key(std::filesystem::path const &key_path,
                                                     std::string_view const passphrase) -> fault_void override
            {
                ssh_key key = nullptr;
                auto const pass = std::string(passphrase);
                auto rc = ssh_pki_import_privkey_file(key_path.c_str(), pass.empty() ? nullptr : pass.c_str(), nullptr,
                                                      nullptr, &key);

                // an unreadable key will not become readable on the next attempt
                if (rc != SSH_OK || key == nullptr)
                {
                    return make_fault(fault::auth_rejected,
                                      fmt::format("unable to load private key {}", key_path.string()));
                }

                rc = ssh_userauth_publickey(handle_->session, nullptr, key);
                ssh_key_free(key);
                return auth_outcome(*handle_, rc, "public key");
            }

            [[nodiscard]] auto authenticate_with_password(std::string_view const password) -> fault_void override
            {
                auto const secret = std::string(password);
                return auth_outcome(*handle_, ssh_userauth_password(handle_->session, nullptr, secret.c_str()),
                                    "password");
            }

            [[nodiscard]] auto authenticate_none() -> fault_void override
            {
                return auth_outcome(*handle_, ssh_userauth_none(handle_->session, nullptr), "none");
            }

            [[nodiscard]] auto open_command(std::string_view const command, command_mode const mode)
                -> fault_result<std::unique_ptr<command_stream>> override
            {
                if (!handle_->alive())
                {
                    return make_fault(fault::transport_lost, "SSH transport is not connected");
                }

                channel_guard channel{ssh_channel_new(handle_->session)};
                if (!channel)
                {
                    return channel_fault(*handle_, "failed to create SSH channel");
                }

                if (ssh_channel_open_session(channel.get()) != SSH_OK)
                {
                    return channel_fault(*handle_, "failed to open SSH channel");
                }

                switch (mode)
                {
                case command_mode::captured:
                    if (ssh_channel_request_pty(channel.get()) != SSH_OK)
                    {
                        return channel_fault(*handle_, "failed to allocate a pseudo-terminal");
                    }
                    break;
                case command_mode::detached:
                    break;
                }

                if (ssh_channel_request_exec(channel.get(), std::string(command).c_str()) != SSH_OK)
                {
                    return channel_fault(*handle_, "failed to execute command on SSH channel");
                }

                return std::make_unique<libssh_command_stream>(handle_, std::move(channel));
            }

            [[nodiscard]] auto open_transfer() -> fault_result<std::unique_ptr<transfer_link>> override
            {
                if (!handle_->alive())
                {
                    return make_fault(fault::transport_lost, "SSH transport is not connected");
                }

                auto sftp = std::make_shared<sftp_handle>(sftp_new(handle_->session));
                if (sftp->session == nullptr)
                {
                    return channel_fault(*handle_, "failed to create SFTP session");
                }

                if (sftp_init(sftp->session) != SSH_OK)
                {
                    return make_fault(fault::protocol_error,
                                      fmt::format("failed to initialize SFTP session (sftp status {}): {}",
                                                  sftp_get_error(sftp->session), handle_->last_error()));
                }

                auto &transfers = handle_->transfers;
                transfers.erase(std::remove_if(transfers.begin(), transfers.end(),
                                               [](std::weak_ptr<sftp_handle> const &w) { return w.expired(); }),
                                transfers.end());
                transfers.push_back(sftp);

                return std::make_unique<libssh_transfer_link>(handle_, std::move(sftp));
            }

            [[nodiscard]] auto close() -> fault_void override
            {
                if (handle_->disconnected)
                {
                    return make_fault(fault::transport_lost, "SSH transport already closed");
                }

                // SFTP sessions sit on channels that ssh_disconnect frees
                for (auto const &weak : handle_->transfers)
                {
                    if (auto sftp = weak.lock())
                    {
                        sftp->release();
                    }
                }
                handle_->transfers.clear();

                ssh_disconnect(handle_->session);
                handle_->disconnected = true;
                return {};
            }

        private:
            std::shared_ptr<ssh_handle> handle_;
        };

    } // namespace

    // =============================================================================
    // classification
    // =============================================================================

    auto classify_libssh_error(std::string_view const message) -> fault
    {
        if (message.empty())
        {
            return fault::unexpected;
        }

        auto const text = lowercase(message);
        auto const contains = [&text](std::string_view const needle) { return text.find(needle) != std::string::npos; };

        if (contains("network is unreachable"))
        {
            return fault::network_unreachable;
        }
        if (contains("no route to host") || contains("host is unreachable") || contains("host unreachable"))
        {
            return fault::host_unreachable;
        }
        if (contains("timeout") || contains("timed out"))
        {
            return fault::timeout;
        }
        if (contains("connection refused") || contains("connection reset") || contains("broken pipe") ||
            contains("failed to resolve") || contains("name or service not known") ||
            contains("temporary failure in name resolution") || contains("socket error") ||
            contains("failed to connect") || contains("socket exception"))
        {
            return fault::socket_error;
        }
        if (contains("access denied") || contains("permission denied"))
        {
            return fault::auth_rejected;
        }
        if (contains("kex") || contains("key exchange") || contains("protocol") || contains("packet") ||
            contains("banner") || contains("host key") || contains("cipher") || contains("mac error") ||
            contains("disconnect"))
        {
            return fault::protocol_error;
        }
        return fault::unexpected;
    }

    auto classify_sftp_status(int const status) noexcept -> fault
    {
        switch (status)
        {
        case SSH_FX_NO_SUCH_FILE:
        case SSH_FX_NO_SUCH_PATH:
        case SSH_FX_EOF:
        case SSH_FX_FAILURE:
        case SSH_FX_BAD_MESSAGE:
        case SSH_FX_OP_UNSUPPORTED:
        case SSH_FX_INVALID_HANDLE:
        case SSH_FX_FILE_ALREADY_EXISTS:
        case SSH_FX_NO_MEDIA:
            return fault::remote_path_invalid;
        case SSH_FX_PERMISSION_DENIED:
        case SSH_FX_WRITE_PROTECT:
            return fault::permission_denied;
        case SSH_FX_NO_CONNECTION:
        case SSH_FX_CONNECTION_LOST:
            return fault::transport_lost;
        default:
            return fault::unexpected;
        }
    }

    // =============================================================================
    // driver
    // =============================================================================

    auto libssh_driver::dial(endpoint const &target) -> fault_result<std::unique_ptr<transport_link>>
    {
        if (!libssh_ready())
        {
            return make_fault(fault::unexpected, "libssh initialisation failed");
        }

        auto handle = std::make_shared<ssh_handle>();
        handle->session = ssh_new();
        if (handle->session == nullptr)
        {
            return make_fault(fault::unexpected, "failed to allocate SSH session");
        }

        // set connection options
        auto const port = static_cast<unsigned int>(target.port);
        auto const timeout_secs = static_cast<long>(target.connect_timeout.count());
        int const strict = target.strict_host_key_checking ? 1 : 0;

        if (ssh_options_set(handle->session, SSH_OPTIONS_HOST, target.host.c_str()) < 0 ||
            ssh_options_set(handle->session, SSH_OPTIONS_PORT, &port) < 0 ||
            ssh_options_set(handle->session, SSH_OPTIONS_USER, target.username.c_str()) < 0 ||
            ssh_options_set(handle->session, SSH_OPTIONS_TIMEOUT, &timeout_secs) < 0 ||
            ssh_options_set(handle->session, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict) < 0)
        {
            return make_fault(fault::unexpected, fmt::format("invalid SSH options: {}", handle->last_error()));
        }

        if (target.verbosity >= 2)
        {
            int verbosity = SSH_LOG_PROTOCOL;
            if (ssh_options_set(handle->session, SSH_OPTIONS_LOG_VERBOSITY, &verbosity) < 0)
            {
                log::warn("could not enable libssh protocol logging: {}", handle->last_error());
            }
        }

        log::debug("dialling {}:{}", target.host, target.port);

        if (ssh_connect(handle->session) != SSH_OK)
        {
            auto message = handle->last_error();
            return make_fault(classify_libssh_error(message), std::move(message));
        }

        // unknown keys are accepted unless strict checking was asked for
        if (target.strict_host_key_checking)
        {
            auto const state = ssh_session_is_known_server(handle->session);
            if (state != SSH_KNOWN_HOSTS_OK)
            {
                return make_fault(fault::host_key_rejected,
                                  fmt::format("SSH host key verification failed for {}", target.host));
            }
        }

        return std::make_unique<libssh_transport_link>(std::move(handle));
    }

    auto make_libssh_driver() -> std::unique_ptr<transport_driver>
    {
        return std::make_unique<libssh_driver>();
    }

} // namespace mfdlink::ssh
