// error.cpp - std::error_code integration for the session layer taxonomy

#include "mfdlink/common.hpp"

namespace mfdlink
{

    namespace
    {

        class error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "mfdlink"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error_kind>(ev))
                {
                case error_kind::authentication_failed:
                    return "authentication rejected by remote host";
                case error_kind::network_error:
                    return "network error while connecting";
                case error_kind::connection_error:
                    return "SSH connection error";
                case error_kind::unknown_error:
                    return "connection failed for an unknown reason";
                case error_kind::already_connected:
                    return "connection already established";
                case error_kind::execute_command_error:
                    return "remote command execution failed";
                case error_kind::transfer_error:
                    return "file transfer failed";
                case error_kind::session_error:
                    return "session teardown failed";
                default:
                    return fmt::format("unknown mfdlink error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto error_category() noexcept -> std::error_category const &
        {
            static error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto make_error_code(error_kind const kind) noexcept -> std::error_code
    {
        return {static_cast<int>(kind), error_category()};
    }

    auto error::describe() const -> std::string
    {
        if (kind == error_kind::transfer_error)
        {
            return fmt::format("{}({}): {}", kind, cause, message);
        }
        return fmt::format("{}: {}", kind, message);
    }

} // namespace mfdlink
