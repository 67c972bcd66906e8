// file_transfer.cpp - transfer channel lifecycle and push/pull error mapping

#include "mfdlink/file_transfer.hpp"

#include "mfdlink/log.hpp"

#include <system_error>
#include <utility>

namespace mfdlink::ssh
{

    namespace
    {

        [[nodiscard]] auto transfer_failure(fault_info const &f, std::string_view const operation,
                                            std::string_view const source, std::string_view const target)
            -> std::unexpected<error>
        {
            auto const cause = to_transfer_cause(f.kind);
            switch (cause)
            {
            case transfer_cause::local_not_found:
                log::error("{}: local path for {} -> {} not found", operation, source, target);
                break;
            case transfer_cause::permission_denied:
                log::error("{}: permission denied for {} -> {}", operation, source, target);
                break;
            case transfer_cause::timeout:
                log::error("{}: transfer of {} timed out", operation, source);
                break;
            case transfer_cause::remote_path_invalid:
                log::error("{}: remote path missing or unusable for {} -> {}", operation, source, target);
                break;
            case transfer_cause::transport_failure:
                log::error("{}: SSH transport failed during transfer of {}", operation, source);
                break;
            case transfer_cause::os_error:
            case transfer_cause::unexpected:
            case transfer_cause::none:
                log::error("{}: transfer of {} failed", operation, source);
                break;
            }
            return fail_transfer(cause, fmt::format("{} {} -> {} failed: {}", operation, source, target, f.message));
        }

    } // anonymous namespace

    auto join_remote_path(std::string_view const remote_dir, std::string_view const file_name) -> std::string
    {
        if (remote_dir.empty())
        {
            return std::string{file_name};
        }
        if (remote_dir.back() == '/')
        {
            return fmt::format("{}{}", remote_dir, file_name);
        }
        return fmt::format("{}/{}", remote_dir, file_name);
    }

    auto remote_file_name(std::string_view const remote_path) -> std::string_view
    {
        auto const slash = remote_path.rfind('/');
        if (slash == std::string_view::npos)
        {
            return remote_path;
        }
        return remote_path.substr(slash + 1);
    }

    file_transfer::file_transfer(transport_session &transport) noexcept : transport_{transport}
    {
    }

    file_transfer::~file_transfer()
    {
        if (!link_)
        {
            return;
        }

        if (!is_stale())
        {
            auto closed = link_->close();
            if (!closed.has_value())
            {
                log::warn("closing transfer channel failed: {}", closed.error().message);
            }
        }
        link_.reset();
    }

    auto file_transfer::is_stale() const noexcept -> bool
    {
        switch (status_)
        {
        case connection_status::connected:
            return !transport_.is_connected() || transport_.generation() != generation_;
        case connection_status::disconnected:
        case connection_status::failed:
            return false;
        }
        return false;
    }

    void file_transfer::drop_if_stale()
    {
        if (is_stale())
        {
            log::info("transfer channel invalidated, its SSH transport was closed or replaced");
            link_.reset();
            status_ = connection_status::disconnected;
        }
    }

    auto file_transfer::status() const noexcept -> connection_status
    {
        return is_stale() ? connection_status::disconnected : status_;
    }

    auto file_transfer::link() const noexcept -> transfer_link *
    {
        return status() == connection_status::connected ? link_.get() : nullptr;
    }

    auto file_transfer::open_channel() -> void_result
    {
        log::info("opening transfer channel");
        drop_if_stale();

        switch (transport_.status())
        {
        case connection_status::connected:
            break;
        case connection_status::disconnected:
        case connection_status::failed:
            log::warn("not connected to SSH session, cannot open transfer channel (status {})", transport_.status());
            return fail(error_kind::connection_error, "transfer channel failed: no SSH session available");
        }

        switch (status_)
        {
        case connection_status::connected:
            return fail(error_kind::already_connected, "transfer channel already established");
        case connection_status::disconnected:
        case connection_status::failed:
            break;
        }

        auto opened = transport_.link()->open_transfer();
        if (!opened.has_value())
        {
            status_ = connection_status::failed;
            log::error("opening transfer channel failed: {}", opened.error().message);
            return fail(error_kind::connection_error,
                        fmt::format("transfer channel failed: {}", opened.error().message));
        }

        link_ = std::move(*opened);
        status_ = connection_status::connected;
        generation_ = transport_.generation();
        log::info("transfer channel to {} established", transport_.host());
        return {};
    }

    auto file_transfer::close_channel() -> void_result
    {
        log::info("closing transfer channel");
        drop_if_stale();

        switch (status_)
        {
        case connection_status::connected:
            break;
        case connection_status::disconnected:
        case connection_status::failed:
            log::warn("transfer channel not connected, cannot close (status {})", status_);
            return fail(error_kind::connection_error, "transfer channel disconnection failed: no channel to close");
        }

        auto closed = link_->close();
        link_.reset();
        status_ = connection_status::disconnected;

        if (!closed.has_value())
        {
            log::error("error while closing the transfer channel: {}", closed.error().message);
            return fail(error_kind::connection_error,
                        fmt::format("transfer channel disconnection failed: {}", closed.error().message));
        }
        return {};
    }

    auto file_transfer::require_channel() -> void_result
    {
        drop_if_stale();

        switch (status_)
        {
        case connection_status::connected:
            return {};
        case connection_status::disconnected:
        case connection_status::failed:
            log::warn("not connected to transfer channel (status {})", status_);
            return fail(error_kind::connection_error, "there is no established transfer connection");
        }
        return fail(error_kind::connection_error, "there is no established transfer connection");
    }

    auto file_transfer::push(std::filesystem::path const &local_path, std::string_view const remote_path)
        -> void_result
    {
        if (auto ready = require_channel(); !ready.has_value())
        {
            return ready;
        }

        log::info("pushing {} to {}", local_path.string(), remote_path);

        std::error_code ec;
        auto const local_status = std::filesystem::status(local_path, ec);
        if (local_status.type() == std::filesystem::file_type::not_found)
        {
            return transfer_failure({fault::local_not_found, "local file not found"}, "push", local_path.string(),
                                    remote_path);
        }
        if (ec)
        {
            auto const kind = ec == std::errc::permission_denied ? fault::permission_denied : fault::os_error;
            return transfer_failure({kind, ec.message()}, "push", local_path.string(), remote_path);
        }
        if (std::filesystem::is_directory(local_status))
        {
            return transfer_failure({fault::os_error, "local path is a directory"}, "push", local_path.string(),
                                    remote_path);
        }

        auto target = std::string{remote_path};
        if (link_->is_remote_directory(remote_path))
        {
            target = join_remote_path(remote_path, local_path.filename().string());
        }

        auto copied = link_->put(local_path, target);
        if (!copied.has_value())
        {
            return transfer_failure(copied.error(), "push", local_path.string(), target);
        }

        log::info("pushed {} to {}", local_path.string(), target);
        return {};
    }

    auto file_transfer::pull(std::filesystem::path const &local_path, std::string_view const remote_path)
        -> void_result
    {
        if (auto ready = require_channel(); !ready.has_value())
        {
            return ready;
        }

        log::info("pulling {} to {}", remote_path, local_path.string());

        auto target = local_path;
        std::error_code ec;
        if (std::filesystem::is_directory(local_path, ec))
        {
            auto const name = remote_file_name(remote_path);
            if (name.empty())
            {
                return transfer_failure({fault::remote_path_invalid, "remote path names no file"}, "pull",
                                        remote_path, local_path.string());
            }
            target /= name;
        }
        else if (auto const parent = local_path.parent_path(); !parent.empty() && !std::filesystem::exists(parent, ec))
        {
            return transfer_failure({fault::local_not_found, "local directory does not exist"}, "pull", remote_path,
                                    local_path.string());
        }

        auto copied = link_->get(remote_path, target);
        if (!copied.has_value())
        {
            return transfer_failure(copied.error(), "pull", remote_path, target.string());
        }

        log::info("pulled {} to {}", remote_path, target.string());
        return {};
    }

} // namespace mfdlink::ssh
