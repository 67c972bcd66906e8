// command_session.cpp - the three capture modes for remote commands

#include "mfdlink/command_session.hpp"

#include "mfdlink/log.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace mfdlink::ssh
{

    auto split_output_lines(std::string_view output) -> std::vector<std::string>
    {
        std::vector<std::string> lines;

        while (!output.empty())
        {
            auto const newline = output.find('\n');
            auto const piece = output.substr(0, newline);

            std::string line;
            line.reserve(piece.size());
            std::copy_if(piece.begin(), piece.end(), std::back_inserter(line), [](char const c) { return c != '\r'; });
            lines.push_back(std::move(line));

            if (newline == std::string_view::npos)
            {
                break;
            }
            output.remove_prefix(newline + 1);
        }

        return lines;
    }

    command_session::command_session(transport_session &transport) noexcept : transport_{transport}
    {
    }

    auto command_session::require_link() const -> result<transport_link *>
    {
        switch (transport_.status())
        {
        case connection_status::connected:
            return transport_.link();
        case connection_status::disconnected:
        case connection_status::failed:
            log::warn("SSH not connected, cannot execute command (status {})", transport_.status());
            return fail(error_kind::execute_command_error, "SSH command execution failed: no SSH session available");
        }
        return fail(error_kind::execute_command_error, "SSH command execution failed: no SSH session available");
    }

    auto command_session::run(std::string_view const command) -> void_result
    {
        auto link = require_link();
        if (!link.has_value())
        {
            return std::unexpected(std::move(link.error()));
        }

        log::info("executing command: {}", command);

        auto stream = (*link)->open_command(command, command_mode::detached);
        if (!stream.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to start '{}': {}", command, stream.error().message));
        }

        auto eof = (*stream)->close_input();
        if (!eof.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to dispatch '{}': {}", command, eof.error().message));
        }

        log::debug("dispatched '{}' without reading output", command);
        return {};
    }

    auto command_session::run_captured(std::string_view const command) -> result<std::vector<std::string>>
    {
        auto link = require_link();
        if (!link.has_value())
        {
            return std::unexpected(std::move(link.error()));
        }

        log::info("executing command and reading output: {}", command);

        auto stream = (*link)->open_command(command, command_mode::captured);
        if (!stream.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to start '{}': {}", command, stream.error().message));
        }

        auto output = (*stream)->read_all();
        if (!output.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to read output of '{}': {}", command, output.error().message));
        }

        auto lines = split_output_lines(*output);
        if (lines.empty())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("command '{}' did not return any output", command));
        }

        log::debug("output of '{}': {} line(s)", command, lines.size());
        return lines;
    }

    auto command_session::run_captured_with_status(std::string_view const command) -> result<captured_output>
    {
        auto link = require_link();
        if (!link.has_value())
        {
            return std::unexpected(std::move(link.error()));
        }

        log::info("executing command and reading output and exit status: {}", command);

        auto stream = (*link)->open_command(command, command_mode::captured);
        if (!stream.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to start '{}': {}", command, stream.error().message));
        }

        auto output = (*stream)->read_all();
        if (!output.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to read output of '{}': {}", command, output.error().message));
        }

        // the exit status only means something once the output is drained
        auto input_closed = (*stream)->close_input();
        if (!input_closed.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to close input of '{}': {}", command, input_closed.error().message));
        }

        auto write_shut = (*stream)->shutdown_write();
        if (!write_shut.has_value())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("failed to shut down '{}': {}", command, write_shut.error().message));
        }

        auto const exit_status = (*stream)->exit_status();

        auto lines = split_output_lines(*output);
        if (lines.empty())
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("command '{}' did not return any output", command));
        }

        // NOTE: 0 is indistinguishable from a missing status here
        if (!exit_status.has_value() || *exit_status == 0)
        {
            return fail(error_kind::execute_command_error,
                        fmt::format("command '{}' did not return an exit status", command));
        }

        log::debug("output of '{}': {} line(s), exit status {}", command, lines.size(), *exit_status);
        return captured_output{std::move(lines), *exit_status};
    }

} // namespace mfdlink::ssh
