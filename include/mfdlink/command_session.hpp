#pragma once

// command_session.hpp - shell commands over an established transport

#include "common.hpp"
#include "transport_session.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mfdlink::ssh
{

    struct captured_output
    {
        std::vector<std::string> lines;
        int exit_status{0};
    };

    /// @brief Split raw command output into lines, dropping every '\r' and '\n'
    /// A trailing newline does not produce an empty last line.
    [[nodiscard]] auto split_output_lines(std::string_view output) -> std::vector<std::string>;

    class command_session
    {
    public:
        explicit command_session(transport_session &transport) noexcept;

        // fire and forget: output and exit status are never looked at
        [[nodiscard]] auto run(std::string_view command) -> void_result;

        // output with stderr merged, empty output is an error
        [[nodiscard]] auto run_captured(std::string_view command) -> result<std::vector<std::string>>;

        // NOTE: exit status 0 is reported as a missing status, callers treating 0 as
        // success will see execute_command_error for successful commands
        [[nodiscard]] auto run_captured_with_status(std::string_view command) -> result<captured_output>;

    private:
        [[nodiscard]] auto require_link() const -> result<transport_link *>;

        transport_session &transport_;
    };

} // namespace mfdlink::ssh
