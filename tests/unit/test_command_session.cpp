// tests/unit/test_command_session.cpp - the three command modes and output splitting

#include "common/fake_transport.hpp"
#include "mfdlink/command_session.hpp"
#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using mfdlink::connection_status;
using mfdlink::error_kind;
using mfdlink::ssh::command_mode;
using mfdlink::ssh::command_session;
using mfdlink::ssh::fault;
using mfdlink::ssh::split_output_lines;
using mfdlink::ssh::transport_session;
using mfdlink::testing::fake_driver;
using mfdlink::testing::fake_script;
using mfdlink::testing::test_config;

namespace
{

    struct connected_fixture
    {
        std::shared_ptr<fake_script> script = std::make_shared<fake_script>();
        fake_driver driver{script};
        transport_session transport{driver};
        command_session commands{transport};

        connected_fixture()
        {
            REQUIRE(transport.connect(test_config()).has_value());
        }
    };

} // anonymous namespace

// =============================================================================
// output splitting
// =============================================================================
TEST_SUITE("split_output_lines")
{
    TEST_CASE("empty output has no lines")
    {
        CHECK(split_output_lines("").empty());
    }

    TEST_CASE("trailing newline does not add an empty line")
    {
        CHECK(split_output_lines("ok\n") == std::vector<std::string>{"ok"});
        CHECK(split_output_lines("ok") == std::vector<std::string>{"ok"});
    }

    TEST_CASE("pty line endings are stripped")
    {
        CHECK(split_output_lines("a\r\nb\r\n") == std::vector<std::string>{"a", "b"});
    }

    TEST_CASE("blank lines in the middle are kept")
    {
        CHECK(split_output_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
    }

    TEST_CASE("a lone newline is one empty line")
    {
        CHECK(split_output_lines("\n") == std::vector<std::string>{""});
    }
}

// =============================================================================
// not connected
// =============================================================================
TEST_SUITE("command_session_not_connected")
{
    TEST_CASE("every mode fails without touching the transport")
    {
        auto script = std::make_shared<fake_script>();
        fake_driver driver{script};
        transport_session transport{driver};
        command_session commands{transport};

        auto run = commands.run("reboot");
        auto captured = commands.run_captured("uptime");
        auto with_status = commands.run_captured_with_status("uptime");

        REQUIRE_FALSE(run.has_value());
        REQUIRE_FALSE(captured.has_value());
        REQUIRE_FALSE(with_status.has_value());
        CHECK(run.error().is(error_kind::execute_command_error));
        CHECK(captured.error().is(error_kind::execute_command_error));
        CHECK(with_status.error().is(error_kind::execute_command_error));
        CHECK(script->transport_calls() == 0);
    }

    TEST_CASE("failed transport is treated like a missing one")
    {
        auto script = std::make_shared<fake_script>();
        script->dial_faults = {{fault::timeout, "t"}, {fault::timeout, "t"}};
        fake_driver driver{script};
        transport_session transport{driver, [](auto) {}};
        command_session commands{transport};

        REQUIRE_FALSE(transport.connect(test_config()).has_value());
        REQUIRE(transport.status() == connection_status::failed);

        auto result = commands.run_captured("uptime");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
        CHECK(script->commands.empty());
    }
}

// =============================================================================
// run
// =============================================================================
TEST_SUITE("command_session_run")
{
    TEST_CASE("run dispatches without a pty and never reads")
    {
        connected_fixture f;

        REQUIRE(f.commands.run("systemctl restart navd").has_value());
        REQUIRE(f.script->commands.size() == 1);
        CHECK(f.script->commands[0].first == "systemctl restart navd");
        CHECK(f.script->commands[0].second == command_mode::detached);
        CHECK(f.script->reads == 0);
        CHECK(f.script->input_closes == 1);
    }

    TEST_CASE("run succeeds whatever the command would print")
    {
        connected_fixture f;
        f.script->output.clear();
        f.script->exit_status = 0;

        CHECK(f.commands.run("true").has_value());
    }

    TEST_CASE("channel failure is an execute_command_error")
    {
        connected_fixture f;
        f.script->open_command_fault = mfdlink::ssh::fault_info{fault::transport_lost, "channel refused"};

        auto result = f.commands.run("ls");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
    }
}

// =============================================================================
// run_captured
// =============================================================================
TEST_SUITE("command_session_run_captured")
{
    TEST_CASE("single line of output")
    {
        connected_fixture f;

        auto result = f.commands.run_captured("echo ok");
        REQUIRE(result.has_value());
        CHECK(*result == std::vector<std::string>{"ok"});
        REQUIRE(f.script->commands.size() == 1);
        CHECK(f.script->commands[0].second == command_mode::captured);
    }

    TEST_CASE("merged output keeps its order")
    {
        connected_fixture f;
        f.script->output = "starting\r\nerror: no logs found\r\n";

        auto result = f.commands.run_captured("ls /data/logs");
        REQUIRE(result.has_value());
        CHECK(*result == std::vector<std::string>{"starting", "error: no logs found"});
    }

    TEST_CASE("no output is an error")
    {
        connected_fixture f;
        f.script->output.clear();

        auto result = f.commands.run_captured("true");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
    }
}

// =============================================================================
// run_captured_with_status
// =============================================================================
TEST_SUITE("command_session_run_captured_with_status")
{
    TEST_CASE("output and non-zero status")
    {
        connected_fixture f;
        f.script->output = "line one\nline two\n";
        f.script->exit_status = 3;

        auto result = f.commands.run_captured_with_status("check-disk");
        REQUIRE(result.has_value());
        CHECK(result->lines == std::vector<std::string>{"line one", "line two"});
        CHECK(result->exit_status == 3);
        CHECK(f.script->input_closes == 1);
        CHECK(f.script->write_shutdowns == 1);
    }

    TEST_CASE("output is drained before the channel is shut and the status read")
    {
        connected_fixture f;
        f.script->output = "sda1 93%\n";
        f.script->exit_status = 2;

        auto result = f.commands.run_captured_with_status("df -h /data");
        REQUIRE(result.has_value());
        CHECK(f.script->stream_calls ==
              std::vector<std::string>{"read", "close_input", "shutdown_write", "exit_status"});
    }

    TEST_CASE("exit status 0 is reported as missing")
    {
        connected_fixture f;
        f.script->exit_status = 0;

        auto result = f.commands.run_captured_with_status("true; echo ok");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
    }

    TEST_CASE("missing exit status is an error")
    {
        connected_fixture f;
        f.script->exit_status = std::nullopt;

        auto result = f.commands.run_captured_with_status("echo ok");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
    }

    TEST_CASE("no output is an error even with a status")
    {
        connected_fixture f;
        f.script->output.clear();
        f.script->exit_status = 2;

        auto result = f.commands.run_captured_with_status("false");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(error_kind::execute_command_error));
    }
}
