// mfdlink_remote.cpp - one-shot command line front end for a single device
// connect, do one thing, tear down

#include "mfdlink/log.hpp"
#include "mfdlink/remote_session.hpp"

#include <chrono>
#include <fmt/color.h>
#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{

    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_SESSION = 2;

    // =============================================================================
    // configuration
    // =============================================================================

    enum class action
    {
        run,
        exec,
        status,
        push,
        pull,
    };

    struct cli_config
    {
        mfdlink::ssh::session_config session{};
        action what{action::exec};
        std::vector<std::string> operands{};
    };

    auto print_error(std::string_view const msg) -> void
    {
        fmt::print(stderr, fmt::fg(fmt::color::red), "[error] ");
        fmt::print(stderr, "{}\n", msg);
    }

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} <host> [options] <command> [args...]

Commands:
  run <command...>          Start a command, do not wait for output
  exec <command...>         Run a command and print its output
  status <command...>       Run a command, print its output and exit status
  push <local> <remote>     Copy a local file to the device
  pull <remote> <local>     Copy a file from the device

Options:
  --user <name>             SSH username (default: root)
  --key <path>              SSH private key, keyless authentication if omitted
  --passphrase <text>       Passphrase for the private key
  --port <port>             SSH port (default: 22)
  --timeout <seconds>       Connect timeout (default: 30)
  --attempts <n>            Connection attempts (default: 2)
  --strict-host-keys        Refuse hosts missing from known_hosts
  --verbose, -v             More output, repeat for debug and libssh protocol logs

Example:
  {} 192.168.1.20 --key ~/.ssh/mfd_ed25519 pull /data/logs/nav.log ./nav.log

)",
                   program_name, program_name);
    }

    [[nodiscard]] auto parse_action(std::string_view const word) -> std::optional<action>
    {
        if (word == "run")
        {
            return action::run;
        }
        if (word == "exec")
        {
            return action::exec;
        }
        if (word == "status")
        {
            return action::status;
        }
        if (word == "push")
        {
            return action::push;
        }
        if (word == "pull")
        {
            return action::pull;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<cli_config>
    {
        cli_config config;
        std::optional<action> chosen;

        try
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string_view const arg{argv[i]};

                // everything after the command word belongs to the command
                if (chosen.has_value())
                {
                    config.operands.emplace_back(arg);
                }
                else if (arg == "--user" && i + 1 < argc)
                {
                    config.session.username = argv[++i];
                }
                else if (arg == "--key" && i + 1 < argc)
                {
                    config.session.private_key_path = argv[++i];
                }
                else if (arg == "--passphrase" && i + 1 < argc)
                {
                    config.session.private_key_passphrase = argv[++i];
                }
                else if (arg == "--port" && i + 1 < argc)
                {
                    config.session.port = std::stoi(argv[++i]);
                }
                else if (arg == "--timeout" && i + 1 < argc)
                {
                    config.session.connect_timeout = std::chrono::seconds{std::stoul(argv[++i])};
                }
                else if (arg == "--attempts" && i + 1 < argc)
                {
                    config.session.retry.max_attempts = std::stoi(argv[++i]);
                }
                else if (arg == "--strict-host-keys")
                {
                    config.session.strict_host_key_checking = true;
                }
                else if (arg == "--verbose" || arg == "-v")
                {
                    ++config.session.verbosity;
                }
                else if (arg == "--help" || arg == "-h")
                {
                    return std::nullopt;
                }
                else if (arg.starts_with("-"))
                {
                    fmt::print(stderr, "Unknown argument: {}\n", arg);
                    return std::nullopt;
                }
                else if (config.session.host.empty())
                {
                    config.session.host = arg;
                }
                else if (auto const parsed = parse_action(arg); parsed.has_value())
                {
                    chosen = parsed;
                }
                else
                {
                    fmt::print(stderr, "Unknown command: {}\n", arg);
                    return std::nullopt;
                }
            }
        }
        catch (std::exception const &e)
        {
            fmt::print(stderr, "Error: invalid numeric option ({})\n", e.what());
            return std::nullopt;
        }

        // validate required fields
        if (config.session.host.empty())
        {
            fmt::print(stderr, "Error: <host> is required\n");
            return std::nullopt;
        }
        if (!chosen.has_value())
        {
            fmt::print(stderr, "Error: a command is required\n");
            return std::nullopt;
        }
        config.what = *chosen;

        switch (config.what)
        {
        case action::run:
        case action::exec:
        case action::status:
            if (config.operands.empty())
            {
                fmt::print(stderr, "Error: nothing to execute\n");
                return std::nullopt;
            }
            break;
        case action::push:
        case action::pull:
            if (config.operands.size() != 2)
            {
                fmt::print(stderr, "Error: push and pull take exactly two paths\n");
                return std::nullopt;
            }
            break;
        }

        return config;
    }

    // =============================================================================
    // actions
    // =============================================================================

    [[nodiscard]] auto perform(mfdlink::ssh::remote_session &session, cli_config const &config)
        -> mfdlink::void_result
    {
        auto const command = fmt::format("{}", fmt::join(config.operands, " "));

        switch (config.what)
        {
        case action::run:
            return session.run(command);

        case action::exec: {
            auto lines = session.run_captured(command);
            if (!lines.has_value())
            {
                return std::unexpected(std::move(lines.error()));
            }
            for (auto const &line : *lines)
            {
                fmt::print("{}\n", line);
            }
            return {};
        }

        case action::status: {
            auto output = session.run_captured_with_status(command);
            if (!output.has_value())
            {
                return std::unexpected(std::move(output.error()));
            }
            for (auto const &line : output->lines)
            {
                fmt::print("{}\n", line);
            }
            fmt::print("exit status: {}\n", output->exit_status);
            return {};
        }

        case action::push:
        case action::pull:
            break;
        }

        if (auto opened = session.open_transfer_channel(); !opened.has_value())
        {
            return opened;
        }

        if (config.what == action::push)
        {
            return session.push(config.operands[0], config.operands[1]);
        }
        return session.pull(config.operands[1], config.operands[0]);
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto config_opt = parse_args(argc, argv);
    if (!config_opt.has_value())
    {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (config_opt->session.verbosity > 0)
    {
        mfdlink::log::set_level(mfdlink::log::level_from_verbosity(config_opt->session.verbosity));
    }

    auto session = mfdlink::ssh::remote_session::open(config_opt->session);
    if (!session.has_value())
    {
        print_error(session.error().describe());
        return EXIT_SESSION;
    }

    auto done = perform(*session, *config_opt);
    auto closed = session->disconnect_all();

    if (!done.has_value())
    {
        print_error(done.error().describe());
        return EXIT_SESSION;
    }
    if (!closed.has_value())
    {
        print_error(closed.error().describe());
        return EXIT_SESSION;
    }

    return 0;
}
