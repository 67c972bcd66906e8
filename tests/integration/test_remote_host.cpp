// tests/integration/test_remote_host.cpp - real SSH round trip against a reachable device
// WARNING: needs MFDLINK_TEST_HOST, and MFDLINK_TEST_KEY for key authentication
// optional MFDLINK_TEST_USER and MFDLINK_TEST_PORT, defaults root and 22

#include "mfdlink/remote_session.hpp"
#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace
{

    namespace fs = std::filesystem;

    [[nodiscard]] auto env(char const *name) -> std::string
    {
        auto const *value = std::getenv(name);
        return value != nullptr ? std::string{value} : std::string{};
    }

    [[nodiscard]] auto has_test_host() -> bool
    {
        return !env("MFDLINK_TEST_HOST").empty();
    }

    [[nodiscard]] auto host_config() -> mfdlink::ssh::session_config
    {
        mfdlink::ssh::session_config config;
        config.host = env("MFDLINK_TEST_HOST");
        if (auto const user = env("MFDLINK_TEST_USER"); !user.empty())
        {
            config.username = user;
        }
        if (auto const port = env("MFDLINK_TEST_PORT"); !port.empty())
        {
            config.port = std::stoi(port);
        }
        if (auto const key = env("MFDLINK_TEST_KEY"); !key.empty())
        {
            config.private_key_path = key;
        }
        config.connect_timeout = std::chrono::seconds{10};
        return config;
    }

} // anonymous namespace

TEST_SUITE("remote_host_integration" * doctest::skip(!has_test_host()))
{
    TEST_CASE("connect and run a command")
    {
        auto session = mfdlink::ssh::remote_session::open(host_config());
        REQUIRE(session.has_value());
        CHECK(session->status() == mfdlink::connection_status::connected);

        auto lines = session->run_captured("echo mfdlink");
        REQUIRE(lines.has_value());
        REQUIRE_FALSE(lines->empty());
        CHECK(lines->front() == "mfdlink");

        auto status = session->run_captured_with_status("echo failing; exit 3");
        REQUIRE(status.has_value());
        CHECK(status->exit_status == 3);

        CHECK(session->disconnect_all().has_value());
    }

    TEST_CASE("push then pull the same file")
    {
        auto session = mfdlink::ssh::remote_session::open(host_config());
        REQUIRE(session.has_value());
        REQUIRE(session->open_transfer_channel().has_value());

        std::random_device rd;
        auto const tag = std::to_string(rd());
        auto const local = fs::temp_directory_path() / ("mfdlink-it-" + tag + ".txt");
        auto const back = fs::temp_directory_path() / ("mfdlink-it-" + tag + ".back");
        {
            std::ofstream out(local);
            out << "payload " << tag << "\n";
        }

        auto const remote = "/tmp/mfdlink-it-" + tag + ".txt";
        REQUIRE(session->push(local, remote).has_value());
        REQUIRE(session->pull(back, remote).has_value());

        std::ifstream in(back);
        std::string line;
        std::getline(in, line);
        CHECK(line == "payload " + tag);

        CHECK(session->run("rm -f " + remote).has_value());
        CHECK(session->disconnect_all().has_value());

        std::error_code ec;
        fs::remove(local, ec);
        fs::remove(back, ec);
    }

    TEST_CASE("missing remote file maps to remote_path_invalid")
    {
        auto session = mfdlink::ssh::remote_session::open(host_config());
        REQUIRE(session.has_value());
        REQUIRE(session->open_transfer_channel().has_value());

        auto const target = fs::temp_directory_path() / "mfdlink-it-missing";
        auto result = session->pull(target, "/nonexistent/mfdlink/file");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().cause == mfdlink::transfer_cause::remote_path_invalid);
        CHECK_FALSE(fs::exists(target));
    }
}
