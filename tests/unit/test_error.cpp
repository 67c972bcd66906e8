// tests/unit/test_error.cpp - error taxonomy, std::error_code integration and formatting

#include "mfdlink/common.hpp"
#include "mfdlink/log.hpp"
#include <doctest/doctest.h>

#include <string>
#include <system_error>
#include <utility>
#include <vector>

using mfdlink::connection_status;
using mfdlink::error;
using mfdlink::error_kind;
using mfdlink::transfer_cause;

TEST_SUITE("error_taxonomy")
{
    TEST_CASE("status names")
    {
        CHECK(mfdlink::to_string(connection_status::connected) == "connected");
        CHECK(mfdlink::to_string(connection_status::disconnected) == "disconnected");
        CHECK(mfdlink::to_string(connection_status::failed) == "failed");
        CHECK(fmt::format("{}", connection_status::failed) == "failed");
    }

    TEST_CASE("error kinds convert to std::error_code")
    {
        std::error_code const ec = error_kind::network_error;

        CHECK(ec.value() == static_cast<int>(error_kind::network_error));
        CHECK(std::string(ec.category().name()) == "mfdlink");
        CHECK_FALSE(ec.message().empty());
        CHECK(ec == error_kind::network_error);
        CHECK(ec != error_kind::connection_error);
    }

    TEST_CASE("every kind has a category message")
    {
        for (auto const kind : {error_kind::authentication_failed, error_kind::network_error,
                                error_kind::connection_error, error_kind::unknown_error,
                                error_kind::already_connected, error_kind::execute_command_error,
                                error_kind::transfer_error, error_kind::session_error})
        {
            CAPTURE(mfdlink::to_string(kind));
            CHECK_FALSE(mfdlink::make_error_code(kind).message().empty());
        }
    }

    TEST_CASE("plain error describes kind and message")
    {
        auto const err = error::make(error_kind::authentication_failed, "key rejected");

        CHECK(err.is(error_kind::authentication_failed));
        CHECK(err.cause == transfer_cause::none);
        CHECK(err.code() == error_kind::authentication_failed);
        CHECK(err.describe() == "authentication_failed: key rejected");
        CHECK(fmt::format("{}", err) == "authentication_failed: key rejected");
    }

    TEST_CASE("transfer error carries its cause")
    {
        auto const err = error::transfer(transfer_cause::permission_denied, "cannot write /root/x");

        CHECK(err.is(error_kind::transfer_error));
        CHECK(err.cause == transfer_cause::permission_denied);
        CHECK(err.describe() == "transfer_error(permission_denied): cannot write /root/x");
    }

    TEST_CASE("fail helpers build unexpected values")
    {
        mfdlink::void_result const r = mfdlink::fail(error_kind::session_error, "boom");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().is(error_kind::session_error));

        mfdlink::result<int> const t = mfdlink::fail_transfer(transfer_cause::timeout, "slow");
        REQUIRE_FALSE(t.has_value());
        CHECK(t.error().cause == transfer_cause::timeout);
    }
}

TEST_SUITE("logging")
{
    TEST_CASE("verbosity maps to levels")
    {
        using mfdlink::log::level;
        CHECK(mfdlink::log::level_from_verbosity(0) == level::warn);
        CHECK(mfdlink::log::level_from_verbosity(1) == level::info);
        CHECK(mfdlink::log::level_from_verbosity(2) == level::debug);
        CHECK(mfdlink::log::level_from_verbosity(7) == level::debug);
    }

    TEST_CASE("sink receives messages at or above the level")
    {
        using mfdlink::log::level;
        auto const saved = mfdlink::log::current_level();

        std::vector<std::pair<level, std::string>> seen;
        mfdlink::log::set_sink([&seen](level const lvl, std::string_view const msg) { seen.emplace_back(lvl, msg); });
        mfdlink::log::set_level(level::info);

        mfdlink::log::debug("hidden {}", 1);
        mfdlink::log::info("connected to {}", "mfd-1");
        mfdlink::log::error("failed after {} attempts", 2);

        mfdlink::log::set_sink({});
        mfdlink::log::set_level(saved);

        REQUIRE(seen.size() == 2);
        CHECK(seen[0].first == level::info);
        CHECK(seen[0].second == "connected to mfd-1");
        CHECK(seen[1].first == level::error);
        CHECK(seen[1].second == "failed after 2 attempts");
    }

    TEST_CASE("sink may log from inside itself")
    {
        using mfdlink::log::level;
        auto const saved = mfdlink::log::current_level();

        std::vector<std::string> seen;
        bool forwarding = false;
        mfdlink::log::set_sink([&seen, &forwarding](level, std::string_view const msg) {
            seen.emplace_back(msg);
            if (!forwarding)
            {
                forwarding = true;
                mfdlink::log::info("forwarded: {}", msg);
            }
        });
        mfdlink::log::set_level(level::info);

        mfdlink::log::warn("link {} dropped", "mfd-2");

        mfdlink::log::set_sink({});
        mfdlink::log::set_level(saved);

        REQUIRE(seen.size() == 2);
        CHECK(seen[0] == "link mfd-2 dropped");
        CHECK(seen[1] == "forwarded: link mfd-2 dropped");
    }

    TEST_CASE("sink may replace itself")
    {
        using mfdlink::log::level;
        auto const saved = mfdlink::log::current_level();
        mfdlink::log::set_level(level::info);

        int first_calls = 0;
        int second_calls = 0;
        mfdlink::log::set_sink([&first_calls, &second_calls](level, std::string_view) {
            ++first_calls;
            mfdlink::log::set_sink([&second_calls](level, std::string_view) { ++second_calls; });
        });

        mfdlink::log::info("one");
        mfdlink::log::info("two");

        mfdlink::log::set_sink({});
        mfdlink::log::set_level(saved);

        CHECK(first_calls == 1);
        CHECK(second_calls == 1);
    }

    TEST_CASE("off silences everything")
    {
        using mfdlink::log::level;
        auto const saved = mfdlink::log::current_level();
        mfdlink::log::set_level(level::off);

        CHECK_FALSE(mfdlink::log::enabled(level::error));
        CHECK_FALSE(mfdlink::log::enabled(level::off));

        mfdlink::log::set_level(saved);
    }
}
