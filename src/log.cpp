// log.cpp - stderr printer behind the log helpers

#include "mfdlink/log.hpp"

#include <atomic>
#include <cstdio>
#include <fmt/color.h>
#include <mutex>
#include <unistd.h>

namespace mfdlink::log
{

    namespace
    {

        std::atomic<level> g_level{level::warn};

        std::mutex g_sink_mutex;
        sink g_sink{};

        std::mutex g_print_mutex;

        [[nodiscard]] auto level_style(level const lvl) noexcept -> fmt::text_style
        {
            switch (lvl)
            {
            case level::debug:
                return fmt::fg(fmt::color::gray);
            case level::info:
                return fmt::fg(fmt::color::cyan);
            case level::warn:
                return fmt::fg(fmt::color::yellow);
            case level::error:
                return fmt::fg(fmt::color::red) | fmt::emphasis::bold;
            case level::off:
                break;
            }
            return {};
        }

        [[nodiscard]] auto stderr_is_terminal() noexcept -> bool
        {
            static bool const tty = ::isatty(::fileno(stderr)) != 0;
            return tty;
        }

    } // anonymous namespace

    void set_level(level const lvl) noexcept
    {
        g_level.store(lvl, std::memory_order_relaxed);
    }

    auto current_level() noexcept -> level
    {
        return g_level.load(std::memory_order_relaxed);
    }

    void set_sink(sink s)
    {
        std::lock_guard const lock{g_sink_mutex};
        g_sink = std::move(s);
    }

    void write(level const lvl, std::string_view const message)
    {
        // the sink runs unlocked so it may log or swap the sink itself
        sink current;
        {
            std::lock_guard const lock{g_sink_mutex};
            current = g_sink;
        }
        if (current)
        {
            current(lvl, message);
            return;
        }

        std::lock_guard const lock{g_print_mutex};
        if (stderr_is_terminal())
        {
            fmt::print(stderr, level_style(lvl), "[mfdlink {}]", to_string(lvl));
            fmt::print(stderr, " {}\n", message);
        }
        else
        {
            fmt::print(stderr, "[mfdlink {}] {}\n", to_string(lvl), message);
        }
    }

} // namespace mfdlink::log
