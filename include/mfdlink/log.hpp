#pragma once

// log.hpp - leveled diagnostics on stderr via fmt
// quiet by default, the caller decides how chatty a session gets

#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <string_view>
#include <utility>

namespace mfdlink::log
{

    enum class level : std::uint8_t
    {
        debug = 0,
        info,
        warn,
        error,
        off,
    };

    [[nodiscard]] constexpr auto to_string(level const lvl) noexcept -> std::string_view
    {
        switch (lvl)
        {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
        case level::off:
            return "off";
        }
        return "unknown";
    }

    // 0 -> warn, 1 -> info, 2+ -> debug
    [[nodiscard]] constexpr auto level_from_verbosity(int const verbosity) noexcept -> level
    {
        if (verbosity >= 2)
        {
            return level::debug;
        }
        if (verbosity == 1)
        {
            return level::info;
        }
        return level::warn;
    }

    void set_level(level lvl) noexcept;
    [[nodiscard]] auto current_level() noexcept -> level;

    [[nodiscard]] inline auto enabled(level const lvl) noexcept -> bool
    {
        return lvl != level::off && lvl >= current_level();
    }

    // replaces the stderr printer, pass an empty function to restore it
    using sink = std::function<void(level, std::string_view)>;
    void set_sink(sink s);

    void write(level lvl, std::string_view message);

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::debug))
        {
            write(level::debug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::info))
        {
            write(level::info, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::warn))
        {
            write(level::warn, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        if (enabled(level::error))
        {
            write(level::error, fmt::format(format, std::forward<Args>(args)...));
        }
    }

} // namespace mfdlink::log
