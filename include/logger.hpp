#ifndef UPNP_SCAN_LOGGER_HPP
#define UPNP_SCAN_LOGGER_HPP

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace logger
{

enum class level : int
{
    debug = 0,
    info,
    warn,
    error,
    off
};

/**
 * The threshold is read once from the UPNP_SCAN_LOG environment variable
 * (debug, info, warn, error or off) and defaults to warn
 */
level get_level();

void set_level(level lvl);

level parse_level(std::string_view name, level fallback);

void write(level lvl, std::string_view message);

inline bool enabled(level lvl)
{
    return lvl >= get_level() && lvl != level::off;
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::debug))
        write(level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::info))
        write(level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::warn))
        write(level::warn, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::error))
        write(level::error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logger

#endif
