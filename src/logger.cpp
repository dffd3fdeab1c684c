#include "logger.hpp"
#include "utils.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace logger
{

static std::atomic<int> c_level {-1};
static std::mutex c_write_mutex;

static const char* level_tag(level lvl)
{
    switch(lvl)
    {
        case level::debug: return "DEBUG";
        case level::info: return "INFO";
        case level::warn: return "WARN";
        case level::error: return "ERROR";
        default: return "";
    }
}

level parse_level(std::string_view name, level fallback)
{
    const std::string lower = utils::to_lower(utils::trim(name));
    if(lower == "debug")
        return level::debug;
    else if(lower == "info")
        return level::info;
    else if(lower == "warn" || lower == "warning")
        return level::warn;
    else if(lower == "error")
        return level::error;
    else if(lower == "off" || lower == "none")
        return level::off;

    return fallback;
}

level get_level()
{
    int current = c_level.load();
    if(current < 0)
    {
        const char* env = std::getenv("UPNP_SCAN_LOG");
        level lvl = (env == nullptr) ? level::warn : parse_level(env, level::warn);

        // Keep a level that was set explicitly in the meantime
        int expected = -1;
        c_level.compare_exchange_strong(expected, static_cast<int>(lvl));
        current = c_level.load();
    }
    return static_cast<level>(current);
}

void set_level(level lvl)
{
    c_level.store(static_cast<int>(lvl));
}

void write(level lvl, std::string_view message)
{
    std::lock_guard<std::mutex> lock {c_write_mutex};
    fmt::print(stderr, "[upnp_scan] {}: {}\n", level_tag(lvl), message);
}

} // namespace logger
