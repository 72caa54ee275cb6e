#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

// Tagged console logger. Lines are written as "[tag] message";
// trace/info go to stdout, warn/error to stderr.

namespace snowvk::log {

enum class level : std::uint32_t
{
    trace = 0,
    info = 1,
    warn = 2,
    error = 3,
    off = 4,
};

void set_level(level min_level) noexcept;
level get_level() noexcept;
bool enabled(level lvl) noexcept;

// Accepts trace|info|warn|error|off.
bool parse_level(std::string_view text, level& out) noexcept;

void write(level lvl, std::string_view tag, std::string_view msg);

namespace detail {
template <class... Args>
std::string concat(const Args&... args)
{
    std::ostringstream os;
    (os << ... << args);
    return os.str();
}
} // namespace detail

template <class... Args>
void trace(std::string_view tag, const Args&... args)
{
    if (enabled(level::trace)) write(level::trace, tag, detail::concat(args...));
}

template <class... Args>
void info(std::string_view tag, const Args&... args)
{
    if (enabled(level::info)) write(level::info, tag, detail::concat(args...));
}

template <class... Args>
void warn(std::string_view tag, const Args&... args)
{
    if (enabled(level::warn)) write(level::warn, tag, detail::concat(args...));
}

template <class... Args>
void error(std::string_view tag, const Args&... args)
{
    if (enabled(level::error)) write(level::error, tag, detail::concat(args...));
}

} // namespace snowvk::log
