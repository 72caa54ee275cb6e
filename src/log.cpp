#include "log.hpp"
#include <atomic>
#include <iostream>

namespace snowvk::log {

namespace {
std::atomic<level> g_level{ level::info };
}

void set_level(level min_level) noexcept { g_level.store(min_level, std::memory_order_relaxed); }
level get_level() noexcept { return g_level.load(std::memory_order_relaxed); }

bool enabled(level lvl) noexcept
{
    const level min = get_level();
    return min != level::off && lvl >= min;
}

bool parse_level(std::string_view text, level& out) noexcept
{
    if (text == "trace") { out = level::trace; return true; }
    if (text == "info")  { out = level::info;  return true; }
    if (text == "warn")  { out = level::warn;  return true; }
    if (text == "error") { out = level::error; return true; }
    if (text == "off")   { out = level::off;   return true; }
    return false;
}

void write(level lvl, std::string_view tag, std::string_view msg)
{
    std::ostream& os = (lvl >= level::warn) ? std::cerr : std::cout;
    os << "[" << tag << "] " << msg << "\n";
}

} // namespace snowvk::log
