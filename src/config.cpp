#include "config.hpp"
#include <charconv>
#include <cstdlib>

namespace snowvk {

static bool parse_extent(const std::string& text, uint32_t& out)
{
    uint32_t v = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (ec != std::errc{} || ptr != end || v == 0 || v > 16384) return false;
    out = v;
    return true;
}

AppConfig load_config(const EnvLookup& lookup)
{
    AppConfig cfg{};
#if defined(__ANDROID__)
    // No console to read on device; keep everything for logcat.
    cfg.log_level = log::level::trace;
#endif

    if (auto w = lookup("SNOWVK_WIDTH"))
    {
        if (!parse_extent(*w, cfg.window.width))
            log::warn("config", "ignoring SNOWVK_WIDTH='", *w, "'");
    }
    if (auto h = lookup("SNOWVK_HEIGHT"))
    {
        if (!parse_extent(*h, cfg.window.height))
            log::warn("config", "ignoring SNOWVK_HEIGHT='", *h, "'");
    }
    if (auto p = lookup("SNOWVK_POWER"))
    {
        if (*p == "high") cfg.render.power_preference = PowerPreference::HighPerformance;
        else if (*p == "low") cfg.render.power_preference = PowerPreference::LowPower;
        else log::warn("config", "ignoring SNOWVK_POWER='", *p, "' (expected high|low)");
    }
    if (auto l = lookup("SNOWVK_LOG_LEVEL"))
    {
        if (!log::parse_level(*l, cfg.log_level))
            log::warn("config", "ignoring SNOWVK_LOG_LEVEL='", *l, "'");
    }
    return cfg;
}

AppConfig load_config_from_env()
{
    return load_config([](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const char* v = std::getenv(key.c_str())) return std::string(v);
        return std::nullopt;
    });
}

} // namespace snowvk
