#include "config.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace snowvk;

namespace {

EnvLookup env(std::map<std::string, std::string> vars)
{
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

TEST(ConfigTest, DefaultsWithEmptyEnvironment)
{
    const AppConfig cfg = load_config(env({}));

    EXPECT_STREQ(cfg.window.title, "Snow Player");
    EXPECT_EQ(cfg.window.width, 1280u);
    EXPECT_EQ(cfg.window.height, 720u);
    EXPECT_TRUE(cfg.window.transparent);
    EXPECT_EQ(cfg.render.clear_color, (Color{ 0.0f, 1.0f, 0.0f, 1.0f }));
    EXPECT_EQ(cfg.render.triangle_color, (Color{ 1.0f, 0.0f, 0.0f, 1.0f }));
    EXPECT_EQ(cfg.render.power_preference, PowerPreference::HighPerformance);
    EXPECT_EQ(cfg.log_level, log::level::info);
}

TEST(ConfigTest, ReadsAllVariables)
{
    const AppConfig cfg = load_config(env({
        { "SNOWVK_WIDTH", "800" },
        { "SNOWVK_HEIGHT", "600" },
        { "SNOWVK_POWER", "low" },
        { "SNOWVK_LOG_LEVEL", "trace" },
    }));

    EXPECT_EQ(cfg.window.width, 800u);
    EXPECT_EQ(cfg.window.height, 600u);
    EXPECT_EQ(cfg.render.power_preference, PowerPreference::LowPower);
    EXPECT_EQ(cfg.log_level, log::level::trace);
}

TEST(ConfigTest, InvalidValuesKeepDefaults)
{
    const AppConfig cfg = load_config(env({
        { "SNOWVK_WIDTH", "0" },
        { "SNOWVK_HEIGHT", "12px" },
        { "SNOWVK_POWER", "turbo" },
        { "SNOWVK_LOG_LEVEL", "verbose" },
    }));

    EXPECT_EQ(cfg.window.width, 1280u);
    EXPECT_EQ(cfg.window.height, 720u);
    EXPECT_EQ(cfg.render.power_preference, PowerPreference::HighPerformance);
    EXPECT_EQ(cfg.log_level, log::level::info);
}

TEST(ConfigTest, RejectsOversizedExtent)
{
    const AppConfig cfg = load_config(env({ { "SNOWVK_WIDTH", "16385" }, { "SNOWVK_HEIGHT", "16384" } }));
    EXPECT_EQ(cfg.window.width, 1280u);
    EXPECT_EQ(cfg.window.height, 16384u);
}

TEST(LogLevelTest, ParsesKnownNames)
{
    log::level l = log::level::info;
    EXPECT_TRUE(log::parse_level("warn", l));
    EXPECT_EQ(l, log::level::warn);
    EXPECT_TRUE(log::parse_level("off", l));
    EXPECT_EQ(l, log::level::off);
    EXPECT_FALSE(log::parse_level("loud", l));
    EXPECT_EQ(l, log::level::off);
}

TEST(LogLevelTest, ThresholdFiltersLowerLevels)
{
    const log::level saved = log::get_level();
    log::set_level(log::level::warn);
    EXPECT_FALSE(log::enabled(log::level::info));
    EXPECT_TRUE(log::enabled(log::level::warn));
    EXPECT_TRUE(log::enabled(log::level::error));
    log::set_level(saved);
}

} // namespace
