#pragma once
#include "gpu.hpp"
#include "log.hpp"
#include "platform.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Compile-time switches (set from CMake):
//   SNOWVK_ENABLE_VALIDATION  request VK_LAYER_KHRONOS_validation when installed
//   SNOWVK_HEADLESS           build without a window; main() exits immediately
#ifndef SNOWVK_ENABLE_VALIDATION
#define SNOWVK_ENABLE_VALIDATION 0
#endif
#ifndef SNOWVK_HEADLESS
#define SNOWVK_HEADLESS 0
#endif

namespace snowvk {

struct RenderSettings {
    Color clear_color{ 0.0f, 1.0f, 0.0f, 1.0f };
    Color triangle_color{ 1.0f, 0.0f, 0.0f, 1.0f };
    PowerPreference power_preference = PowerPreference::HighPerformance;
};

struct AppConfig {
    WindowCreateInfo window{};
    RenderSettings render{};
    log::level log_level = log::level::info;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Reads SNOWVK_WIDTH, SNOWVK_HEIGHT, SNOWVK_POWER (high|low) and SNOWVK_LOG_LEVEL.
// Invalid values are reported and the default is kept.
AppConfig load_config(const EnvLookup& lookup);
AppConfig load_config_from_env();

} // namespace snowvk
