#pragma once
#include "gpu.hpp"
#include <memory>

namespace snowvk {

// Creates a Vulkan instance with the window-system surface extension for this platform
// (and the Khronos validation layer when SNOWVK_ENABLE_VALIDATION is set and installed).
// Throws GpuError(BackendFailure) if no Vulkan loader/driver is usable.
std::unique_ptr<IGpuInstance> create_vulkan_instance(const char* app_name);

} // namespace snowvk
