#pragma once
#include "gpu.hpp"
#include <vulkan/vulkan.hpp>
#include <vector>

namespace snowvk {

// Chooses the best device that can present to `surface` under `preference`.
// Returns a null handle when none qualifies.
vk::PhysicalDevice pick_best_device(const std::vector<vk::PhysicalDevice>& devices, vk::SurfaceKHR surface,
                                    PowerPreference preference);

} // namespace snowvk
