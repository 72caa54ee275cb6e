#pragma once
#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <vector>

namespace snowvk {

uint32_t pick_graphics_qf(vk::PhysicalDevice pd);
uint32_t pick_present_qf(vk::PhysicalDevice pd, vk::SurfaceKHR surface);

// Capability lists in the order the driver reports them.
std::vector<vk::Format> list_surface_formats(vk::PhysicalDevice pd, vk::SurfaceKHR surface);
std::vector<vk::PresentModeKHR> list_present_modes(vk::PhysicalDevice pd, vk::SurfaceKHR surface);
std::vector<vk::CompositeAlphaFlagBitsKHR> list_alpha_modes(vk::CompositeAlphaFlagsKHR supported);

// Color space paired with `fmt` in the surface format list; false if the format is not offered.
bool find_color_space(const std::vector<vk::SurfaceFormatKHR>& formats, vk::Format fmt, vk::ColorSpaceKHR& out);

vk::UniqueRenderPass create_color_renderpass(vk::Device dev, vk::Format colorFmt);

} // namespace snowvk
