#pragma once

#include "vk_platform.hpp"
#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace snowvk {

struct DeviceState {
    vk::PhysicalDevice pd{};
    vk::UniqueDevice device;

    vk::Queue graphicsQueue;
    vk::Queue presentQueue;
    uint32_t graphicsQ = 0;
    uint32_t presentQ = 0;

    vk::UniqueCommandPool cmdPool;
    // Every submission is waited on before submit() returns, so one fence is enough.
    vk::UniqueFence submitFence;

    // Single-subpass color-only render passes, one per swapchain format.
    std::map<vk::Format, vk::UniqueRenderPass> renderPasses;
};

struct SwapchainState {
    vk::UniqueSwapchainKHR swapchain;
    vk::SurfaceFormatKHR   surfFmt{};
    vk::PresentModeKHR     presentMode{};
    vk::Extent2D           extent{};
    std::vector<vk::Image> images;
    std::vector<vk::UniqueImageView> views;
};

struct SyncState {
    vk::UniqueSemaphore imageAvailable;
    // Indexed by swapchain image; the presentation engine may still hold the previous one.
    std::vector<vk::UniqueSemaphore> renderFinished;
};

} // namespace snowvk
