#include "vk_device_select.hpp"
#include "log.hpp"
#include <cstring>

namespace snowvk {

static bool supports_swapchain(vk::PhysicalDevice pd)
{
    for (const auto& e : pd.enumerateDeviceExtensionProperties())
        if (std::strcmp(e.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0)
            return true;
    return false;
}

static int type_score(vk::PhysicalDeviceType type, PowerPreference preference)
{
    const bool high = preference == PowerPreference::HighPerformance;
    switch (type)
    {
    case vk::PhysicalDeviceType::eDiscreteGpu:   return high ? 1000 : 500;
    case vk::PhysicalDeviceType::eIntegratedGpu: return high ? 500 : 1000;
    case vk::PhysicalDeviceType::eVirtualGpu:    return 250;
    case vk::PhysicalDeviceType::eCpu:           return 0;
    default:                                     return 100;
    }
}

vk::PhysicalDevice pick_best_device(const std::vector<vk::PhysicalDevice>& devices, vk::SurfaceKHR surface,
                                    PowerPreference preference)
{
    vk::PhysicalDevice best{};
    int bestScore = -1;

    for (auto pd : devices)
    {
        const auto props = pd.getProperties();
        if (!supports_swapchain(pd))
        {
            log::trace("gpu", "skipping ", props.deviceName.data(), ": no swapchain extension");
            continue;
        }

        // Require graphics + present queue families.
        const auto qfps = pd.getQueueFamilyProperties();
        bool hasG=false, hasP=false;
        for (uint32_t i=0;i<(uint32_t)qfps.size();++i)
        {
            if (qfps[i].queueFlags & vk::QueueFlagBits::eGraphics) hasG=true;
            if (pd.getSurfaceSupportKHR(i, surface)) hasP=true;
        }
        if (!hasG || !hasP)
        {
            log::trace("gpu", "skipping ", props.deviceName.data(), ": cannot present to the window surface");
            continue;
        }

        int score = type_score(props.deviceType, preference);
        // VRAM heuristic, only as a tie-breaker between devices of the same class.
        if (preference == PowerPreference::HighPerformance)
        {
            const auto mem = pd.getMemoryProperties();
            for (uint32_t h=0; h<mem.memoryHeapCount; ++h)
                if (mem.memoryHeaps[h].flags & vk::MemoryHeapFlagBits::eDeviceLocal)
                    score += int(mem.memoryHeaps[h].size / (1024ull*1024ull*1024ull));
        }

        if (score > bestScore) { bestScore = score; best = pd; }
    }

    return best;
}

} // namespace snowvk
