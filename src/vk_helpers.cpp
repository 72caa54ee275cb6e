#include "vk_helpers.hpp"
#include "gpu_error.hpp"
#include <array>

namespace snowvk {

uint32_t pick_graphics_qf(vk::PhysicalDevice pd)
{
    auto qfps = pd.getQueueFamilyProperties();
    for (uint32_t i=0;i<(uint32_t)qfps.size();++i)
        if (qfps[i].queueFlags & vk::QueueFlagBits::eGraphics) return i;
    throw GpuError(GpuErrorCode::DeviceRequestFailed, "No graphics queue family");
}

uint32_t pick_present_qf(vk::PhysicalDevice pd, vk::SurfaceKHR surface)
{
    auto qfps = pd.getQueueFamilyProperties();
    for (uint32_t i=0;i<(uint32_t)qfps.size();++i)
        if (pd.getSurfaceSupportKHR(i, surface)) return i;
    throw GpuError(GpuErrorCode::DeviceRequestFailed, "No present queue family");
}

std::vector<vk::Format> list_surface_formats(vk::PhysicalDevice pd, vk::SurfaceKHR surface)
{
    std::vector<vk::Format> out;
    for (const auto& f : pd.getSurfaceFormatsKHR(surface))
    {
        bool seen = false;
        for (auto g : out) if (g == f.format) { seen = true; break; }
        if (!seen) out.push_back(f.format);
    }
    return out;
}

std::vector<vk::PresentModeKHR> list_present_modes(vk::PhysicalDevice pd, vk::SurfaceKHR surface)
{
    return pd.getSurfacePresentModesKHR(surface);
}

std::vector<vk::CompositeAlphaFlagBitsKHR> list_alpha_modes(vk::CompositeAlphaFlagsKHR supported)
{
    constexpr std::array<vk::CompositeAlphaFlagBitsKHR,4> order = {
        vk::CompositeAlphaFlagBitsKHR::eOpaque,
        vk::CompositeAlphaFlagBitsKHR::ePreMultiplied,
        vk::CompositeAlphaFlagBitsKHR::ePostMultiplied,
        vk::CompositeAlphaFlagBitsKHR::eInherit,
    };
    std::vector<vk::CompositeAlphaFlagBitsKHR> out;
    for (auto bit : order)
        if (supported & bit) out.push_back(bit);
    return out;
}

bool find_color_space(const std::vector<vk::SurfaceFormatKHR>& formats, vk::Format fmt, vk::ColorSpaceKHR& out)
{
    for (const auto& f : formats)
        if (f.format == fmt) { out = f.colorSpace; return true; }
    return false;
}

vk::UniqueRenderPass create_color_renderpass(vk::Device dev, vk::Format colorFmt)
{
    const vk::AttachmentDescription colorAtt(
        {}, colorFmt, vk::SampleCountFlagBits::e1,
        vk::AttachmentLoadOp::eClear, vk::AttachmentStoreOp::eStore,
        vk::AttachmentLoadOp::eDontCare, vk::AttachmentStoreOp::eDontCare,
        vk::ImageLayout::eUndefined, vk::ImageLayout::ePresentSrcKHR);

    vk::AttachmentReference colorRef(0, vk::ImageLayout::eColorAttachmentOptimal);

    vk::SubpassDescription subpass(
        {}, vk::PipelineBindPoint::eGraphics,
        0,nullptr,
        1,&colorRef);

    vk::SubpassDependency dep(
        VK_SUBPASS_EXTERNAL, 0,
        vk::PipelineStageFlagBits::eColorAttachmentOutput,
        vk::PipelineStageFlagBits::eColorAttachmentOutput,
        {}, vk::AccessFlagBits::eColorAttachmentWrite);

    return dev.createRenderPassUnique(vk::RenderPassCreateInfo{
        {}, 1, &colorAtt, 1, &subpass, 1, &dep
    });
}

} // namespace snowvk
