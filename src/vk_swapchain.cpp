#include "vk_internal.hpp"
#include "vk_check.hpp"
#include "vk_helpers.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace snowvk {

VulkanSurface::~VulkanSurface()
{
    if (!device_ || !sc_.swapchain) return;
    try
    {
        device_->state().device->waitIdle();
    }
    catch (const vk::SystemError& e)
    {
        log::error("surface", "waitIdle before swapchain destruction failed: ", e.what());
    }
}

SurfaceCapabilities VulkanSurface::capabilities(const IGpuDevice& device) const
{
    const auto& ds = static_cast<const VulkanDevice&>(device).state();
    SurfaceCapabilities out{};
    try
    {
        out.formats = list_surface_formats(ds.pd, surface_.get());
        out.present_modes = list_present_modes(ds.pd, surface_.get());
        out.alpha_modes = list_alpha_modes(ds.pd.getSurfaceCapabilitiesKHR(surface_.get()).supportedCompositeAlpha);
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::ConfigurationRejected, std::string("surface capability query: ") + e.what());
    }
    return out;
}

void VulkanSurface::configure(IGpuDevice& device, const SurfaceConfiguration& config)
{
    device_ = &static_cast<VulkanDevice&>(device);
    auto& ds = device_->state();

    try
    {
        ds.device->waitIdle();

        const auto caps = ds.pd.getSurfaceCapabilitiesKHR(surface_.get());
        const auto formats = ds.pd.getSurfaceFormatsKHR(surface_.get());

        vk::ColorSpaceKHR colorSpace{};
        if (!find_color_space(formats, config.format, colorSpace))
            throw GpuError(GpuErrorCode::ConfigurationRejected, "format " + vk::to_string(config.format) + " not offered by surface");
        if (!(caps.supportedCompositeAlpha & config.alpha_mode))
            throw GpuError(GpuErrorCode::ConfigurationRejected, "alpha mode " + vk::to_string(config.alpha_mode) + " not supported");

        // Some platforms dictate the extent; otherwise clamp the requested size.
        vk::Extent2D extent{};
        if (caps.currentExtent.width != std::numeric_limits<uint32_t>::max())
            extent = caps.currentExtent;
        else
            extent = vk::Extent2D{
                std::clamp(config.width, caps.minImageExtent.width, caps.maxImageExtent.width),
                std::clamp(config.height, caps.minImageExtent.height, caps.maxImageExtent.height)
            };
        if (extent.width == 0 || extent.height == 0)
            throw GpuError(GpuErrorCode::ConfigurationRejected, "surface currently has a zero extent");

        uint32_t minCount = std::max(2u, caps.minImageCount);
        uint32_t maxCount = (caps.maxImageCount == 0) ? minCount : caps.maxImageCount;
        uint32_t imageCount = std::min(minCount, maxCount);

        std::array<uint32_t,2> families = { ds.graphicsQ, ds.presentQ };
        const bool concurrent = ds.graphicsQ != ds.presentQ;

        vk::SwapchainCreateInfoKHR sci(
            {}, surface_.get(), imageCount,
            config.format, colorSpace,
            extent,
            1, vk::ImageUsageFlagBits::eColorAttachment,
            concurrent ? vk::SharingMode::eConcurrent : vk::SharingMode::eExclusive,
            concurrent ? (uint32_t)families.size() : 0u,
            concurrent ? families.data() : nullptr,
            caps.currentTransform,
            config.alpha_mode,
            config.present_mode,
            true,
            sc_.swapchain ? sc_.swapchain.get() : vk::SwapchainKHR{}
        );

        auto next = ds.device->createSwapchainKHRUnique(sci);

        // Views and per-image semaphores belong to the retired swapchain.
        sc_.views.clear();
        sync_.renderFinished.clear();
        sc_.swapchain = std::move(next);
        sc_.surfFmt = vk::SurfaceFormatKHR{ config.format, colorSpace };
        sc_.presentMode = config.present_mode;
        sc_.extent = extent;
        sc_.images = ds.device->getSwapchainImagesKHR(sc_.swapchain.get());

        sc_.views.reserve(sc_.images.size());
        for (auto img : sc_.images)
        {
            sc_.views.push_back(ds.device->createImageViewUnique(vk::ImageViewCreateInfo{
                {}, img, vk::ImageViewType::e2D, config.format,
                {}, vk::ImageSubresourceRange{ vk::ImageAspectFlagBits::eColor, 0,1,0,1 }
            }));
        }

        if (!sync_.imageAvailable)
            sync_.imageAvailable = ds.device->createSemaphoreUnique(vk::SemaphoreCreateInfo{});
        sync_.renderFinished.reserve(sc_.images.size());
        for (size_t i = 0; i < sc_.images.size(); ++i)
            sync_.renderFinished.push_back(ds.device->createSemaphoreUnique(vk::SemaphoreCreateInfo{}));
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::ConfigurationRejected, std::string("swapchain: ") + e.what());
    }

    log::trace("surface", "swapchain ", sc_.extent.width, "x", sc_.extent.height, " with ", sc_.images.size(), " images");
}

AcquireResult VulkanSurface::acquire_next_frame()
{
    if (!device_ || !sc_.swapchain)
        return AcquireResult{ AcquireStatus::Outdated, nullptr };

    auto& ds = device_->state();
    vk::Result result = vk::Result::eSuccess;
    uint32_t imageIndex = 0;

    // Must tolerate resize / minimize.
    try
    {
        vk::ResultValue<uint32_t> acquire = ds.device->acquireNextImageKHR(
            sc_.swapchain.get(),
            std::numeric_limits<uint64_t>::max(),
            sync_.imageAvailable.get(),
            nullptr
        );
        result = acquire.result;
        imageIndex = acquire.value;
    }
#ifndef VULKAN_HPP_NO_EXCEPTIONS
    // Exceptions enabled: out-of-date and lost surfaces arrive as typed errors.
    catch (const vk::OutOfDateKHRError&)
    {
        return AcquireResult{ AcquireStatus::Outdated, nullptr };
    }
    catch (const vk::SurfaceLostKHRError&)
    {
        return AcquireResult{ AcquireStatus::Lost, nullptr };
    }
#endif
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::BackendFailure, std::string("vkAcquireNextImageKHR: ") + e.what());
    }

    switch (result)
    {
    case vk::Result::eSuccess:
        return AcquireResult{ AcquireStatus::Success, std::make_unique<VulkanFrame>(*this, imageIndex) };
    case vk::Result::eSuboptimalKHR:
        return AcquireResult{ AcquireStatus::Suboptimal, std::make_unique<VulkanFrame>(*this, imageIndex) };
    case vk::Result::eTimeout:
    case vk::Result::eNotReady:
        return AcquireResult{ AcquireStatus::Timeout, nullptr };
    case vk::Result::eErrorOutOfDateKHR:
        return AcquireResult{ AcquireStatus::Outdated, nullptr };
    case vk::Result::eErrorSurfaceLostKHR:
        return AcquireResult{ AcquireStatus::Lost, nullptr };
    default:
        vk_check(result, "vkAcquireNextImageKHR");
        return AcquireResult{ AcquireStatus::Lost, nullptr };
    }
}

void VulkanSurface::present(uint32_t imageIndex)
{
    auto& ds = device_->state();
    vk::Semaphore rf = sync_.renderFinished[imageIndex].get();
    vk::SwapchainKHR sc = sc_.swapchain.get();
    vk::PresentInfoKHR info{ 1, &rf, 1, &sc, &imageIndex };

    vk::Result pres = vk::Result::eSuccess;
    try
    {
        pres = ds.presentQueue.presentKHR(info);
    }
#ifndef VULKAN_HPP_NO_EXCEPTIONS
    catch (const vk::OutOfDateKHRError&)
    {
        pres = vk::Result::eErrorOutOfDateKHR;
    }
#endif
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::BackendFailure, std::string("vkQueuePresentKHR: ") + e.what());
    }

    // The next acquire reports the stale swapchain and SurfaceManager reconfigures it.
    if (pres == vk::Result::eErrorOutOfDateKHR || pres == vk::Result::eSuboptimalKHR)
        log::trace("surface", "present returned ", vk::to_string(pres));
    else
        vk_check(pres, "vkQueuePresentKHR");
}

vk::Extent2D VulkanFrame::extent() const { return owner_->swapchain().extent; }
vk::ImageView VulkanFrame::view() const { return owner_->swapchain().views[imageIndex_].get(); }
vk::Format VulkanFrame::format() const { return owner_->swapchain().surfFmt.format; }
vk::Semaphore VulkanFrame::image_available() const { return owner_->sync().imageAvailable.get(); }
vk::Semaphore VulkanFrame::render_finished() const { return owner_->sync().renderFinished[imageIndex_].get(); }

void VulkanFrame::present()
{
    owner_->present(imageIndex_);
}

} // namespace snowvk
