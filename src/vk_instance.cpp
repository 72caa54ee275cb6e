#include "vk_internal.hpp"
#include "vk_backend.hpp"
#include "vk_check.hpp"
#include "vk_device_select.hpp"
#include "vk_helpers.hpp"
#include "vk_validation.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

#include <set>
#include <vector>

namespace snowvk {

namespace {

class VulkanAdapter final : public IGpuAdapter {
public:
    VulkanAdapter(vk::PhysicalDevice pd, vk::SurfaceKHR surface) : pd_(pd), surface_(surface) {}

    AdapterInfo info() const override
    {
        const auto props = pd_.getProperties();
        AdapterInfo out{};
        out.name = props.deviceName.data();
        out.vendor_id = props.vendorID;
        out.device_id = props.deviceID;
        out.type = props.deviceType;
        out.api_version = props.apiVersion;
        out.driver_version = props.driverVersion;
        return out;
    }

    std::unique_ptr<IGpuDevice> request_device() override
    {
        return std::make_unique<VulkanDevice>(pd_, surface_);
    }

private:
    vk::PhysicalDevice pd_;
    vk::SurfaceKHR surface_;
};

class VulkanInstance final : public IGpuInstance {
public:
    explicit VulkanInstance(const char* app_name)
    {
        vk::ApplicationInfo appInfo(app_name, VK_MAKE_VERSION(1,0,0), "snowvk", VK_MAKE_VERSION(1,0,0), VK_API_VERSION_1_2);

        auto vcfg = make_validation_config();

        std::vector<const char*> exts;
        exts.push_back(VK_KHR_SURFACE_EXTENSION_NAME);

#if defined(_WIN32)
        exts.push_back("VK_KHR_win32_surface");
#elif defined(__ANDROID__)
        exts.push_back("VK_KHR_android_surface");
#else
        exts.push_back("VK_KHR_xcb_surface");
#endif

        for (auto e : vcfg.instance_exts) exts.push_back(e);

        vk::InstanceCreateInfo ici{};
        ici.pApplicationInfo = &appInfo;
        ici.enabledLayerCount = (uint32_t)vcfg.instance_layers.size();
        ici.ppEnabledLayerNames = vcfg.instance_layers.data();
        ici.enabledExtensionCount = (uint32_t)exts.size();
        ici.ppEnabledExtensionNames = exts.data();

        try
        {
            instance_ = vk::createInstanceUnique(ici);
        }
        catch (const vk::SystemError& e)
        {
            throw GpuError(GpuErrorCode::BackendFailure, std::string("vkCreateInstance: ") + e.what());
        }

        if (vcfg.enable)
            dbg_ = create_debug_messenger(instance_.get());
    }

    ~VulkanInstance() override
    {
        destroy_debug_messenger(instance_.get(), dbg_);
    }

    std::unique_ptr<IGpuSurface> create_surface(const NativeWindow& n) override
    {
        try
        {
#if defined(_WIN32)
            auto surface = instance_->createWin32SurfaceKHRUnique(vk::Win32SurfaceCreateInfoKHR{ {}, (HINSTANCE)n.hinstance, (HWND)n.hwnd });
#elif defined(__ANDROID__)
            if (!n.native_window)
                throw GpuError(GpuErrorCode::SurfaceCreationFailed, "Android native window is null.");
            auto surface = instance_->createAndroidSurfaceKHRUnique(
                vk::AndroidSurfaceCreateInfoKHR{ {}, (ANativeWindow*)n.native_window });
#else
            auto surface = instance_->createXcbSurfaceKHRUnique(vk::XcbSurfaceCreateInfoKHR{ {}, (xcb_connection_t*)n.xcb_connection, (xcb_window_t)n.xcb_window });
#endif
            return std::make_unique<VulkanSurface>(std::move(surface));
        }
        catch (const vk::SystemError& e)
        {
            throw GpuError(GpuErrorCode::SurfaceCreationFailed, e.what());
        }
    }

    std::unique_ptr<IGpuAdapter> request_adapter(const AdapterRequest& req) override
    {
        auto* surface = dynamic_cast<const VulkanSurface*>(req.compatible_surface);
        if (!surface)
        {
            log::error("gpu", "adapter request without a Vulkan surface");
            return nullptr;
        }

        const auto devices = instance_->enumeratePhysicalDevices();
        log::trace("gpu", devices.size(), " physical device(s)");

        const vk::PhysicalDevice pd = pick_best_device(devices, surface->handle(), req.power_preference);
        if (!pd) return nullptr;
        return std::make_unique<VulkanAdapter>(pd, surface->handle());
    }

private:
    vk::UniqueInstance instance_;
    DebugMessenger dbg_{};
};

} // namespace

std::unique_ptr<IGpuInstance> create_vulkan_instance(const char* app_name)
{
    return std::make_unique<VulkanInstance>(app_name);
}

VulkanDevice::VulkanDevice(vk::PhysicalDevice pd, vk::SurfaceKHR surface)
{
    s_.pd = pd;
    try
    {
        s_.graphicsQ = pick_graphics_qf(s_.pd);
        s_.presentQ  = pick_present_qf(s_.pd, surface);

        std::set<uint32_t> unique = { s_.graphicsQ, s_.presentQ };
        float prio = 1.0f;
        std::vector<vk::DeviceQueueCreateInfo> qcis;
        for (auto qf : unique) qcis.push_back(vk::DeviceQueueCreateInfo{ {}, qf, 1, &prio });

        std::vector<const char*> devExts = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };

        vk::DeviceCreateInfo dci{};
        dci.queueCreateInfoCount = (uint32_t)qcis.size();
        dci.pQueueCreateInfos = qcis.data();
        dci.enabledExtensionCount = (uint32_t)devExts.size();
        dci.ppEnabledExtensionNames = devExts.data();

        s_.device = s_.pd.createDeviceUnique(dci);
        s_.graphicsQueue = s_.device->getQueue(s_.graphicsQ, 0);
        s_.presentQueue  = s_.device->getQueue(s_.presentQ, 0);

        s_.cmdPool = s_.device->createCommandPoolUnique(vk::CommandPoolCreateInfo{
            vk::CommandPoolCreateFlagBits::eResetCommandBuffer | vk::CommandPoolCreateFlagBits::eTransient, s_.graphicsQ
        });
        s_.submitFence = s_.device->createFenceUnique(vk::FenceCreateInfo{});
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::DeviceRequestFailed, e.what());
    }

    log::trace("gpu", "queues: graphics=", s_.graphicsQ, " present=", s_.presentQ);
}

DeviceLimits VulkanDevice::limits() const
{
    const auto l = s_.pd.getProperties().limits;
    DeviceLimits out{};
    out.max_image_dimension_2d = l.maxImageDimension2D;
    out.max_color_attachments = l.maxColorAttachments;
    out.max_bound_descriptor_sets = l.maxBoundDescriptorSets;
    out.max_push_constants_size = l.maxPushConstantsSize;
    return out;
}

void VulkanDevice::wait_idle()
{
    try
    {
        s_.device->waitIdle();
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::BackendFailure, std::string("vkDeviceWaitIdle: ") + e.what());
    }
}

vk::RenderPass VulkanDevice::render_pass_for(vk::Format colorFmt)
{
    auto it = s_.renderPasses.find(colorFmt);
    if (it == s_.renderPasses.end())
        it = s_.renderPasses.emplace(colorFmt, create_color_renderpass(s_.device.get(), colorFmt)).first;
    return it->second.get();
}

} // namespace snowvk
