#include "graphics_context.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

namespace snowvk {

static const char* power_name(PowerPreference p)
{
    return p == PowerPreference::HighPerformance ? "high-performance" : "low-power";
}

GraphicsContext GraphicsContext::initialize(std::unique_ptr<IGpuInstance> instance,
                                            const NativeWindow& window,
                                            PowerPreference preference)
{
    if (!instance)
        throw GpuError(GpuErrorCode::BackendFailure, "no GPU instance");

    GraphicsContext ctx;
    ctx.instance_ = std::move(instance);
    ctx.surface_ = ctx.instance_->create_surface(window);
    if (!ctx.surface_)
        throw GpuError(GpuErrorCode::SurfaceCreationFailed, "instance returned no surface");

    AdapterRequest req{};
    req.power_preference = preference;
    req.compatible_surface = ctx.surface_.get();

    ctx.adapter_ = ctx.instance_->request_adapter(req);
    if (!ctx.adapter_)
        throw GpuError(GpuErrorCode::AdapterUnavailable,
                       std::string("no ") + power_name(preference) + " adapter can present to the window surface");

    ctx.adapter_info_ = ctx.adapter_->info();
    log::info("gpu", "Adapter: ", ctx.adapter_info_.name,
              " (vendor 0x", std::hex, ctx.adapter_info_.vendor_id,
              ", device 0x", ctx.adapter_info_.device_id, std::dec,
              ", ", vk::to_string(ctx.adapter_info_.type),
              ", api ", VK_API_VERSION_MAJOR(ctx.adapter_info_.api_version),
              ".", VK_API_VERSION_MINOR(ctx.adapter_info_.api_version),
              ".", VK_API_VERSION_PATCH(ctx.adapter_info_.api_version), ")");

    ctx.device_ = ctx.adapter_->request_device();
    if (!ctx.device_)
        throw GpuError(GpuErrorCode::DeviceRequestFailed, "adapter returned no device");

    ctx.device_limits_ = ctx.device_->limits();
    log::info("gpu", "Device limits: maxImageDimension2D=", ctx.device_limits_.max_image_dimension_2d,
              " maxColorAttachments=", ctx.device_limits_.max_color_attachments,
              " maxBoundDescriptorSets=", ctx.device_limits_.max_bound_descriptor_sets,
              " maxPushConstantsSize=", ctx.device_limits_.max_push_constants_size);

    return ctx;
}

GraphicsContext::~GraphicsContext()
{
    // Moved-from contexts own nothing.
    if (!device_) return;
    try
    {
        device_->wait_idle();
    }
    catch (const std::exception& e)
    {
        log::error("gpu", "wait_idle during teardown failed: ", e.what());
    }
}

} // namespace snowvk
