#include "surface_manager.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

namespace snowvk {

static bool has_frame(const AcquireResult& r)
{
    return (r.status == AcquireStatus::Success || r.status == AcquireStatus::Suboptimal) && r.frame;
}

SurfaceManager SurfaceManager::configure(IGpuSurface& surface, IGpuDevice& device, FramebufferSize size)
{
    if (size.w == 0 || size.h == 0)
        throw GpuError(GpuErrorCode::ConfigurationRejected,
                       "surface size " + std::to_string(size.w) + "x" + std::to_string(size.h) + " has a zero dimension");

    const SurfaceCapabilities caps = surface.capabilities(device);
    if (caps.formats.empty() || caps.present_modes.empty() || caps.alpha_modes.empty())
        throw GpuError(GpuErrorCode::ConfigurationRejected, "surface reports no usable format, present mode or alpha mode");

    SurfaceConfiguration config{};
    config.format = caps.formats[0];
    config.present_mode = caps.present_modes[0];
    config.alpha_mode = caps.alpha_modes[0];
    config.width = size.w;
    config.height = size.h;

    SurfaceManager mgr(surface, device, config);
    mgr.apply();

    log::info("surface", "Configured ", config.width, "x", config.height,
              " format=", vk::to_string(config.format),
              " present=", vk::to_string(config.present_mode),
              " alpha=", vk::to_string(config.alpha_mode));
    return mgr;
}

void SurfaceManager::resize(FramebufferSize size)
{
    if (size.w == 0 || size.h == 0)
    {
        log::trace("surface", "ignoring resize to ", size.w, "x", size.h);
        return;
    }
    config_.width = size.w;
    config_.height = size.h;
    apply();
    log::trace("surface", "resized to ", size.w, "x", size.h);
}

std::unique_ptr<IGpuFrame> SurfaceManager::acquire_frame()
{
    AcquireResult first = surface_->acquire_next_frame();
    if (has_frame(first))
        return std::move(first.frame);

    log::warn("surface", "acquire failed (", to_string(first.status), "); reconfiguring ",
              config_.width, "x", config_.height, " and retrying once");
    apply();

    AcquireResult second = surface_->acquire_next_frame();
    if (has_frame(second))
        return std::move(second.frame);

    throw GpuError(GpuErrorCode::SurfaceAcquireFailed,
                   std::string("acquire failed after reconfiguration (") + to_string(second.status) + ")");
}

void SurfaceManager::apply()
{
    surface_->configure(*device_, config_);
}

} // namespace snowvk
