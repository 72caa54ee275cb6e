#pragma once
#include "gpu.hpp"
#include "native_window.hpp"
#include <memory>

namespace snowvk {

// Keeps the surface configuration in step with the window size and hands out frames.
// The surface and device are borrowed from the GraphicsContext that outlives this object.
class SurfaceManager {
public:
    // Takes the first format, present mode and alpha mode the surface reports,
    // applies them at `size` and returns the configured manager.
    // Throws GpuError(ConfigurationRejected) for a zero size, an empty capability
    // list or a refusal from the driver.
    static SurfaceManager configure(IGpuSurface& surface, IGpuDevice& device, FramebufferSize size);

    // Stores the new size and reapplies the configuration. Zero sizes are ignored.
    void resize(FramebufferSize size);

    // Acquires the next image. A failed acquire is followed by exactly one
    // reconfiguration with the last known configuration and a second attempt;
    // if that fails too, GpuError(SurfaceAcquireFailed) is thrown.
    std::unique_ptr<IGpuFrame> acquire_frame();

    const SurfaceConfiguration& configuration() const { return config_; }

private:
    SurfaceManager(IGpuSurface& surface, IGpuDevice& device, const SurfaceConfiguration& config)
        : surface_(&surface), device_(&device), config_(config) {}

    void apply();

    IGpuSurface* surface_;
    IGpuDevice* device_;
    SurfaceConfiguration config_;
};

} // namespace snowvk
