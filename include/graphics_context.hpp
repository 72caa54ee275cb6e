#pragma once
#include "gpu.hpp"
#include <memory>

namespace snowvk {

// Instance, surface, adapter, device and queue for one window.
// Members are declared so the surface (and the swapchain it owns) is released
// before the device, and the device before the instance.
class GraphicsContext {
public:
    // Creates the surface for `window`, picks an adapter compatible with it and
    // requests a device with default features and limits.
    // Blocks until the driver has answered; called once per active session.
    // Throws GpuError(AdapterUnavailable | DeviceRequestFailed | SurfaceCreationFailed).
    static GraphicsContext initialize(std::unique_ptr<IGpuInstance> instance,
                                      const NativeWindow& window,
                                      PowerPreference preference);

    GraphicsContext(GraphicsContext&&) noexcept = default;
    GraphicsContext& operator=(GraphicsContext&&) = delete;
    GraphicsContext(const GraphicsContext&) = delete;
    GraphicsContext& operator=(const GraphicsContext&) = delete;
    ~GraphicsContext();

    IGpuSurface& surface() { return *surface_; }
    IGpuDevice& device() { return *device_; }
    IGpuQueue& queue() { return device_->queue(); }
    const AdapterInfo& adapter_info() const { return adapter_info_; }
    const DeviceLimits& device_limits() const { return device_limits_; }

private:
    GraphicsContext() = default;

    std::unique_ptr<IGpuInstance> instance_;
    std::unique_ptr<IGpuAdapter> adapter_;
    std::unique_ptr<IGpuDevice> device_;
    std::unique_ptr<IGpuSurface> surface_;
    AdapterInfo adapter_info_{};
    DeviceLimits device_limits_{};
};

} // namespace snowvk
