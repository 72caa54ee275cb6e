#pragma once

#include <vulkan/vulkan.hpp>

#include "native_window.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Backend-neutral GPU interfaces used by the renderer core.
// Enumerations are Vulkan-Hpp's so the Vulkan backend passes them through untouched;
// the test suite implements the same interfaces with a recording backend.

namespace snowvk {

enum class PowerPreference { LowPower, HighPerformance };

struct Color {
    float r = 0.0f, g = 0.0f, b = 0.0f, a = 1.0f;
    bool operator==(const Color&) const = default;
};

struct AdapterInfo {
    std::string name;
    uint32_t vendor_id = 0;
    uint32_t device_id = 0;
    vk::PhysicalDeviceType type = vk::PhysicalDeviceType::eOther;
    uint32_t api_version = 0;
    uint32_t driver_version = 0;
};

struct DeviceLimits {
    uint32_t max_image_dimension_2d = 0;
    uint32_t max_color_attachments = 0;
    uint32_t max_bound_descriptor_sets = 0;
    uint32_t max_push_constants_size = 0;
};

// Lists are in the order the surface/adapter pair reports them.
struct SurfaceCapabilities {
    std::vector<vk::Format> formats;
    std::vector<vk::PresentModeKHR> present_modes;
    std::vector<vk::CompositeAlphaFlagBitsKHR> alpha_modes;
};

struct SurfaceConfiguration {
    vk::Format format = vk::Format::eUndefined;
    uint32_t width = 0;
    uint32_t height = 0;
    vk::PresentModeKHR present_mode = vk::PresentModeKHR::eFifo;
    vk::CompositeAlphaFlagBitsKHR alpha_mode = vk::CompositeAlphaFlagBitsKHR::eOpaque;

    bool operator==(const SurfaceConfiguration&) const = default;
};

// Blending is always "replace": the fragment color overwrites the target.
struct RenderPipelineDesc {
    std::string label;
    std::string shader_source;
    std::string vertex_entry = "vs_main";
    std::string fragment_entry = "fs_main";
    vk::Format target_format = vk::Format::eUndefined;
    vk::ColorComponentFlags write_mask =
        vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
        vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA;
    vk::PrimitiveTopology topology = vk::PrimitiveTopology::eTriangleList;
};

enum class AcquireStatus { Success, Suboptimal, Outdated, Lost, Timeout };

const char* to_string(AcquireStatus s) noexcept;

class IGpuDevice;

// One acquired presentable image. Lives for a single render call.
class IGpuFrame {
public:
    virtual ~IGpuFrame() = default;
    virtual vk::Extent2D extent() const = 0;
    virtual void present() = 0;
};

struct AcquireResult {
    AcquireStatus status = AcquireStatus::Lost;
    std::unique_ptr<IGpuFrame> frame; // set for Success and Suboptimal
};

class IRenderPipeline {
public:
    virtual ~IRenderPipeline() = default;
    virtual vk::Format target_format() const = 0;
};

class ICommandEncoder {
public:
    virtual ~ICommandEncoder() = default;
    virtual void begin_render_pass(IGpuFrame& target, const Color& clear) = 0;
    virtual void set_pipeline(const IRenderPipeline& pipeline) = 0;
    virtual void draw(uint32_t vertex_count, uint32_t instance_count,
                      uint32_t first_vertex, uint32_t first_instance) = 0;
    virtual void end_render_pass() = 0;
};

class IGpuQueue {
public:
    virtual ~IGpuQueue() = default;
    // Blocks until the recorded work has finished executing.
    virtual void submit(ICommandEncoder& encoder) = 0;
};

class IGpuDevice {
public:
    virtual ~IGpuDevice() = default;
    virtual DeviceLimits limits() const = 0;
    virtual IGpuQueue& queue() = 0;
    virtual std::unique_ptr<IRenderPipeline> create_render_pipeline(const RenderPipelineDesc& desc) = 0;
    virtual std::unique_ptr<ICommandEncoder> create_command_encoder() = 0;
    virtual void wait_idle() = 0;
};

class IGpuSurface {
public:
    virtual ~IGpuSurface() = default;
    virtual SurfaceCapabilities capabilities(const IGpuDevice& device) const = 0;
    // Throws GpuError(ConfigurationRejected) when the driver refuses the configuration.
    virtual void configure(IGpuDevice& device, const SurfaceConfiguration& config) = 0;
    virtual AcquireResult acquire_next_frame() = 0;
};

class IGpuAdapter {
public:
    virtual ~IGpuAdapter() = default;
    virtual AdapterInfo info() const = 0;
    // Throws GpuError(DeviceRequestFailed).
    virtual std::unique_ptr<IGpuDevice> request_device() = 0;
};

struct AdapterRequest {
    PowerPreference power_preference = PowerPreference::HighPerformance;
    const IGpuSurface* compatible_surface = nullptr;
};

class IGpuInstance {
public:
    virtual ~IGpuInstance() = default;
    virtual std::unique_ptr<IGpuSurface> create_surface(const NativeWindow& window) = 0;
    // Returns nullptr when no adapter satisfies the request.
    virtual std::unique_ptr<IGpuAdapter> request_adapter(const AdapterRequest& request) = 0;
};

} // namespace snowvk
