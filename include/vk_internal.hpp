#pragma once
#include "vk_state.hpp"
#include "gpu.hpp"

#include <memory>

// Vulkan implementations of the GPU interfaces, shared between the vk_*.cpp units.
// The core only ever sees them through gpu.hpp.

namespace snowvk {

class VulkanDevice;

class VulkanQueue final : public IGpuQueue {
public:
    explicit VulkanQueue(DeviceState& s) : s_(s) {}
    void submit(ICommandEncoder& encoder) override;

private:
    DeviceState& s_;
};

class VulkanDevice final : public IGpuDevice {
public:
    // Throws GpuError(DeviceRequestFailed).
    VulkanDevice(vk::PhysicalDevice pd, vk::SurfaceKHR surface);

    DeviceLimits limits() const override;
    IGpuQueue& queue() override { return queue_; }
    std::unique_ptr<IRenderPipeline> create_render_pipeline(const RenderPipelineDesc& desc) override;
    std::unique_ptr<ICommandEncoder> create_command_encoder() override;
    void wait_idle() override;

    DeviceState& state() { return s_; }
    const DeviceState& state() const { return s_; }

    vk::RenderPass render_pass_for(vk::Format colorFmt);

private:
    DeviceState s_;
    VulkanQueue queue_{ s_ };
};

class VulkanSurface;

class VulkanFrame final : public IGpuFrame {
public:
    VulkanFrame(VulkanSurface& owner, uint32_t imageIndex) : owner_(&owner), imageIndex_(imageIndex) {}

    vk::Extent2D extent() const override;
    void present() override;

    uint32_t image_index() const { return imageIndex_; }
    vk::ImageView view() const;
    vk::Format format() const;
    vk::Semaphore image_available() const;
    vk::Semaphore render_finished() const;

private:
    VulkanSurface* owner_;
    uint32_t imageIndex_;
};

class VulkanSurface final : public IGpuSurface {
public:
    explicit VulkanSurface(vk::UniqueSurfaceKHR surface) : surface_(std::move(surface)) {}
    ~VulkanSurface() override;

    SurfaceCapabilities capabilities(const IGpuDevice& device) const override;
    void configure(IGpuDevice& device, const SurfaceConfiguration& config) override;
    AcquireResult acquire_next_frame() override;

    vk::SurfaceKHR handle() const { return surface_.get(); }
    const SwapchainState& swapchain() const { return sc_; }
    const SyncState& sync() const { return sync_; }

    // Out-of-date and suboptimal results are left for the next acquire to report.
    void present(uint32_t imageIndex);

private:
    vk::UniqueSurfaceKHR surface_;
    VulkanDevice* device_ = nullptr;
    SwapchainState sc_;
    SyncState sync_;
};

class VulkanPipeline final : public IRenderPipeline {
public:
    VulkanPipeline(vk::UniquePipelineLayout layout, vk::UniquePipeline pipeline, vk::Format fmt)
        : layout_(std::move(layout)), pipeline_(std::move(pipeline)), format_(fmt) {}

    vk::Format target_format() const override { return format_; }
    vk::Pipeline handle() const { return pipeline_.get(); }

private:
    vk::UniquePipelineLayout layout_;
    vk::UniquePipeline pipeline_;
    vk::Format format_;
};

class VulkanCommandEncoder final : public ICommandEncoder {
public:
    explicit VulkanCommandEncoder(VulkanDevice& dev);

    void begin_render_pass(IGpuFrame& target, const Color& clear) override;
    void set_pipeline(const IRenderPipeline& pipeline) override;
    void draw(uint32_t vertex_count, uint32_t instance_count,
              uint32_t first_vertex, uint32_t first_instance) override;
    void end_render_pass() override;

    vk::CommandBuffer command_buffer() const { return cb_.get(); }
    // Frame the pass renders into, or null if no pass was recorded.
    const VulkanFrame* target() const { return target_; }

private:
    VulkanDevice& dev_;
    vk::UniqueCommandBuffer cb_;
    vk::UniqueFramebuffer framebuffer_;
    const VulkanFrame* target_ = nullptr;
};

} // namespace snowvk
