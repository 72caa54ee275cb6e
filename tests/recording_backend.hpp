#pragma once
#include "gpu.hpp"
#include "gpu_error.hpp"
#include "lifecycle_controller.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

// In-memory GPU backend for tests. Every object shares one Recorder which logs
// the calls made on it and carries the failures to inject.

namespace snowvk::recording {

struct Recorder {
    std::vector<std::string> calls;

    // Capabilities reported by every surface, first entry is the preferred one.
    SurfaceCapabilities caps{
        { vk::Format::eB8G8R8A8Srgb, vk::Format::eB8G8R8A8Unorm },
        { vk::PresentModeKHR::eFifo, vk::PresentModeKHR::eMailbox },
        { vk::CompositeAlphaFlagBitsKHR::eOpaque, vk::CompositeAlphaFlagBitsKHR::ePreMultiplied },
    };

    bool no_surface = false;
    bool no_adapter = false;
    bool refuse_device = false;
    bool shader_error = false;
    bool link_error = false;
    bool reject_configuration = false;

    // Statuses returned by successive acquires; Success once exhausted.
    std::deque<AcquireStatus> acquire_script;

    int instances_created = 0;
    PowerPreference requested_power = PowerPreference::LowPower;
    bool adapter_request_had_surface = false;
    std::vector<SurfaceConfiguration> configures;
    std::vector<RenderPipelineDesc> pipelines;
    std::vector<Color> clears;

    int count(const std::string& call) const
    {
        int n = 0;
        for (const auto& c : calls) n += (c == call) ? 1 : 0;
        return n;
    }
};

class RecordingFrame final : public IGpuFrame {
public:
    explicit RecordingFrame(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}
    vk::Extent2D extent() const override { return { 800, 600 }; }
    void present() override { rec_->calls.push_back("present"); }

private:
    std::shared_ptr<Recorder> rec_;
};

class RecordingPipeline final : public IRenderPipeline {
public:
    explicit RecordingPipeline(vk::Format fmt) : fmt_(fmt) {}
    vk::Format target_format() const override { return fmt_; }

private:
    vk::Format fmt_;
};

class RecordingEncoder final : public ICommandEncoder {
public:
    explicit RecordingEncoder(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}

    void begin_render_pass(IGpuFrame&, const Color& clear) override
    {
        rec_->clears.push_back(clear);
        rec_->calls.push_back("begin_pass");
    }
    void set_pipeline(const IRenderPipeline&) override { rec_->calls.push_back("set_pipeline"); }
    void draw(uint32_t vc, uint32_t ic, uint32_t fv, uint32_t fi) override
    {
        rec_->calls.push_back("draw " + std::to_string(vc) + " " + std::to_string(ic) + " " +
                              std::to_string(fv) + " " + std::to_string(fi));
    }
    void end_render_pass() override { rec_->calls.push_back("end_pass"); }

private:
    std::shared_ptr<Recorder> rec_;
};

class RecordingQueue final : public IGpuQueue {
public:
    explicit RecordingQueue(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}
    void submit(ICommandEncoder&) override { rec_->calls.push_back("submit"); }

private:
    std::shared_ptr<Recorder> rec_;
};

class RecordingDevice final : public IGpuDevice {
public:
    explicit RecordingDevice(std::shared_ptr<Recorder> rec) : rec_(rec), queue_(rec) {}
    ~RecordingDevice() override { rec_->calls.push_back("~device"); }

    DeviceLimits limits() const override { return DeviceLimits{ 16384, 8, 32, 256 }; }
    IGpuQueue& queue() override { return queue_; }

    std::unique_ptr<IRenderPipeline> create_render_pipeline(const RenderPipelineDesc& desc) override
    {
        rec_->calls.push_back("create_pipeline");
        if (rec_->shader_error)
            throw GpuError(GpuErrorCode::ShaderCompileError, "injected shader error");
        if (rec_->link_error)
            throw GpuError(GpuErrorCode::PipelineLinkError, "injected link error");
        rec_->pipelines.push_back(desc);
        return std::make_unique<RecordingPipeline>(desc.target_format);
    }

    std::unique_ptr<ICommandEncoder> create_command_encoder() override
    {
        rec_->calls.push_back("create_encoder");
        return std::make_unique<RecordingEncoder>(rec_);
    }

    void wait_idle() override { rec_->calls.push_back("wait_idle"); }

private:
    std::shared_ptr<Recorder> rec_;
    RecordingQueue queue_;
};

class RecordingSurface final : public IGpuSurface {
public:
    explicit RecordingSurface(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}
    ~RecordingSurface() override { rec_->calls.push_back("~surface"); }

    SurfaceCapabilities capabilities(const IGpuDevice&) const override { return rec_->caps; }

    void configure(IGpuDevice&, const SurfaceConfiguration& config) override
    {
        rec_->calls.push_back("configure " + std::to_string(config.width) + "x" + std::to_string(config.height));
        if (rec_->reject_configuration)
            throw GpuError(GpuErrorCode::ConfigurationRejected, "injected rejection");
        rec_->configures.push_back(config);
    }

    AcquireResult acquire_next_frame() override
    {
        rec_->calls.push_back("acquire");
        AcquireStatus status = AcquireStatus::Success;
        if (!rec_->acquire_script.empty())
        {
            status = rec_->acquire_script.front();
            rec_->acquire_script.pop_front();
        }
        AcquireResult r{};
        r.status = status;
        if (status == AcquireStatus::Success || status == AcquireStatus::Suboptimal)
            r.frame = std::make_unique<RecordingFrame>(rec_);
        return r;
    }

private:
    std::shared_ptr<Recorder> rec_;
};

class RecordingAdapter final : public IGpuAdapter {
public:
    explicit RecordingAdapter(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}

    AdapterInfo info() const override
    {
        AdapterInfo i{};
        i.name = "Recording Adapter";
        i.vendor_id = 0x1234;
        i.device_id = 0x5678;
        i.type = vk::PhysicalDeviceType::eDiscreteGpu;
        i.api_version = VK_MAKE_API_VERSION(0, 1, 3, 0);
        return i;
    }

    std::unique_ptr<IGpuDevice> request_device() override
    {
        rec_->calls.push_back("request_device");
        if (rec_->refuse_device)
            throw GpuError(GpuErrorCode::DeviceRequestFailed, "injected device refusal");
        return std::make_unique<RecordingDevice>(rec_);
    }

private:
    std::shared_ptr<Recorder> rec_;
};

class RecordingInstance final : public IGpuInstance {
public:
    explicit RecordingInstance(std::shared_ptr<Recorder> rec) : rec_(std::move(rec)) {}

    std::unique_ptr<IGpuSurface> create_surface(const NativeWindow&) override
    {
        rec_->calls.push_back("create_surface");
        if (rec_->no_surface) return nullptr;
        return std::make_unique<RecordingSurface>(rec_);
    }

    std::unique_ptr<IGpuAdapter> request_adapter(const AdapterRequest& request) override
    {
        rec_->calls.push_back("request_adapter");
        rec_->requested_power = request.power_preference;
        rec_->adapter_request_had_surface = request.compatible_surface != nullptr;
        if (rec_->no_adapter) return nullptr;
        return std::make_unique<RecordingAdapter>(rec_);
    }

private:
    std::shared_ptr<Recorder> rec_;
};

inline LifecycleController::InstanceFactory recording_factory(std::shared_ptr<Recorder> rec)
{
    return [rec]() -> std::unique_ptr<IGpuInstance> {
        ++rec->instances_created;
        return std::make_unique<RecordingInstance>(rec);
    };
}

} // namespace snowvk::recording
