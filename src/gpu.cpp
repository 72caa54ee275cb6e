#include "gpu.hpp"
#include "gpu_error.hpp"
#include "events.hpp"

namespace snowvk {

const char* to_string(AcquireStatus s) noexcept
{
    switch (s)
    {
    case AcquireStatus::Success: return "success";
    case AcquireStatus::Suboptimal: return "suboptimal";
    case AcquireStatus::Outdated: return "outdated";
    case AcquireStatus::Lost: return "lost";
    case AcquireStatus::Timeout: return "timeout";
    }
    return "?";
}

const char* to_string(GpuErrorCode code) noexcept
{
    switch (code)
    {
    case GpuErrorCode::AdapterUnavailable: return "AdapterUnavailable";
    case GpuErrorCode::DeviceRequestFailed: return "DeviceRequestFailed";
    case GpuErrorCode::ShaderCompileError: return "ShaderCompileError";
    case GpuErrorCode::PipelineLinkError: return "PipelineLinkError";
    case GpuErrorCode::SurfaceAcquireFailed: return "SurfaceAcquireFailed";
    case GpuErrorCode::ConfigurationRejected: return "ConfigurationRejected";
    case GpuErrorCode::SurfaceCreationFailed: return "SurfaceCreationFailed";
    case GpuErrorCode::BackendFailure: return "BackendFailure";
    }
    return "?";
}

namespace {
struct EventNamer {
    const char* operator()(const event::Resumed&) const { return "Resumed"; }
    const char* operator()(const event::Suspended&) const { return "Suspended"; }
    const char* operator()(const event::CloseRequested&) const { return "CloseRequested"; }
    const char* operator()(const event::Resized&) const { return "Resized"; }
    const char* operator()(const event::RedrawRequested&) const { return "RedrawRequested"; }
    const char* operator()(const event::Idle&) const { return "Idle"; }
    const char* operator()(const event::KeyInput&) const { return "KeyInput"; }
    const char* operator()(const event::MemoryWarning&) const { return "MemoryWarning"; }
};
}

const char* event_name(const Event& ev) { return std::visit(EventNamer{}, ev); }

} // namespace snowvk
