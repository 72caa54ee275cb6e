#pragma once
#include <stdexcept>
#include <string>

namespace snowvk {

// Every value is fatal where it is raised; the only local recovery in the
// renderer is the single reconfigure-and-retry in SurfaceManager::acquire_frame.
enum class GpuErrorCode {
    AdapterUnavailable,
    DeviceRequestFailed,
    ShaderCompileError,
    PipelineLinkError,
    SurfaceAcquireFailed,
    ConfigurationRejected,
    SurfaceCreationFailed,
    BackendFailure,
};

const char* to_string(GpuErrorCode code) noexcept;

class GpuError : public std::runtime_error {
public:
    GpuError(GpuErrorCode code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

    GpuErrorCode code() const noexcept { return code_; }

private:
    GpuErrorCode code_;
};

} // namespace snowvk
