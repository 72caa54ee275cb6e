#pragma once
#include "gpu.hpp"
#include <memory>
#include <string>

namespace snowvk {

// HLSL text with entry points vs_main and fs_main: three hard-coded clip-space
// vertices, no vertex buffers, one constant fragment color.
std::string triangle_shader_source(const Color& color);

// Draws the triangle into one frame per call. Holds the pipeline and nothing per-frame.
class FrameRenderer {
public:
    static constexpr uint32_t kVertexCount = 3;
    static constexpr uint32_t kInstanceCount = 1;

    // Compiles the triangle shader and links it with "replace" blending and a full
    // write mask for `target_format`.
    // Throws GpuError(ShaderCompileError | PipelineLinkError).
    static std::unique_ptr<IRenderPipeline> build_pipeline(IGpuDevice& device, vk::Format target_format,
                                                           const Color& triangle_color);

    FrameRenderer(std::unique_ptr<IRenderPipeline> pipeline, const Color& clear_color);

    // Clear, one draw of 3 vertices, submit (waits for completion), present.
    void render(IGpuFrame& frame, IGpuDevice& device, IGpuQueue& queue) const;

    const IRenderPipeline& pipeline() const { return *pipeline_; }
    const Color& clear_color() const { return clear_; }

private:
    std::unique_ptr<IRenderPipeline> pipeline_;
    Color clear_;
};

} // namespace snowvk
