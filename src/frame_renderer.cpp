#include "frame_renderer.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

#include <iomanip>
#include <sstream>

namespace snowvk {

std::string triangle_shader_source(const Color& color)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    os << R"hlsl(
static const float2 kPositions[3] = {
    float2( 0.0,  0.5),
    float2(-0.5, -0.5),
    float2( 0.5, -0.5)
};

float4 vs_main(uint vertex_index : SV_VertexID) : SV_Position
{
    float2 pos = kPositions[vertex_index];
    // Vulkan clip space points +Y down.
    return float4(pos.x, -pos.y, 0.0, 1.0);
}

float4 fs_main() : SV_Target0
{
    return float4()hlsl"
       << color.r << ", " << color.g << ", " << color.b << ", " << color.a
       << R"hlsl();
}
)hlsl";
    return os.str();
}

std::unique_ptr<IRenderPipeline> FrameRenderer::build_pipeline(IGpuDevice& device, vk::Format target_format,
                                                               const Color& triangle_color)
{
    RenderPipelineDesc desc{};
    desc.label = "triangle";
    desc.shader_source = triangle_shader_source(triangle_color);
    desc.target_format = target_format;

    auto pipeline = device.create_render_pipeline(desc);
    if (!pipeline)
        throw GpuError(GpuErrorCode::PipelineLinkError, "device returned no pipeline");

    log::info("render", "Pipeline '", desc.label, "' built for ", vk::to_string(target_format));
    return pipeline;
}

FrameRenderer::FrameRenderer(std::unique_ptr<IRenderPipeline> pipeline, const Color& clear_color)
    : pipeline_(std::move(pipeline)), clear_(clear_color)
{
}

void FrameRenderer::render(IGpuFrame& frame, IGpuDevice& device, IGpuQueue& queue) const
{
    auto encoder = device.create_command_encoder();
    encoder->begin_render_pass(frame, clear_);
    encoder->set_pipeline(*pipeline_);
    encoder->draw(kVertexCount, kInstanceCount, 0, 0);
    encoder->end_render_pass();

    queue.submit(*encoder);
    frame.present();
}

} // namespace snowvk
