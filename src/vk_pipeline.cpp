#include "vk_internal.hpp"
#include "vk_check.hpp"
#include "gpu_error.hpp"
#include "log.hpp"

#include <shaderc/shaderc.hpp>
#include <array>
#include <limits>
#include <string>
#include <vector>

namespace snowvk {

static std::vector<uint32_t> compile_hlsl_to_spv(const std::string& src, shaderc_shader_kind kind,
                                                 const char* name, const std::string& entry)
{
    shaderc::Compiler compiler;
    shaderc::CompileOptions opts;
    opts.SetSourceLanguage(shaderc_source_language_hlsl);
    opts.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_2);
    opts.SetOptimizationLevel(shaderc_optimization_level_performance);
    auto result = compiler.CompileGlslToSpv(src, kind, name, entry.c_str(), opts);
    if (result.GetCompilationStatus() != shaderc_compilation_status_success)
        throw GpuError(GpuErrorCode::ShaderCompileError, std::string(name) + ": " + result.GetErrorMessage());
    return { result.cbegin(), result.cend() };
}

std::unique_ptr<IRenderPipeline> VulkanDevice::create_render_pipeline(const RenderPipelineDesc& desc)
{
    const std::string vsName = desc.label + ".vert";
    const std::string fsName = desc.label + ".frag";
    auto vertSpv = compile_hlsl_to_spv(desc.shader_source, shaderc_vertex_shader, vsName.c_str(), desc.vertex_entry);
    auto fragSpv = compile_hlsl_to_spv(desc.shader_source, shaderc_fragment_shader, fsName.c_str(), desc.fragment_entry);

    try
    {
        auto& dev = s_.device;
        auto vert = dev->createShaderModuleUnique(vk::ShaderModuleCreateInfo{ {}, vertSpv.size()*4, vertSpv.data() });
        auto frag = dev->createShaderModuleUnique(vk::ShaderModuleCreateInfo{ {}, fragSpv.size()*4, fragSpv.data() });

        vk::PipelineShaderStageCreateInfo stages[2] = {
            vk::PipelineShaderStageCreateInfo{ {}, vk::ShaderStageFlagBits::eVertex, vert.get(), desc.vertex_entry.c_str() },
            vk::PipelineShaderStageCreateInfo{ {}, vk::ShaderStageFlagBits::eFragment, frag.get(), desc.fragment_entry.c_str() }
        };

        // Positions come from the vertex index; no vertex buffers.
        vk::PipelineVertexInputStateCreateInfo vi{ {}, 0, nullptr, 0, nullptr };
        vk::PipelineInputAssemblyStateCreateInfo ia{ {}, desc.topology, false };

        // Viewport and scissor follow the frame extent, so the pipeline survives resizes.
        vk::PipelineViewportStateCreateInfo vpState{ {}, 1, nullptr, 1, nullptr };
        std::array<vk::DynamicState,2> dyn = { vk::DynamicState::eViewport, vk::DynamicState::eScissor };
        vk::PipelineDynamicStateCreateInfo dynState{ {}, (uint32_t)dyn.size(), dyn.data() };

        vk::PipelineRasterizationStateCreateInfo rs{
            {}, false, false,
            vk::PolygonMode::eFill,
            vk::CullModeFlagBits::eNone,
            vk::FrontFace::eCounterClockwise,
            false,0,0,0, 1.0f
        };

        vk::PipelineMultisampleStateCreateInfo ms{ {}, vk::SampleCountFlagBits::e1, false };

        vk::PipelineColorBlendAttachmentState ba{};
        ba.blendEnable = false;
        ba.colorWriteMask = desc.write_mask;
        vk::PipelineColorBlendStateCreateInfo cb{ {}, false, vk::LogicOp::eCopy, 1, &ba };

        auto layout = dev->createPipelineLayoutUnique(vk::PipelineLayoutCreateInfo{ {}, 0, nullptr, 0, nullptr });

        vk::GraphicsPipelineCreateInfo gpi{
            {}, 2, stages,
            &vi, &ia,
            nullptr,
            &vpState,
            &rs, &ms, nullptr, &cb,
            &dynState,
            layout.get(),
            render_pass_for(desc.target_format),
            0
        };

        auto pipeline = vk_check_value(dev->createGraphicsPipelineUnique({}, gpi),
                                       "vkCreateGraphicsPipelines", GpuErrorCode::PipelineLinkError);

        return std::make_unique<VulkanPipeline>(std::move(layout), std::move(pipeline), desc.target_format);
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::PipelineLinkError, desc.label + ": " + e.what());
    }
}

std::unique_ptr<ICommandEncoder> VulkanDevice::create_command_encoder()
{
    return std::make_unique<VulkanCommandEncoder>(*this);
}

VulkanCommandEncoder::VulkanCommandEncoder(VulkanDevice& dev)
    : dev_(dev)
{
    auto& ds = dev_.state();
    auto bufs = ds.device->allocateCommandBuffersUnique(vk::CommandBufferAllocateInfo{
        ds.cmdPool.get(), vk::CommandBufferLevel::ePrimary, 1
    });
    cb_ = std::move(bufs[0]);
    cb_->begin(vk::CommandBufferBeginInfo{ vk::CommandBufferUsageFlagBits::eOneTimeSubmit });
}

void VulkanCommandEncoder::begin_render_pass(IGpuFrame& target, const Color& clear)
{
    auto& frame = static_cast<VulkanFrame&>(target);
    auto& ds = dev_.state();
    const vk::Extent2D extent = frame.extent();
    const vk::RenderPass rp = dev_.render_pass_for(frame.format());

    vk::ImageView view = frame.view();
    framebuffer_ = ds.device->createFramebufferUnique(vk::FramebufferCreateInfo{
        {}, rp, 1, &view, extent.width, extent.height, 1
    });
    target_ = &frame;

    vk::ClearValue clearValue{};
    clearValue.color = vk::ClearColorValue(std::array<float,4>{ clear.r, clear.g, clear.b, clear.a });

    vk::RenderPassBeginInfo rpbi{
        rp,
        framebuffer_.get(),
        vk::Rect2D{{0,0}, extent},
        1, &clearValue
    };
    cb_->beginRenderPass(rpbi, vk::SubpassContents::eInline);

    vk::Viewport vp{ 0,0, (float)extent.width, (float)extent.height, 0,1 };
    vk::Rect2D sc{ {0,0}, extent };
    cb_->setViewport(0, 1, &vp);
    cb_->setScissor(0, 1, &sc);
}

void VulkanCommandEncoder::set_pipeline(const IRenderPipeline& pipeline)
{
    cb_->bindPipeline(vk::PipelineBindPoint::eGraphics, static_cast<const VulkanPipeline&>(pipeline).handle());
}

void VulkanCommandEncoder::draw(uint32_t vertex_count, uint32_t instance_count,
                                uint32_t first_vertex, uint32_t first_instance)
{
    cb_->draw(vertex_count, instance_count, first_vertex, first_instance);
}

void VulkanCommandEncoder::end_render_pass()
{
    cb_->endRenderPass();
}

void VulkanQueue::submit(ICommandEncoder& encoder)
{
    auto& enc = static_cast<VulkanCommandEncoder&>(encoder);
    vk::CommandBuffer cbh = enc.command_buffer();

    try
    {
        cbh.end();

        const vk::PipelineStageFlags waitStage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
        vk::SubmitInfo submit{ 0, nullptr, nullptr, 1, &cbh, 0, nullptr };

        vk::Semaphore ia{}, rf{};
        if (const VulkanFrame* frame = enc.target())
        {
            ia = frame->image_available();
            rf = frame->render_finished();
            submit.waitSemaphoreCount = 1;
            submit.pWaitSemaphores = &ia;
            submit.pWaitDstStageMask = &waitStage;
            submit.signalSemaphoreCount = 1;
            submit.pSignalSemaphores = &rf;
        }

        VK_CHECK(s_.device->resetFences(s_.submitFence.get()));
        s_.graphicsQueue.submit(submit, s_.submitFence.get());
        VK_CHECK(s_.device->waitForFences(s_.submitFence.get(), true, std::numeric_limits<uint64_t>::max()));
    }
    catch (const vk::SystemError& e)
    {
        throw GpuError(GpuErrorCode::BackendFailure, std::string("queue submit: ") + e.what());
    }
}

} // namespace snowvk
