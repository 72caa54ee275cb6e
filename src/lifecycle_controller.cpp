#include "lifecycle_controller.hpp"
#include "frame_renderer.hpp"
#include "graphics_context.hpp"
#include "log.hpp"
#include "surface_manager.hpp"

namespace snowvk {

// Member order is teardown order in reverse: pipeline, then surface state, then device.
struct LifecycleController::Session {
    GraphicsContext gpu;
    SurfaceManager surface;
    FrameRenderer renderer;
};

const char* to_string(LifecycleState s) noexcept
{
    switch (s)
    {
    case LifecycleState::Uninitialized: return "Uninitialized";
    case LifecycleState::Active: return "Active";
    case LifecycleState::Suspended: return "Suspended";
    case LifecycleState::Exited: return "Exited";
    }
    return "?";
}

LifecycleController::LifecycleController(InstanceFactory make_instance, RenderSettings settings)
    : make_instance_(std::move(make_instance)), settings_(settings), state_(Uninitialized{})
{
}

LifecycleController::~LifecycleController() = default;

Action LifecycleController::handle(const Event& ev)
{
    return std::visit([this](const auto& e) { return on(e); }, ev);
}

LifecycleState LifecycleController::state() const noexcept
{
    return static_cast<LifecycleState>(state_.index());
}

bool LifecycleController::wants_frames() const noexcept
{
    return std::holds_alternative<Active>(state_) && !zero_sized_;
}

const SurfaceConfiguration* LifecycleController::surface_configuration() const noexcept
{
    if (auto* a = std::get_if<Active>(&state_)) return &a->session->surface.configuration();
    if (auto* s = std::get_if<Suspended>(&state_)) return &s->session->surface.configuration();
    return nullptr;
}

LifecycleController::Session* LifecycleController::active_session() noexcept
{
    auto* a = std::get_if<Active>(&state_);
    return a ? a->session.get() : nullptr;
}

std::unique_ptr<LifecycleController::Session> LifecycleController::start_session(const event::Resumed& ev)
{
    log::info("lifecycle", "Starting GPU session for ", ev.size.w, "x", ev.size.h, " window");

    GraphicsContext gpu = GraphicsContext::initialize(make_instance_(), ev.window, settings_.power_preference);
    SurfaceManager surface = SurfaceManager::configure(gpu.surface(), gpu.device(), ev.size);
    auto pipeline = FrameRenderer::build_pipeline(gpu.device(), surface.configuration().format,
                                                  settings_.triangle_color);

    return std::make_unique<Session>(std::move(gpu), std::move(surface),
                                     FrameRenderer(std::move(pipeline), settings_.clear_color));
}

void LifecycleController::draw_frame(Session& s)
{
    // Minimized: the swapchain cannot be rebuilt until the window has an area again.
    if (zero_sized_) return;
    auto frame = s.surface.acquire_frame();
    s.renderer.render(*frame, s.gpu.device(), s.gpu.queue());
    ++frames_;
}

Action LifecycleController::on(const event::Resumed& ev)
{
    if (std::holds_alternative<Uninitialized>(state_))
    {
        auto session = start_session(ev);
        state_ = Active{ std::move(session) };
        zero_sized_ = false;
    }
    else if (auto* s = std::get_if<Suspended>(&state_))
    {
        // Drop the suspended session before acquiring a fresh one for the new window.
        s->session.reset();
        state_ = Uninitialized{};
        auto session = start_session(ev);
        state_ = Active{ std::move(session) };
        zero_sized_ = false;
    }
    else
    {
        log::trace("lifecycle", "resume ignored in state ", to_string(state()));
        return Action::None;
    }

    log::info("lifecycle", "-> Active");
    return Action::None;
}

Action LifecycleController::on(const event::Suspended&)
{
    if (auto* a = std::get_if<Active>(&state_))
    {
        // GPU resources are kept; surfaces the platform invalidates are rebuilt on resume.
        state_ = Suspended{ std::move(a->session) };
        log::info("lifecycle", "-> Suspended");
    }
    return Action::None;
}

Action LifecycleController::on(const event::CloseRequested&)
{
    if (std::holds_alternative<Exited>(state_))
        return Action::None;

    state_ = Exited{};
    log::info("lifecycle", "-> Exited after ", frames_, " frames");
    return Action::Exit;
}

Action LifecycleController::on(const event::Resized& ev)
{
    Session* s = active_session();
    if (!s) return Action::None;

    if (ev.size.w == 0 || ev.size.h == 0)
    {
        log::trace("lifecycle", "skipping zero-sized resize ", ev.size.w, "x", ev.size.h);
        zero_sized_ = true;
        return Action::None;
    }
    zero_sized_ = false;
    s->surface.resize(ev.size);
    return Action::None;
}

Action LifecycleController::on(const event::RedrawRequested&)
{
    if (Session* s = active_session()) draw_frame(*s);
    return Action::None;
}

// Renders on every idle tick, not only on explicit redraw requests.
Action LifecycleController::on(const event::Idle&)
{
    if (Session* s = active_session()) draw_frame(*s);
    return Action::None;
}

Action LifecycleController::on(const event::KeyInput&) { return Action::None; }
Action LifecycleController::on(const event::MemoryWarning&) { return Action::None; }

} // namespace snowvk
