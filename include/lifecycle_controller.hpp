#pragma once
#include "config.hpp"
#include "events.hpp"
#include "gpu.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

namespace snowvk {

enum class LifecycleState { Uninitialized, Active, Suspended, Exited };

const char* to_string(LifecycleState s) noexcept;

// Drives GraphicsContext, SurfaceManager and FrameRenderer from platform events.
//
//   Uninitialized --Resumed--> Active
//   Active --Resized / RedrawRequested / Idle--> Active
//   (while the last reported size has a zero dimension, nothing is drawn)
//   Active --Suspended--> Suspended --Resumed--> Active (fresh GPU session)
//   any --CloseRequested--> Exited
//
// GPU failures are thrown as GpuError and end the loop; nothing is retried here.
class LifecycleController {
public:
    using InstanceFactory = std::function<std::unique_ptr<IGpuInstance>()>;

    LifecycleController(InstanceFactory make_instance, RenderSettings settings);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Processes one event. Returns Action::Exit exactly once, on the close transition.
    Action handle(const Event& ev);

    LifecycleState state() const noexcept;

    // Active with a drawable (non-zero) window size. When false the caller may block for events.
    bool wants_frames() const noexcept;

    // Null unless a GPU session exists (Active or Suspended).
    const SurfaceConfiguration* surface_configuration() const noexcept;

    std::uint64_t frames_rendered() const noexcept { return frames_; }

private:
    struct Session;

    struct Uninitialized {};
    struct Active { std::unique_ptr<Session> session; };
    struct Suspended { std::unique_ptr<Session> session; };
    struct Exited {};

    using State = std::variant<Uninitialized, Active, Suspended, Exited>;

    Action on(const event::Resumed& ev);
    Action on(const event::Suspended& ev);
    Action on(const event::CloseRequested& ev);
    Action on(const event::Resized& ev);
    Action on(const event::RedrawRequested& ev);
    Action on(const event::Idle& ev);
    Action on(const event::KeyInput& ev);
    Action on(const event::MemoryWarning& ev);

    std::unique_ptr<Session> start_session(const event::Resumed& ev);
    void draw_frame(Session& s);
    Session* active_session() noexcept;

    InstanceFactory make_instance_;
    RenderSettings settings_;
    State state_;
    std::uint64_t frames_ = 0;
    bool zero_sized_ = false;
};

} // namespace snowvk
