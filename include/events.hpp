#pragma once
#include "native_window.hpp"

#include <cstdint>
#include <variant>

namespace snowvk {

// Lifecycle signals delivered by the windowing layer, in arrival order.
namespace event {

// The window is available and can back a rendering surface.
struct Resumed { NativeWindow window{}; FramebufferSize size{}; };
struct Suspended {};
struct CloseRequested {};
struct Resized { FramebufferSize size{}; };
struct RedrawRequested {};
// The platform queue is drained; continuous rendering draws here.
struct Idle {};
struct KeyInput { std::uint32_t keycode = 0; };
struct MemoryWarning {};

} // namespace event

using Event = std::variant<
    event::Resumed,
    event::Suspended,
    event::CloseRequested,
    event::Resized,
    event::RedrawRequested,
    event::Idle,
    event::KeyInput,
    event::MemoryWarning>;

enum class Action { None, Exit };

const char* event_name(const Event& ev);

} // namespace snowvk
