#pragma once
#include "native_window.hpp"
#include "events.hpp"
#include <cstdint>

namespace snowvk {

class IPlatformWindow {
public:
    virtual ~IPlatformWindow() = default;

    virtual NativeWindow native() const = 0;
    virtual FramebufferSize framebuffer_size() const = 0;

    // Pops the oldest pending event. Returns false once the queue is drained.
    virtual bool poll_event(Event& out) = 0;

    // Blocks until at least one event is queued (used while there is nothing to draw).
    virtual void wait_events() = 0;

    virtual const char* platform_name() const = 0;
};

struct WindowCreateInfo {
    const char* title = "Snow Player";
    uint32_t width = 1280;
    uint32_t height = 720;
    // Request a window whose unpainted/alpha areas show what is behind it.
    bool transparent = true;
};

// "Desktop" or "Android".
constexpr const char* platform_family()
{
#if defined(__ANDROID__)
    return "Android";
#else
    return "Desktop";
#endif
}

IPlatformWindow* create_platform_window(const WindowCreateInfo& ci);
void destroy_platform_window(IPlatformWindow* wnd);

} // namespace snowvk
