#if defined(__ANDROID__)

#include "platform.hpp"
#include <new>

namespace snowvk {
namespace {
// No android_app glue is linked yet, so there is never a native window to resume with.
// The loop sees an empty queue and a window that immediately asks to close.
class AndroidWindow final : public IPlatformWindow {
public:
    explicit AndroidWindow(const WindowCreateInfo&) {}
    NativeWindow native() const override { return {}; }
    FramebufferSize framebuffer_size() const override { return {}; }
    bool poll_event(Event& out) override
    {
        if (closed_) return false;
        closed_ = true;
        out = event::CloseRequested{};
        return true;
    }
    void wait_events() override {}
    const char* platform_name() const override { return "android(stub)"; }

private:
    bool closed_ = false;
};
}
IPlatformWindow* create_android_window(const WindowCreateInfo& ci) { return new (std::nothrow) AndroidWindow(ci); }
void destroy_android_window(IPlatformWindow* wnd) { delete wnd; }
} // namespace snowvk

#endif
