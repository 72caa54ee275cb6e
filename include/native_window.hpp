#pragma once
#include <cstdint>

namespace snowvk {

struct FramebufferSize { uint32_t w=0, h=0; };

inline bool operator==(FramebufferSize a, FramebufferSize b) { return a.w == b.w && a.h == b.h; }
inline bool operator!=(FramebufferSize a, FramebufferSize b) { return !(a == b); }

struct NativeWindow {
#if defined(_WIN32)
    void* hinstance = nullptr;
    void* hwnd = nullptr;
#elif defined(__ANDROID__)
    void* app = nullptr;          // android_app*
    void* native_window = nullptr; // ANativeWindow*
#else
    void* xcb_connection = nullptr; // xcb_connection_t*
    std::uint32_t xcb_window = 0;   // xcb_window_t
#endif
};

} // namespace snowvk
