#if defined(_WIN32)

#include "platform.hpp"
#include "log.hpp"
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <dwmapi.h>
#include <deque>
#include <new>
#include <string>

namespace snowvk {

namespace {
class Win32Window final : public IPlatformWindow {
public:
    explicit Win32Window(const WindowCreateInfo& ci)
    {
        WNDCLASSEXW wc{};
        wc.cbSize = sizeof(wc);
        wc.lpfnWndProc = &Win32Window::WndProcThunk;
        wc.hInstance = GetModuleHandleW(nullptr);
        wc.hCursor = LoadCursorW(nullptr, IDC_ARROW);
        wc.lpszClassName = L"snowvk_win32";
        RegisterClassExW(&wc);

        std::wstring title;
        const int n = MultiByteToWideChar(CP_UTF8, 0, ci.title, -1, nullptr, 0);
        if (n > 0)
        {
            title.resize((size_t)n);
            MultiByteToWideChar(CP_UTF8, 0, ci.title, -1, title.data(), n);
            title.pop_back(); // terminator
        }

        RECT r{0,0,(LONG)ci.width,(LONG)ci.height};
        AdjustWindowRect(&r, WS_OVERLAPPEDWINDOW, FALSE);

        hwnd_ = CreateWindowExW(
            0, wc.lpszClassName, title.c_str(),
            WS_OVERLAPPEDWINDOW | WS_VISIBLE,
            CW_USEDEFAULT, CW_USEDEFAULT, r.right-r.left, r.bottom-r.top,
            nullptr, nullptr, wc.hInstance, this);

        hinst_ = wc.hInstance;

        // Extending the DWM frame over the whole client area lets the swapchain's alpha through.
        if (hwnd_ && ci.transparent)
        {
            const MARGINS margins{ -1, -1, -1, -1 };
            if (FAILED(DwmExtendFrameIntoClientArea(hwnd_, &margins)))
                log::warn("platform", "DwmExtendFrameIntoClientArea failed; window will be opaque");
        }
        // Initialize framebuffer size immediately; WM_SIZE may not have fired yet.
        RECT rc{};
        if (hwnd_ && GetClientRect(hwnd_, &rc))
        {
            fbw_ = (uint32_t)((rc.right > rc.left) ? (rc.right - rc.left) : 0);
            fbh_ = (uint32_t)((rc.bottom > rc.top) ? (rc.bottom - rc.top) : 0);
        }
        if (hwnd_)
            queue_.push_back(event::Resumed{ native(), FramebufferSize{ fbw_, fbh_ } });
    }

    ~Win32Window() override
    {
        if (hwnd_) DestroyWindow(hwnd_);
        hwnd_ = nullptr;
    }

    bool ok() const { return hwnd_ != nullptr; }

    NativeWindow native() const override { return NativeWindow{ (void*)hinst_, (void*)hwnd_ }; }

    FramebufferSize framebuffer_size() const override { return FramebufferSize{ fbw_, fbh_ }; }

    bool poll_event(Event& out) override
    {
        MSG msg{};
        while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE))
        {
            if (msg.message == WM_QUIT) { push_close(); break; }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
        if (queue_.empty()) return false;
        out = queue_.front();
        queue_.pop_front();
        return true;
    }

    void wait_events() override
    {
        if (!queue_.empty() || closed_) return;
        MSG msg{};
        if (GetMessageW(&msg, nullptr, 0, 0) <= 0) { push_close(); return; }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    const char* platform_name() const override { return "win32"; }

private:
    static LRESULT CALLBACK WndProcThunk(HWND h, UINT m, WPARAM w, LPARAM l)
    {
        auto* self = (Win32Window*)GetWindowLongPtrW(h, GWLP_USERDATA);
        if (m == WM_NCCREATE)
        {
            auto* cs = (CREATESTRUCTW*)l;
            self = (Win32Window*)cs->lpCreateParams;
            SetWindowLongPtrW(h, GWLP_USERDATA, (LONG_PTR)self);
        }
        return self ? self->WndProc(h,m,w,l) : DefWindowProcW(h,m,w,l);
    }

    void push_close()
    {
        if (closed_) return;
        closed_ = true;
        queue_.push_back(event::CloseRequested{});
    }

    LRESULT WndProc(HWND h, UINT m, WPARAM w, LPARAM l)
    {
        switch(m)
        {
        case WM_CLOSE: push_close(); return 0;
        case WM_SIZE:
        {
            // Minimizing reports 0x0; the renderer skips zero-sized resizes.
            const uint32_t nw = (uint32_t)LOWORD(l);
            const uint32_t nh = (uint32_t)HIWORD(l);
            if (nw != fbw_ || nh != fbh_)
            {
                fbw_ = nw;
                fbh_ = nh;
                queue_.push_back(event::Resized{ FramebufferSize{ fbw_, fbh_ } });
            }
            return 0;
        }
        case WM_PAINT:
            ValidateRect(h, nullptr);
            queue_.push_back(event::RedrawRequested{});
            return 0;
        case WM_KEYDOWN:
            queue_.push_back(event::KeyInput{ (uint32_t)w });
            return 0;
        default: break;
        }
        return DefWindowProcW(h,m,w,l);
    }

    HINSTANCE hinst_{};
    HWND hwnd_{};
    uint32_t fbw_{0}, fbh_{0};
    std::deque<Event> queue_;
    bool closed_ = false;
};
}

IPlatformWindow* create_win32_window(const WindowCreateInfo& ci)
{
    auto* wnd = new (std::nothrow) Win32Window(ci);
    if (wnd && !wnd->ok()) { delete wnd; return nullptr; }
    return wnd;
}
void destroy_win32_window(IPlatformWindow* wnd) { delete wnd; }

} // namespace snowvk
#endif
