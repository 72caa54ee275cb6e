#if !defined(_WIN32) && !defined(__ANDROID__)

#include "platform.hpp"
#include "log.hpp"
#include "xcb_visual.hpp"
#include <xcb/xcb.h>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <new>

namespace snowvk {

bool is_argb_visual(std::uint8_t depth, const xcb_visualtype_t& v)
{
    return depth == 32 && v._class == XCB_VISUAL_CLASS_TRUE_COLOR &&
           v.red_mask == 0x00ff0000u && v.green_mask == 0x0000ff00u && v.blue_mask == 0x000000ffu;
}

const xcb_visualtype_t* find_argb_visual(const xcb_screen_t* screen, std::uint8_t& depth)
{
    for (auto d = xcb_screen_allowed_depths_iterator(screen); d.rem; xcb_depth_next(&d))
    {
        for (auto v = xcb_depth_visuals_iterator(d.data); v.rem; xcb_visualtype_next(&v))
        {
            if (is_argb_visual(d.data->depth, *v.data))
            {
                depth = d.data->depth;
                return v.data;
            }
        }
    }
    return nullptr;
}

namespace {

xcb_atom_t intern_atom(xcb_connection_t* conn, const char* name)
{
    xcb_intern_atom_cookie_t cookie = xcb_intern_atom(conn, 0, (uint16_t)std::strlen(name), name);
    xcb_intern_atom_reply_t* reply = xcb_intern_atom_reply(conn, cookie, nullptr);
    if (!reply) return XCB_ATOM_NONE;
    const xcb_atom_t atom = reply->atom;
    std::free(reply);
    return atom;
}

class XcbWindow final : public IPlatformWindow {
public:
    explicit XcbWindow(const WindowCreateInfo& ci)
    {
        conn_ = xcb_connect(nullptr, nullptr);
        if (int err = xcb_connection_has_error(conn_); err)
        {
            log::error("platform", "xcb_connect failed (error ", err, ")");
            ok_ = false;
            return;
        }

        const xcb_setup_t* setup = xcb_get_setup(conn_);
        xcb_screen_iterator_t it = xcb_setup_roots_iterator(setup);
        screen_ = it.data;

        window_ = xcb_generate_id(conn_);

        const uint32_t events =
            XCB_EVENT_MASK_EXPOSURE |
            XCB_EVENT_MASK_STRUCTURE_NOTIFY |
            XCB_EVENT_MASK_KEY_PRESS;

        std::uint8_t depth = 0;
        const xcb_visualtype_t* argb = ci.transparent ? find_argb_visual(screen_, depth) : nullptr;
        if (argb)
        {
            // A depth-32 window needs its own colormap and an explicit border pixel.
            colormap_ = xcb_generate_id(conn_);
            xcb_create_colormap(conn_, XCB_COLORMAP_ALLOC_NONE, colormap_, screen_->root, argb->visual_id);

            const uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_BORDER_PIXEL | XCB_CW_EVENT_MASK | XCB_CW_COLORMAP;
            const uint32_t values[4] = { 0, 0, events, colormap_ };
            xcb_create_window(conn_, depth, window_, screen_->root,
                              0, 0, (uint16_t)ci.width, (uint16_t)ci.height, 0,
                              XCB_WINDOW_CLASS_INPUT_OUTPUT, argb->visual_id, mask, values);
            transparent_ = true;
        }
        else
        {
            if (ci.transparent)
                log::warn("platform", "no 32-bit ARGB visual; window will be opaque");
            const uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
            const uint32_t values[2] = { screen_->black_pixel, events };
            xcb_create_window(conn_, XCB_COPY_FROM_PARENT, window_, screen_->root,
                              0, 0, (uint16_t)ci.width, (uint16_t)ci.height, 0,
                              XCB_WINDOW_CLASS_INPUT_OUTPUT, screen_->root_visual, mask, values);
        }

        xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, window_,
                            XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 8,
                            std::strlen(ci.title), ci.title);

        // Ask the window manager for a ClientMessage instead of killing the connection on close.
        wmProtocols_ = intern_atom(conn_, "WM_PROTOCOLS");
        wmDelete_ = intern_atom(conn_, "WM_DELETE_WINDOW");
        if (wmProtocols_ != XCB_ATOM_NONE && wmDelete_ != XCB_ATOM_NONE)
            xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, window_,
                                wmProtocols_, XCB_ATOM_ATOM, 32, 1, &wmDelete_);

        xcb_map_window(conn_, window_);
        xcb_flush(conn_);

        fbw_ = ci.width; fbh_ = ci.height;
    }

    ~XcbWindow() override
    {
        if (conn_)
        {
            if (window_) xcb_destroy_window(conn_, window_);
            if (colormap_) xcb_free_colormap(conn_, colormap_);
            xcb_disconnect(conn_);
        }
    }

    bool ok() const { return ok_; }

    NativeWindow native() const override { return NativeWindow{ (void*)conn_, window_ }; }
    FramebufferSize framebuffer_size() const override { return FramebufferSize{ fbw_, fbh_ }; }

    bool poll_event(Event& out) override
    {
        for(;;)
        {
            xcb_generic_event_t* ev = xcb_poll_for_event(conn_);
            if (!ev) break;
            handle(ev);
            std::free(ev);
        }
        if (xcb_connection_has_error(conn_) && !closed_)
        {
            closed_ = true;
            queue_.push_back(event::CloseRequested{});
        }
        if (queue_.empty()) return false;
        out = queue_.front();
        queue_.pop_front();
        return true;
    }

    void wait_events() override
    {
        if (!queue_.empty() || closed_) return;
        xcb_generic_event_t* ev = xcb_wait_for_event(conn_);
        if (!ev) return;
        handle(ev);
        std::free(ev);
    }

    const char* platform_name() const override { return transparent_ ? "xcb(argb)" : "xcb"; }

private:
    void handle(xcb_generic_event_t* ev)
    {
        const uint8_t type = ev->response_type & ~0x80;
        switch(type)
        {
        case XCB_MAP_NOTIFY:
            if (!resumed_)
            {
                resumed_ = true;
                queue_.push_back(event::Resumed{ native(), framebuffer_size() });
            }
            break;
        case XCB_DESTROY_NOTIFY:
            if (!closed_) { closed_ = true; queue_.push_back(event::CloseRequested{}); }
            break;
        case XCB_CLIENT_MESSAGE:
        {
            auto* cm = (xcb_client_message_event_t*)ev;
            if (cm->type == wmProtocols_ && cm->data.data32[0] == wmDelete_ && !closed_)
            {
                closed_ = true;
                queue_.push_back(event::CloseRequested{});
            }
        } break;
        case XCB_CONFIGURE_NOTIFY:
        {
            auto* c = (xcb_configure_notify_event_t*)ev;
            if (c->width != fbw_ || c->height != fbh_)
            {
                fbw_ = c->width;
                fbh_ = c->height;
                queue_.push_back(event::Resized{ FramebufferSize{ fbw_, fbh_ } });
            }
        } break;
        case XCB_EXPOSE:
            if (((xcb_expose_event_t*)ev)->count == 0)
                queue_.push_back(event::RedrawRequested{});
            break;
        case XCB_KEY_PRESS:
            queue_.push_back(event::KeyInput{ ((xcb_key_press_event_t*)ev)->detail });
            break;
        default: break;
        }
    }

    xcb_connection_t* conn_ = nullptr;
    xcb_screen_t* screen_ = nullptr;
    xcb_window_t window_ = 0;
    xcb_colormap_t colormap_ = 0;
    xcb_atom_t wmProtocols_ = XCB_ATOM_NONE;
    xcb_atom_t wmDelete_ = XCB_ATOM_NONE;
    uint32_t fbw_ = 0, fbh_ = 0;
    std::deque<Event> queue_;
    bool resumed_ = false;
    bool closed_ = false;
    bool ok_ = true;
    bool transparent_ = false;
};

} // namespace

IPlatformWindow* create_xcb_window(const WindowCreateInfo& ci)
{
    auto* wnd = new (std::nothrow) XcbWindow(ci);
    if (wnd && !wnd->ok()) { delete wnd; return nullptr; }
    return wnd;
}
void destroy_xcb_window(IPlatformWindow* wnd) { delete wnd; }

} // namespace snowvk

#endif
