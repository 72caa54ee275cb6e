#include "app.hpp"
#include "log.hpp"

#include <utility>

namespace snowvk {

App::App(LifecycleController::InstanceFactory make_instance, RenderSettings settings)
    : controller_(std::move(make_instance), settings)
{
}

void App::run(IPlatformWindow& window)
{
    log::info("app", "Starting Snow Player on ", platform_family(), " (", window.platform_name(), ")");

    for (;;)
    {
        Event ev;
        while (window.poll_event(ev))
        {
            log::trace("app", "event ", event_name(ev));
            if (controller_.handle(ev) == Action::Exit)
            {
                log::info("app", "Exiting after ", controller_.frames_rendered(), " frames");
                return;
            }
        }

        // Nothing to draw into (no session, suspended or minimized): sleep until the platform has something for us.
        if (!controller_.wants_frames())
        {
            window.wait_events();
            continue;
        }

        // Continuous rendering while active.
        if (controller_.handle(event::Idle{}) == Action::Exit)
            return;
    }
}

} // namespace snowvk
