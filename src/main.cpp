#include "app.hpp"
#include "config.hpp"
#include "log.hpp"
#include "platform.hpp"
#include "vk_backend.hpp"

#include <exception>

int main()
{
    using namespace snowvk;
    const AppConfig cfg = load_config_from_env();
    log::set_level(cfg.log_level);

#if SNOWVK_HEADLESS
    log::info("main", "Headless build: no window/swapchain.");
    return 0;
#else
    if (auto* wnd = create_platform_window(cfg.window))
    {
        try
        {
            App app{ [] { return create_vulkan_instance("Snow Player"); }, cfg.render };
            app.run(*wnd);
        }
        catch (const std::exception& e)
        {
            log::error("main", "Fatal: ", e.what());
            destroy_platform_window(wnd);
            return 1;
        }
        destroy_platform_window(wnd);
        return 0;
    }
    log::error("main", "Failed to create platform window.");
    return 1;
#endif
}
