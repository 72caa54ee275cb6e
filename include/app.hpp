#pragma once
#include "config.hpp"
#include "lifecycle_controller.hpp"
#include "platform.hpp"

namespace snowvk {

class App {
public:
    App(LifecycleController::InstanceFactory make_instance, RenderSettings settings);

    // Pumps window events into the controller until it asks to exit.
    void run(IPlatformWindow& window);

    const LifecycleController& controller() const noexcept { return controller_; }

private:
    LifecycleController controller_;
};

} // namespace snowvk
