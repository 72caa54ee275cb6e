#include "vk_validation.hpp"
#include "config.hpp"
#include "log.hpp"
#include <cstring>

namespace snowvk {

VkBool32 VKAPI_CALL debug_callback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void*)
{
    const char* msg = (data && data->pMessage) ? data->pMessage : "(null)";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        log::error("validation", msg);
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        log::warn("validation", msg);
    else
        log::trace("validation", msg);
    return VK_FALSE;
}

ValidationConfig make_validation_config()
{
    ValidationConfig cfg{};
#if SNOWVK_ENABLE_VALIDATION
    cfg.enable = true;
    // runtime check: only enable if available
    const auto available = vk::enumerateInstanceLayerProperties();
    bool has = false;
    for (const auto& p : available)
        if (std::strcmp(p.layerName, "VK_LAYER_KHRONOS_validation") == 0) { has = true; break; }

    if (has)
    {
        cfg.instance_layers.push_back("VK_LAYER_KHRONOS_validation");
        cfg.instance_exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
    else
    {
        cfg.enable = false;
        log::warn("vulkan", "VK_LAYER_KHRONOS_validation not found; running without validation.");
    }
#else
    cfg.enable = false;
#endif
    return cfg;
}

DebugMessenger create_debug_messenger(vk::Instance instance)
{
    DebugMessenger out{};
#if SNOWVK_ENABLE_VALIDATION
    auto fpCreate = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT"));
    out.destroy = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));

    if (!fpCreate || !out.destroy) return out;

    VkDebugUtilsMessengerCreateInfoEXT ci{};
    ci.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    ci.messageSeverity =
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT;
    ci.messageType =
        VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    ci.pfnUserCallback = debug_callback;

    if (fpCreate(instance, &ci, nullptr, &out.handle) != VK_SUCCESS)
    {
        log::warn("vulkan", "vkCreateDebugUtilsMessengerEXT failed; validation output disabled.");
        out.handle = VK_NULL_HANDLE;
    }
#else
    (void)instance;
#endif
    return out;
}

void destroy_debug_messenger(vk::Instance instance, DebugMessenger& dbg)
{
    if (dbg.destroy && dbg.handle)
        dbg.destroy(instance, dbg.handle, nullptr);
    dbg = DebugMessenger{};
}

} // namespace snowvk
