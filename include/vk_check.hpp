// ============================================================================
// include/vk_check.hpp
// Vulkan-Hpp error handling shim.
//
// If VULKAN_HPP_NO_EXCEPTIONS is defined, many Vulkan-Hpp calls return vk::Result
// (or vk::ResultValue<T>) and are marked [[nodiscard]].
// If exceptions are enabled, failures throw vk::SystemError and many calls return void;
// the backend converts those to GpuError at its interface boundary.
// ============================================================================

#pragma once

#include <vulkan/vulkan.hpp>

#include "gpu_error.hpp"

#include <string>

namespace snowvk
{
    inline void vk_check(vk::Result r, const char* what, GpuErrorCode code = GpuErrorCode::BackendFailure)
    {
        if (r != vk::Result::eSuccess)
            throw GpuError(code, std::string(what) + " failed: " + vk::to_string(r));
    }

    template <class T>
    inline T vk_check_value(vk::ResultValue<T> rv, const char* what, GpuErrorCode code = GpuErrorCode::BackendFailure)
    {
        vk_check(rv.result, what, code);
        return std::move(rv.value);
    }
}

#ifdef VULKAN_HPP_NO_EXCEPTIONS
    // Use for vk::Result-returning calls.
    #define VK_CHECK(expr) ::snowvk::vk_check((expr), #expr)
#else
    // Exceptions enabled: Vulkan-Hpp throws on failure.
    #define VK_CHECK(expr) (void)(expr)
#endif
