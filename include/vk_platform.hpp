// ============================================================================
// include/vk_platform.hpp
// Window-system surface types for Vulkan-Hpp.
// VK_USE_PLATFORM_*_KHR comes from the build (CMakeLists.txt) so core and
// backend translation units see identical Vulkan-Hpp declarations.
// ============================================================================

#pragma once

#if defined(_WIN32)
    #ifndef VK_USE_PLATFORM_WIN32_KHR
    #   error "VK_USE_PLATFORM_WIN32_KHR must be defined by the build"
    #endif
#elif defined(__ANDROID__)
    #ifndef VK_USE_PLATFORM_ANDROID_KHR
    #   error "VK_USE_PLATFORM_ANDROID_KHR must be defined by the build"
    #endif
    #include <android/native_window.h>
#elif defined(__linux__)
    #ifndef VK_USE_PLATFORM_XCB_KHR
    #   error "VK_USE_PLATFORM_XCB_KHR must be defined by the build"
    #endif
#endif
