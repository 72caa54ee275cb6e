#pragma once
#include <xcb/xcb.h>
#include <cstdint>

namespace snowvk {

// 32-bit TrueColor visual with 8-bit RGB channels; the remaining byte is alpha.
bool is_argb_visual(std::uint8_t depth, const xcb_visualtype_t& visual);

// First ARGB visual the screen offers, or null. `depth` receives its depth.
const xcb_visualtype_t* find_argb_visual(const xcb_screen_t* screen, std::uint8_t& depth);

} // namespace snowvk
