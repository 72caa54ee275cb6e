#include "xcb_visual.hpp"

#include <gtest/gtest.h>

using namespace snowvk;

namespace {

xcb_visualtype_t visual(uint8_t cls, uint32_t r, uint32_t g, uint32_t b)
{
    xcb_visualtype_t v{};
    v.visual_id = 0x21;
    v._class = cls;
    v.bits_per_rgb_value = 8;
    v.colormap_entries = 256;
    v.red_mask = r;
    v.green_mask = g;
    v.blue_mask = b;
    return v;
}

TEST(XcbVisualTest, AcceptsDepth32TrueColor)
{
    EXPECT_TRUE(is_argb_visual(32, visual(XCB_VISUAL_CLASS_TRUE_COLOR, 0xff0000, 0xff00, 0xff)));
}

TEST(XcbVisualTest, RejectsDepth24)
{
    EXPECT_FALSE(is_argb_visual(24, visual(XCB_VISUAL_CLASS_TRUE_COLOR, 0xff0000, 0xff00, 0xff)));
}

TEST(XcbVisualTest, RejectsDirectColor)
{
    EXPECT_FALSE(is_argb_visual(32, visual(XCB_VISUAL_CLASS_DIRECT_COLOR, 0xff0000, 0xff00, 0xff)));
}

TEST(XcbVisualTest, RejectsSwappedChannels)
{
    EXPECT_FALSE(is_argb_visual(32, visual(XCB_VISUAL_CLASS_TRUE_COLOR, 0xff, 0xff00, 0xff0000)));
}

} // namespace
