#include <gtest/gtest.h>

#include "color.h"

using plexus::ContextColor;
using plexus::Rgb;
using plexus::parse_css_color;

TEST(ColorTest, OpaqueHexKeepsFullAlpha) {
    const auto color = parse_css_color("#ff0000");
    ASSERT_TRUE(color.has_value());
    EXPECT_EQ(color->hex, "#ff0000");
    EXPECT_FLOAT_EQ(color->alpha, 1.0f);
    EXPECT_EQ(color->rgb, (Rgb{255, 0, 0}));
}

TEST(ColorTest, RgbaSplitsAlphaFromOpaqueHex) {
    const auto color = parse_css_color("rgba(0,128,255,0.5)");
    ASSERT_TRUE(color.has_value());
    EXPECT_EQ(color->hex, "#0080ff");
    EXPECT_NEAR(color->alpha, 0.5f, 1e-6f);
}

TEST(ColorTest, ShortHexForms) {
    const auto short_hex = parse_css_color("#8cf");
    ASSERT_TRUE(short_hex.has_value());
    EXPECT_EQ(short_hex->hex, "#88ccff");

    const auto with_alpha = parse_css_color("#f008");
    ASSERT_TRUE(with_alpha.has_value());
    EXPECT_EQ(with_alpha->hex, "#ff0000");
    EXPECT_NEAR(with_alpha->alpha, 136.0f / 255.0f, 1e-3f);
}

TEST(ColorTest, NamedColorsAreCaseInsensitive) {
    const auto white = parse_css_color("White");
    ASSERT_TRUE(white.has_value());
    EXPECT_EQ(white->hex, "#ffffff");

    const auto transparent = parse_css_color("transparent");
    ASSERT_TRUE(transparent.has_value());
    EXPECT_FLOAT_EQ(transparent->alpha, 0.0f);
}

TEST(ColorTest, HslMapsToRgb) {
    const auto red = parse_css_color("hsl(0, 100%, 50%)");
    ASSERT_TRUE(red.has_value());
    EXPECT_EQ(red->hex, "#ff0000");

    const auto translucent = parse_css_color("hsla(120, 100%, 25%, 0.25)");
    ASSERT_TRUE(translucent.has_value());
    EXPECT_EQ(translucent->hex, "#008000");
    EXPECT_NEAR(translucent->alpha, 0.25f, 1e-6f);
}

TEST(ColorTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_css_color("").has_value());
    EXPECT_FALSE(parse_css_color("#12").has_value());
    EXPECT_FALSE(parse_css_color("#123456789").has_value());
    EXPECT_FALSE(parse_css_color("#ggg").has_value());
    EXPECT_FALSE(parse_css_color("rgb(1,2)").has_value());
    EXPECT_FALSE(parse_css_color("notacolor").has_value());
}

TEST(ColorTest, ToHexFormatsLowercase) {
    EXPECT_EQ(plexus::to_hex(Rgb{0, 171, 255}), "#00abff");
}
