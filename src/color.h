#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace plexus {

struct Rgb {
    std::uint8_t r = 0u;
    std::uint8_t g = 0u;
    std::uint8_t b = 0u;

    bool operator==(const Rgb&) const = default;
};

// A color normalized the way a 2D context reads back its fill style: opaque
// "#rrggbb" plus the alpha channel split out as a float in [0, 1].
struct ContextColor {
    std::string hex{"#000000"};
    float alpha = 1.0f;
    Rgb rgb{};

    bool operator==(const ContextColor&) const = default;
};

// Accepts #rgb, #rgba, #rrggbb, #rrggbbaa, rgb()/rgba(), hsl()/hsla() (comma or
// space separated, optional "/ alpha"), CSS named colors and "transparent".
std::optional<ContextColor> parse_css_color(std::string_view text);

std::string to_hex(const Rgb& rgb);

} // namespace plexus
