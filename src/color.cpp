#include "color.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

namespace plexus {
namespace {

struct NamedColor {
    std::string_view name;
    std::uint32_t rgb;
};

constexpr std::array<NamedColor, 148> kNamedColors{{
    {"aliceblue", 0xF0F8FF}, {"antiquewhite", 0xFAEBD7}, {"aqua", 0x00FFFF},
    {"aquamarine", 0x7FFFD4}, {"azure", 0xF0FFFF}, {"beige", 0xF5F5DC},
    {"bisque", 0xFFE4C4}, {"black", 0x000000}, {"blanchedalmond", 0xFFEBCD},
    {"blue", 0x0000FF}, {"blueviolet", 0x8A2BE2}, {"brown", 0xA52A2A},
    {"burlywood", 0xDEB887}, {"cadetblue", 0x5F9EA0}, {"chartreuse", 0x7FFF00},
    {"chocolate", 0xD2691E}, {"coral", 0xFF7F50}, {"cornflowerblue", 0x6495ED},
    {"cornsilk", 0xFFF8DC}, {"crimson", 0xDC143C}, {"cyan", 0x00FFFF},
    {"darkblue", 0x00008B}, {"darkcyan", 0x008B8B}, {"darkgoldenrod", 0xB8860B},
    {"darkgray", 0xA9A9A9}, {"darkgreen", 0x006400}, {"darkgrey", 0xA9A9A9},
    {"darkkhaki", 0xBDB76B}, {"darkmagenta", 0x8B008B}, {"darkolivegreen", 0x556B2F},
    {"darkorange", 0xFF8C00}, {"darkorchid", 0x9932CC}, {"darkred", 0x8B0000},
    {"darksalmon", 0xE9967A}, {"darkseagreen", 0x8FBC8F}, {"darkslateblue", 0x483D8B},
    {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F}, {"darkturquoise", 0x00CED1},
    {"darkviolet", 0x9400D3}, {"deeppink", 0xFF1493}, {"deepskyblue", 0x00BFFF},
    {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1E90FF},
    {"firebrick", 0xB22222}, {"floralwhite", 0xFFFAF0}, {"forestgreen", 0x228B22},
    {"fuchsia", 0xFF00FF}, {"gainsboro", 0xDCDCDC}, {"ghostwhite", 0xF8F8FF},
    {"gold", 0xFFD700}, {"goldenrod", 0xDAA520}, {"gray", 0x808080},
    {"green", 0x008000}, {"greenyellow", 0xADFF2F}, {"grey", 0x808080},
    {"honeydew", 0xF0FFF0}, {"hotpink", 0xFF69B4}, {"indianred", 0xCD5C5C},
    {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
    {"lavender", 0xE6E6FA}, {"lavenderblush", 0xFFF0F5}, {"lawngreen", 0x7CFC00},
    {"lemonchiffon", 0xFFFACD}, {"lightblue", 0xADD8E6}, {"lightcoral", 0xF08080},
    {"lightcyan", 0xE0FFFF}, {"lightgoldenrodyellow", 0xFAFAD2}, {"lightgray", 0xD3D3D3},
    {"lightgreen", 0x90EE90}, {"lightgrey", 0xD3D3D3}, {"lightpink", 0xFFB6C1},
    {"lightsalmon", 0xFFA07A}, {"lightseagreen", 0x20B2AA}, {"lightskyblue", 0x87CEFA},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xB0C4DE},
    {"lightyellow", 0xFFFFE0}, {"lime", 0x00FF00}, {"limegreen", 0x32CD32},
    {"linen", 0xFAF0E6}, {"magenta", 0xFF00FF}, {"maroon", 0x800000},
    {"mediumaquamarine", 0x66CDAA}, {"mediumblue", 0x0000CD}, {"mediumorchid", 0xBA55D3},
    {"mediumpurple", 0x9370DB}, {"mediumseagreen", 0x3CB371}, {"mediumslateblue", 0x7B68EE},
    {"mediumspringgreen", 0x00FA9A}, {"mediumturquoise", 0x48D1CC}, {"mediumvioletred", 0xC71585},
    {"midnightblue", 0x191970}, {"mintcream", 0xF5FFFA}, {"mistyrose", 0xFFE4E1},
    {"moccasin", 0xFFE4B5}, {"navajowhite", 0xFFDEAD}, {"navy", 0x000080},
    {"oldlace", 0xFDF5E6}, {"olive", 0x808000}, {"olivedrab", 0x6B8E23},
    {"orange", 0xFFA500}, {"orangered", 0xFF4500}, {"orchid", 0xDA70D6},
    {"palegoldenrod", 0xEEE8AA}, {"palegreen", 0x98FB98}, {"paleturquoise", 0xAFEEEE},
    {"palevioletred", 0xDB7093}, {"papayawhip", 0xFFEFD5}, {"peachpuff", 0xFFDAB9},
    {"peru", 0xCD853F}, {"pink", 0xFFC0CB}, {"plum", 0xDDA0DD},
    {"powderblue", 0xB0E0E6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
    {"red", 0xFF0000}, {"rosybrown", 0xBC8F8F}, {"royalblue", 0x4169E1},
    {"saddlebrown", 0x8B4513}, {"salmon", 0xFA8072}, {"sandybrown", 0xF4A460},
    {"seagreen", 0x2E8B57}, {"seashell", 0xFFF5EE}, {"sienna", 0xA0522D},
    {"silver", 0xC0C0C0}, {"skyblue", 0x87CEEB}, {"slateblue", 0x6A5ACD},
    {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xFFFAFA},
    {"springgreen", 0x00FF7F}, {"steelblue", 0x4682B4}, {"tan", 0xD2B48C},
    {"teal", 0x008080}, {"thistle", 0xD8BFD8}, {"tomato", 0xFF6347},
    {"turquoise", 0x40E0D0}, {"violet", 0xEE82EE}, {"wheat", 0xF5DEB3},
    {"white", 0xFFFFFF}, {"whitesmoke", 0xF5F5F5}, {"yellow", 0xFFFF00},
    {"yellowgreen", 0x9ACD32},
}};

std::string normalize(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    std::string result;
    result.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    return result;
}

ContextColor make_color(int r, int g, int b, float alpha) {
    ContextColor color;
    color.rgb.r = static_cast<std::uint8_t>(std::clamp(r, 0, 255));
    color.rgb.g = static_cast<std::uint8_t>(std::clamp(g, 0, 255));
    color.rgb.b = static_cast<std::uint8_t>(std::clamp(b, 0, 255));
    color.alpha = std::clamp(alpha, 0.0f, 1.0f);
    color.hex = to_hex(color.rgb);
    return color;
}

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    return -1;
}

std::optional<ContextColor> parse_hex(std::string_view digits) {
    if (digits.size() != 3 && digits.size() != 4 && digits.size() != 6 && digits.size() != 8) {
        return std::nullopt;
    }
    std::array<int, 8> values{};
    for (std::size_t i = 0; i < digits.size(); ++i) {
        values[i] = hex_digit(digits[i]);
        if (values[i] < 0) {
            return std::nullopt;
        }
    }

    switch (digits.size()) {
    case 3:
    case 4: {
        const float alpha = digits.size() == 4 ? static_cast<float>(values[3] * 17) / 255.0f : 1.0f;
        return make_color(values[0] * 17, values[1] * 17, values[2] * 17, alpha);
    }
    case 6:
    case 8: {
        const float alpha = digits.size() == 8
                                ? static_cast<float>(values[6] * 16 + values[7]) / 255.0f
                                : 1.0f;
        return make_color(values[0] * 16 + values[1],
                          values[2] * 16 + values[3],
                          values[4] * 16 + values[5],
                          alpha);
    }
    default:
        return std::nullopt;
    }
}

struct Component {
    double value = 0.0;
    bool percent = false;
};

std::optional<Component> parse_component(const std::string& token, std::string_view unit_suffix = {}) {
    std::string body = token;
    Component component;
    if (!body.empty() && body.back() == '%') {
        component.percent = true;
        body.pop_back();
    } else if (!unit_suffix.empty() && body.size() > unit_suffix.size() &&
               body.compare(body.size() - unit_suffix.size(), unit_suffix.size(), unit_suffix) == 0) {
        body.resize(body.size() - unit_suffix.size());
    }
    if (body.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    component.value = std::strtod(body.c_str(), &end);
    if (end != body.c_str() + body.size() || !std::isfinite(component.value)) {
        return std::nullopt;
    }
    return component;
}

std::vector<std::string> split_arguments(std::string_view inner) {
    std::vector<std::string> tokens;
    std::string current;
    for (const char ch : inner) {
        if (ch == ',' || ch == '/' || std::isspace(static_cast<unsigned char>(ch))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(ch);
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::optional<float> parse_alpha(const std::vector<std::string>& tokens) {
    if (tokens.size() < 4) {
        return 1.0f;
    }
    const auto alpha = parse_component(tokens[3]);
    if (!alpha) {
        return std::nullopt;
    }
    const double value = alpha->percent ? alpha->value / 100.0 : alpha->value;
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

int channel_from(const Component& component) {
    const double value = component.percent ? component.value * 255.0 / 100.0 : component.value;
    return static_cast<int>(std::lround(std::clamp(value, 0.0, 255.0)));
}

std::optional<ContextColor> parse_rgb(const std::vector<std::string>& tokens) {
    if (tokens.size() != 3 && tokens.size() != 4) {
        return std::nullopt;
    }
    std::array<int, 3> channels{};
    for (std::size_t i = 0; i < 3; ++i) {
        const auto component = parse_component(tokens[i]);
        if (!component) {
            return std::nullopt;
        }
        channels[i] = channel_from(*component);
    }
    const auto alpha = parse_alpha(tokens);
    if (!alpha) {
        return std::nullopt;
    }
    return make_color(channels[0], channels[1], channels[2], *alpha);
}

double hue_to_channel(double p, double q, double t) {
    if (t < 0.0) {
        t += 1.0;
    }
    if (t > 1.0) {
        t -= 1.0;
    }
    if (t < 1.0 / 6.0) {
        return p + (q - p) * 6.0 * t;
    }
    if (t < 0.5) {
        return q;
    }
    if (t < 2.0 / 3.0) {
        return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    }
    return p;
}

std::optional<ContextColor> parse_hsl(const std::vector<std::string>& tokens) {
    if (tokens.size() != 3 && tokens.size() != 4) {
        return std::nullopt;
    }
    const auto hue = parse_component(tokens[0], "deg");
    const auto saturation = parse_component(tokens[1]);
    const auto lightness = parse_component(tokens[2]);
    if (!hue || hue->percent || !saturation || !lightness) {
        return std::nullopt;
    }
    const auto alpha = parse_alpha(tokens);
    if (!alpha) {
        return std::nullopt;
    }

    double h = std::fmod(hue->value, 360.0);
    if (h < 0.0) {
        h += 360.0;
    }
    h /= 360.0;
    const double s = std::clamp(saturation->value / 100.0, 0.0, 1.0);
    const double l = std::clamp(lightness->value / 100.0, 0.0, 1.0);

    double r = l;
    double g = l;
    double b = l;
    if (s > 0.0) {
        const double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
        const double p = 2.0 * l - q;
        r = hue_to_channel(p, q, h + 1.0 / 3.0);
        g = hue_to_channel(p, q, h);
        b = hue_to_channel(p, q, h - 1.0 / 3.0);
    }
    return make_color(static_cast<int>(std::lround(r * 255.0)),
                      static_cast<int>(std::lround(g * 255.0)),
                      static_cast<int>(std::lround(b * 255.0)),
                      *alpha);
}

std::optional<std::string_view> function_arguments(std::string_view text, std::string_view name) {
    if (text.size() <= name.size() + 1 || text.substr(0, name.size()) != name) {
        return std::nullopt;
    }
    std::string_view rest = text.substr(name.size());
    if (rest.front() != '(' || rest.back() != ')') {
        return std::nullopt;
    }
    return rest.substr(1, rest.size() - 2);
}

} // namespace

std::string to_hex(const Rgb& rgb) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex = "#000000";
    const std::array<std::uint8_t, 3> channels{rgb.r, rgb.g, rgb.b};
    for (std::size_t i = 0; i < channels.size(); ++i) {
        hex[1 + i * 2] = kDigits[channels[i] >> 4];
        hex[2 + i * 2] = kDigits[channels[i] & 0x0F];
    }
    return hex;
}

std::optional<ContextColor> parse_css_color(std::string_view text) {
    const std::string value = normalize(text);
    if (value.empty()) {
        return std::nullopt;
    }

    if (value.front() == '#') {
        return parse_hex(std::string_view(value).substr(1));
    }

    if (value == "transparent") {
        return make_color(0, 0, 0, 0.0f);
    }

    for (const std::string_view name : {std::string_view("rgba"), std::string_view("rgb")}) {
        if (const auto inner = function_arguments(value, name)) {
            return parse_rgb(split_arguments(*inner));
        }
    }
    for (const std::string_view name : {std::string_view("hsla"), std::string_view("hsl")}) {
        if (const auto inner = function_arguments(value, name)) {
            return parse_hsl(split_arguments(*inner));
        }
    }

    const auto it = std::find_if(kNamedColors.begin(), kNamedColors.end(), [&](const NamedColor& named) {
        return named.name == value;
    });
    if (it == kNamedColors.end()) {
        return std::nullopt;
    }
    return make_color(static_cast<int>((it->rgb >> 16) & 0xFF),
                      static_cast<int>((it->rgb >> 8) & 0xFF),
                      static_cast<int>(it->rgb & 0xFF),
                      1.0f);
}

} // namespace plexus
