#include "options_resolver.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace plexus {

namespace config {
namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct Range {
    double min = -kInfinity;
    double max = kInfinity;
};

double parse_numeric(std::string_view key,
                     const std::optional<double>& value,
                     double fallback,
                     Range range,
                     std::vector<std::string>& warnings) {
    if (!value) {
        return fallback;
    }
    if (std::isnan(*value)) {
        std::ostringstream oss;
        oss << key << " is not a number; using default " << fallback;
        warnings.push_back(oss.str());
        return fallback;
    }
    const double clamped = std::clamp(*value, range.min, range.max);
    if (clamped != *value) {
        std::ostringstream oss;
        oss << key << " clamped from " << *value << " to " << clamped;
        warnings.push_back(oss.str());
    }
    return clamped;
}

float to_float(double value) {
    return static_cast<float>(value);
}

} // namespace

std::optional<std::string> resolve_background(const std::optional<BackgroundInput>& background) {
    if (!background) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&*background)) {
        if (text->empty()) {
            return std::nullopt;
        }
        return *text;
    }
    if (const auto* flag = std::get_if<bool>(&*background); flag && !*flag) {
        return std::nullopt;
    }
    throw std::invalid_argument("background is not a string");
}

float resolve_mouse_connect_dist(float particle_connect_dist, double connect_dist_mult) {
    const double mult = std::isnan(connect_dist_mult) ? kDefaultConnectDistMult : connect_dist_mult;
    return to_float(static_cast<double>(particle_connect_dist) * mult);
}

ContextColor resolve_color(const std::string& color, std::vector<std::string>& warnings) {
    if (auto parsed = parse_css_color(color)) {
        return *parsed;
    }
    warnings.push_back("particles.color '" + color + "' is not a recognized color; using black");
    return ContextColor{};
}

Options resolve_options(const OptionsInput& input, std::vector<std::string>& warnings) {
    Options options;

    options.background = resolve_background(input.background);

    options.animation.start_on_enter = input.animation.start_on_enter.value_or(true);
    options.animation.stop_on_leave = input.animation.stop_on_leave.value_or(true);

    const double interaction = parse_numeric("mouse.interactionType",
                                             input.mouse.interaction_type,
                                             static_cast<double>(InteractionType::Shift),
                                             {0.0, 2.0},
                                             warnings);
    options.mouse.interaction_type = static_cast<InteractionType>(static_cast<int>(std::lround(interaction)));
    options.mouse.connect_dist_mult = to_float(parse_numeric("mouse.connectDistMult",
                                                             input.mouse.connect_dist_mult,
                                                             kDefaultConnectDistMult,
                                                             {0.0, kInfinity},
                                                             warnings));
    options.mouse.dist_ratio = to_float(parse_numeric("mouse.distRatio",
                                                      input.mouse.dist_ratio,
                                                      2.0 / 3.0,
                                                      {0.0, kInfinity},
                                                      warnings));

    ParticleOptions& particles = options.particles;
    GenerationType default_generation = GenerationType::Matching;
    if (input.particles.regenerate_on_resize.value_or(false)) {
        default_generation = GenerationType::New;
    }
    const double generation = parse_numeric("particles.generationType",
                                            input.particles.generation_type,
                                            static_cast<double>(default_generation),
                                            {0.0, 2.0},
                                            warnings);
    particles.generation_type = static_cast<GenerationType>(static_cast<int>(std::lround(generation)));
    particles.draw_lines = input.particles.draw_lines.value_or(true);
    particles.color = input.particles.color.value_or("black");
    particles.resolved_color = resolve_color(particles.color, warnings);
    particles.ppm = to_float(parse_numeric("particles.ppm", input.particles.ppm, 100.0, {0.0, kInfinity}, warnings));
    particles.max = to_float(parse_numeric("particles.max",
                                           input.particles.max,
                                           500.0,
                                           {0.0, static_cast<double>(kMaxParticleCount)},
                                           warnings));
    particles.max_work = to_float(parse_numeric("particles.maxWork",
                                                input.particles.max_work,
                                                kInfinity,
                                                {0.0, kInfinity},
                                                warnings));
    particles.connect_dist = to_float(parse_numeric("particles.connectDistance",
                                                    input.particles.connect_distance,
                                                    150.0,
                                                    {1.0, kInfinity},
                                                    warnings));
    particles.rel_speed = to_float(parse_numeric("particles.relSpeed",
                                                 input.particles.rel_speed,
                                                 1.0,
                                                 {0.0, kInfinity},
                                                 warnings));
    particles.rel_size = to_float(parse_numeric("particles.relSize",
                                                input.particles.rel_size,
                                                1.0,
                                                {0.0, kInfinity},
                                                warnings));
    // Configured in hundredths of a radian per frame.
    particles.rotation_speed = to_float(parse_numeric("particles.rotationSpeed",
                                                      input.particles.rotation_speed,
                                                      2.0,
                                                      {0.0, kInfinity},
                                                      warnings) /
                                        100.0);

    options.gravity.repulsive = to_float(parse_numeric("gravity.repulsive",
                                                       input.gravity.repulsive,
                                                       0.0,
                                                       {0.0, kInfinity},
                                                       warnings));
    options.gravity.pulling = to_float(parse_numeric("gravity.pulling",
                                                     input.gravity.pulling,
                                                     0.0,
                                                     {0.0, kInfinity},
                                                     warnings));
    options.gravity.friction = to_float(parse_numeric("gravity.friction",
                                                      input.gravity.friction,
                                                      0.8,
                                                      {0.0, 1.0},
                                                      warnings));

    options.mouse.connect_dist = resolve_mouse_connect_dist(particles.connect_dist, options.mouse.connect_dist_mult);

    return options;
}

} // namespace config

namespace {

template <typename T>
void overlay_field(std::optional<T>& target, const std::optional<T>& source) {
    if (source) {
        target = source;
    }
}

} // namespace

OptionsInput merge_options(const OptionsInput& base, const OptionsInput& overlay) {
    OptionsInput merged = base;
    overlay_field(merged.background, overlay.background);

    overlay_field(merged.animation.start_on_enter, overlay.animation.start_on_enter);
    overlay_field(merged.animation.stop_on_leave, overlay.animation.stop_on_leave);

    overlay_field(merged.mouse.interaction_type, overlay.mouse.interaction_type);
    overlay_field(merged.mouse.connect_dist_mult, overlay.mouse.connect_dist_mult);
    overlay_field(merged.mouse.dist_ratio, overlay.mouse.dist_ratio);

    overlay_field(merged.particles.generation_type, overlay.particles.generation_type);
    overlay_field(merged.particles.regenerate_on_resize, overlay.particles.regenerate_on_resize);
    overlay_field(merged.particles.draw_lines, overlay.particles.draw_lines);
    overlay_field(merged.particles.color, overlay.particles.color);
    overlay_field(merged.particles.ppm, overlay.particles.ppm);
    overlay_field(merged.particles.max, overlay.particles.max);
    overlay_field(merged.particles.max_work, overlay.particles.max_work);
    overlay_field(merged.particles.connect_distance, overlay.particles.connect_distance);
    overlay_field(merged.particles.rel_speed, overlay.particles.rel_speed);
    overlay_field(merged.particles.rel_size, overlay.particles.rel_size);
    overlay_field(merged.particles.rotation_speed, overlay.particles.rotation_speed);

    overlay_field(merged.gravity.repulsive, overlay.gravity.repulsive);
    overlay_field(merged.gravity.pulling, overlay.gravity.pulling);
    overlay_field(merged.gravity.friction, overlay.gravity.friction);
    return merged;
}

} // namespace plexus
