#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "color.h"

namespace plexus {

enum class InteractionType {
    None = 0,  // No mouse interaction
    Shift = 1, // Visual displacement only
    Move = 2,  // Displacement is committed to the logical position
};

enum class GenerationType {
    Manual = 0, // Never auto-populate
    New = 1,    // Clear and recreate the automatic particles on every resize
    Matching = 2,
};

// Background as given by the user: `false` disables it, a string is a color.
// Anything else (true, a number) is rejected by the resolver.
using BackgroundInput = std::variant<bool, double, std::string>;

struct AnimationOptions {
    bool start_on_enter = true;
    bool stop_on_leave = true;

    bool operator==(const AnimationOptions&) const = default;
};

struct MouseOptions {
    InteractionType interaction_type = InteractionType::Shift;
    float connect_dist_mult = 2.0f / 3.0f;
    float connect_dist = 100.0f; // Derived: particles.connect_dist * connect_dist_mult
    float dist_ratio = 2.0f / 3.0f;

    bool operator==(const MouseOptions&) const = default;
};

// Hard ceiling on automatic particles. Pair work grows quadratically and the
// store reserves up front, so `particles.max` is clamped to this.
constexpr std::size_t kMaxParticleCount = 100000;

struct ParticleOptions {
    GenerationType generation_type = GenerationType::Matching;
    bool draw_lines = true;
    std::string color{"black"}; // As given; see `resolved_color` for the normalized form
    ContextColor resolved_color{};
    float ppm = 100.0f;
    float max = 500.0f;
    float max_work = std::numeric_limits<float>::infinity();
    float connect_dist = 150.0f;
    float rel_speed = 1.0f;
    float rel_size = 1.0f;
    float rotation_speed = 0.02f; // Radians per reference frame

    bool operator==(const ParticleOptions&) const = default;
};

struct GravityOptions {
    float repulsive = 0.0f;
    float pulling = 0.0f;
    float friction = 0.8f;

    bool operator==(const GravityOptions&) const = default;
};

// Fully resolved configuration. Fields may be edited in place through
// ParticleField::options(); such edits are not validated.
struct Options {
    std::optional<std::string> background{};
    AnimationOptions animation{};
    MouseOptions mouse{};
    ParticleOptions particles{};
    GravityOptions gravity{};

    bool operator==(const Options&) const = default;
};

// Sparse configuration: every field optional. Numeric values that failed to
// parse are carried as NaN and fall back to their default during resolution.
struct OptionsInput {
    std::optional<BackgroundInput> background{};

    struct Animation {
        std::optional<bool> start_on_enter{};
        std::optional<bool> stop_on_leave{};
    } animation{};

    struct Mouse {
        std::optional<double> interaction_type{};
        std::optional<double> connect_dist_mult{};
        std::optional<double> dist_ratio{};
    } mouse{};

    struct Particles {
        std::optional<double> generation_type{};
        std::optional<bool> regenerate_on_resize{};
        std::optional<bool> draw_lines{};
        std::optional<std::string> color{};
        std::optional<double> ppm{};
        std::optional<double> max{};
        std::optional<double> max_work{};
        std::optional<double> connect_distance{};
        std::optional<double> rel_speed{};
        std::optional<double> rel_size{};
        std::optional<double> rotation_speed{};
    } particles{};

    struct Gravity {
        std::optional<double> repulsive{};
        std::optional<double> pulling{};
        std::optional<double> friction{};
    } gravity{};
};

// Field-by-field overlay: any field set in `overlay` replaces the one in `base`.
OptionsInput merge_options(const OptionsInput& base, const OptionsInput& overlay);

struct VisualConfig {
    double target_fps = 60.0;
    std::string blitter{"braille"};
    std::optional<std::uint32_t> seed{};
    std::string preset{};
};

struct RuntimeConfig {
    bool show_metrics = false;
};

struct AppConfig {
    VisualConfig visual{};
    RuntimeConfig runtime{};
    OptionsInput options{};
};

struct ConfigLoadResult {
    AppConfig config{};
    bool loaded_file = false;
    std::vector<std::string> warnings{};
};

ConfigLoadResult load_app_config(const std::string& path);

} // namespace plexus
