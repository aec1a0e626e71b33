#include "presets.h"

#include <string>
#include <utility>

namespace plexus {
namespace {

OptionsInput all_preset() {
    OptionsInput p;
    p.background = BackgroundInput{std::string{"#151019"}};
    p.mouse.interaction_type = 2;
    p.mouse.connect_dist_mult = 0.7;
    p.mouse.dist_ratio = 0.6;
    p.particles.color = "#8cf";
    p.particles.ppm = 120;
    p.particles.max = 250;
    p.particles.max_work = 30;
    p.particles.connect_distance = 125;
    p.particles.rel_size = 1;
    p.particles.rel_speed = 1;
    p.particles.rotation_speed = 2;
    p.gravity.repulsive = 0.55;
    p.gravity.pulling = 0;
    p.gravity.friction = 0.99;
    return p;
}

OptionsInput gravity_preset() {
    OptionsInput p;
    p.background = BackgroundInput{std::string{"#423"}};
    p.mouse.interaction_type = 2;
    p.particles.color = "#f45";
    p.particles.ppm = 200;
    p.particles.max_work = 20;
    p.particles.connect_distance = 125;
    p.particles.rel_size = 0.5;
    p.particles.rel_speed = 5;
    p.particles.rotation_speed = 5;
    p.gravity.repulsive = 3.5;
    p.gravity.pulling = 1.25;
    p.gravity.friction = 0.99;
    return p;
}

// The terminal has no gradients; the first gradient stop stands in.
OptionsInput shapes_preset() {
    OptionsInput p;
    p.background = BackgroundInput{std::string{"#f80"}};
    p.mouse.connect_dist_mult = 0.7;
    p.particles.color = "white";
    p.particles.ppm = 125;
    p.particles.connect_distance = 175;
    p.gravity.repulsive = 3;
    return p;
}

} // namespace

std::optional<OptionsInput> find_preset(std::string_view name) {
    if (name == "all") {
        return all_preset();
    }
    if (name == "gravity") {
        return gravity_preset();
    }
    if (name == "shapes") {
        return shapes_preset();
    }
    if (name == "empty") {
        return OptionsInput{};
    }
    return std::nullopt;
}

std::vector<std::string> preset_names() {
    return {"all", "gravity", "shapes", "empty"};
}

} // namespace plexus
