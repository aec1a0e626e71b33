#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../config.h"

namespace plexus::config {

inline constexpr double kDefaultConnectDistMult = 2.0 / 3.0;

// Validates and normalizes a sparse input into a complete configuration. Pure:
// the same input always resolves to the same Options. A warning is appended
// for every value that had to be clamped or could not be interpreted.
// Throws std::invalid_argument when `background` is neither false nor a string.
Options resolve_options(const OptionsInput& input, std::vector<std::string>& warnings);

std::optional<std::string> resolve_background(const std::optional<BackgroundInput>& background);

float resolve_mouse_connect_dist(float particle_connect_dist, double connect_dist_mult);

// Unparsable colors resolve to opaque black with a warning.
ContextColor resolve_color(const std::string& color, std::vector<std::string>& warnings);

} // namespace plexus::config
