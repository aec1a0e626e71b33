#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"

namespace plexus {

// Built-in option sets selectable with --preset or visual.preset.
std::optional<OptionsInput> find_preset(std::string_view name);

std::vector<std::string> preset_names();

} // namespace plexus
