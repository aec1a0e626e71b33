#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace plexus::config::detail {

enum class RawKind {
    String,
    Boolean,
    Number,
    Other,
};

struct RawScalar {
    std::string value;
    RawKind kind = RawKind::Other;
    int line = 0;
};

// Every scalar of the file keyed by its dotted path ("options.particles.ppm").
struct RawConfig {
    std::unordered_map<std::string, RawScalar> scalars;
};

RawConfig parse_raw_config(const std::string& path,
                           std::vector<std::string>& warnings,
                           bool& loaded_file);

// Trims surrounding whitespace from a string value.
std::string sanitize_string_value(const std::string& value);

} // namespace plexus::config::detail
