#include "../config.h"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "raw_config.h"
#include "value_parsers.h"

namespace plexus {
namespace {

using config::detail::RawKind;
using config::detail::RawScalar;

void warn(std::vector<std::string>& warnings, const std::string& key, const RawScalar& raw, const char* expected) {
    std::ostringstream oss;
    oss << "Invalid value for '" << key << "' at line " << raw.line << ": expected " << expected << ", got '"
        << raw.value << "'";
    warnings.push_back(oss.str());
}

// Non-numeric values are kept as NaN so the resolver falls back to the default
// and reports it.
void assign_number(const std::string& key,
                   const RawScalar& raw,
                   std::optional<double>& out,
                   std::vector<std::string>& warnings) {
    double parsed = 0.0;
    if (config::detail::parse_double(raw.value, parsed)) {
        out = parsed;
        return;
    }
    warn(warnings, key, raw, "a number");
    out = std::numeric_limits<double>::quiet_NaN();
}

void assign_bool(const std::string& key,
                 const RawScalar& raw,
                 std::optional<bool>& out,
                 std::vector<std::string>& warnings) {
    bool parsed = false;
    if (config::detail::parse_bool(raw.value, parsed)) {
        out = parsed;
        return;
    }
    warn(warnings, key, raw, "a boolean");
}

void assign_string(const RawScalar& raw, std::optional<std::string>& out) {
    out = config::detail::sanitize_string_value(raw.value);
}

void assign_background(const std::string& key,
                       const RawScalar& raw,
                       std::optional<BackgroundInput>& out,
                       std::vector<std::string>& warnings) {
    switch (raw.kind) {
    case RawKind::String:
        out = BackgroundInput{config::detail::sanitize_string_value(raw.value)};
        return;
    case RawKind::Boolean: {
        bool parsed = false;
        config::detail::parse_bool(raw.value, parsed);
        out = BackgroundInput{parsed};
        return;
    }
    case RawKind::Number: {
        double parsed = 0.0;
        config::detail::parse_double(raw.value, parsed);
        out = BackgroundInput{parsed};
        return;
    }
    case RawKind::Other:
        break;
    }
    warn(warnings, key, raw, "false or a color string");
}

using Warnings = std::vector<std::string>;
using Assigner = std::function<void(const std::string&, const RawScalar&, AppConfig&, Warnings&)>;

const std::map<std::string, Assigner>& assigners() {
    static const std::map<std::string, Assigner> table = [] {
        std::map<std::string, Assigner> t;

        t["options.background"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_background(k, r, c.options.background, w);
        };

        t["options.animation.startOnEnter"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_bool(k, r, c.options.animation.start_on_enter, w);
        };
        t["options.animation.stopOnLeave"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_bool(k, r, c.options.animation.stop_on_leave, w);
        };

        t["options.mouse.interactionType"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.mouse.interaction_type, w);
        };
        t["options.mouse.connectDistMult"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.mouse.connect_dist_mult, w);
        };
        t["options.mouse.distRatio"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.mouse.dist_ratio, w);
        };

        t["options.particles.generationType"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.generation_type, w);
        };
        t["options.particles.regenerateOnResize"] = [](const std::string& k, const RawScalar& r, AppConfig& c,
                                                        Warnings& w) {
            assign_bool(k, r, c.options.particles.regenerate_on_resize, w);
        };
        t["options.particles.drawLines"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_bool(k, r, c.options.particles.draw_lines, w);
        };
        t["options.particles.color"] = [](const std::string&, const RawScalar& r, AppConfig& c, Warnings&) {
            assign_string(r, c.options.particles.color);
        };
        t["options.particles.ppm"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.ppm, w);
        };
        t["options.particles.max"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.max, w);
        };
        t["options.particles.maxWork"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.max_work, w);
        };
        t["options.particles.connectDistance"] = [](const std::string& k, const RawScalar& r, AppConfig& c,
                                                     Warnings& w) {
            assign_number(k, r, c.options.particles.connect_distance, w);
        };
        t["options.particles.relSpeed"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.rel_speed, w);
        };
        t["options.particles.relSize"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.rel_size, w);
        };
        t["options.particles.rotationSpeed"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.particles.rotation_speed, w);
        };

        t["options.gravity.repulsive"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.gravity.repulsive, w);
        };
        t["options.gravity.pulling"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.gravity.pulling, w);
        };
        t["options.gravity.friction"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            assign_number(k, r, c.options.gravity.friction, w);
        };

        t["visual.target_fps"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            double fps = 0.0;
            if (config::detail::parse_double(r.value, fps) && fps > 0.0) {
                c.visual.target_fps = fps;
            } else {
                warn(w, k, r, "a positive number");
            }
        };
        t["visual.blitter"] = [](const std::string&, const RawScalar& r, AppConfig& c, Warnings&) {
            c.visual.blitter = config::detail::sanitize_string_value(r.value);
        };
        t["visual.seed"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            std::uint32_t seed = 0;
            if (config::detail::parse_uint32(r.value, seed)) {
                c.visual.seed = seed;
            } else {
                warn(w, k, r, "an unsigned 32-bit integer");
            }
        };
        t["visual.preset"] = [](const std::string&, const RawScalar& r, AppConfig& c, Warnings&) {
            c.visual.preset = config::detail::sanitize_string_value(r.value);
        };
        t["runtime.show_metrics"] = [](const std::string& k, const RawScalar& r, AppConfig& c, Warnings& w) {
            if (!config::detail::parse_bool(r.value, c.runtime.show_metrics)) {
                warn(w, k, r, "a boolean");
            }
        };
        return t;
    }();
    return table;
}

} // namespace

ConfigLoadResult load_app_config(const std::string& path) {
    ConfigLoadResult result;
    const config::detail::RawConfig raw = config::detail::parse_raw_config(path, result.warnings, result.loaded_file);

    // Sorted so warnings come out in a stable order.
    const std::map<std::string, RawScalar> ordered(raw.scalars.begin(), raw.scalars.end());
    const auto& table = assigners();
    for (const auto& [key, scalar] : ordered) {
        const auto it = table.find(key);
        if (it == table.end()) {
            std::ostringstream oss;
            oss << "Unknown configuration key '" << key << "' at line " << scalar.line;
            result.warnings.push_back(oss.str());
            continue;
        }
        it->second(key, scalar, result.config, result.warnings);
    }

    return result;
}

} // namespace plexus
