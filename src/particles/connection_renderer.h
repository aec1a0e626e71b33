#pragma once

#include <cstddef>
#include <vector>

#include "../config.h"
#include "../surface.h"
#include "particle.h"

namespace plexus::particles {

struct RenderStats {
    std::size_t particles_drawn = 0;
    std::size_t lines_drawn = 0;
    std::size_t batched_lines = 0; // Near-half lines stroked together at full alpha
};

// Whether a line between two particles may cross the visible center cell.
// Symmetric in its arguments.
bool is_line_visible(const Particle& a, const Particle& b);

// Line opacity for two particles `dist` apart. Full `opacity` up to half the
// connect distance, then falling linearly to zero at the connect distance.
float line_alpha(float dist, float connect_dist, float opacity);

std::size_t draw_particles(Surface& surface, const std::vector<Particle>& particles);

void draw_connections(Surface& surface,
                      const std::vector<Particle>& particles,
                      const Options& options,
                      RenderStats& stats);

RenderStats render(Surface& surface, const std::vector<Particle>& particles, const Options& options);

} // namespace plexus::particles
