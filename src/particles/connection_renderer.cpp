#include "connection_renderer.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace plexus::particles {

bool is_line_visible(const Particle& a, const Particle& b) {
    if (a.is_visible || b.is_visible) {
        return true;
    }
    // Both ends in the same off-screen column or row: the line stays in that band.
    return !((a.grid_pos.x == b.grid_pos.x && a.grid_pos.x != 1) ||
             (a.grid_pos.y == b.grid_pos.y && a.grid_pos.y != 1));
}

float line_alpha(float dist, float connect_dist, float opacity) {
    const float half = connect_dist / 2.0f;
    if (dist <= half) {
        return opacity;
    }
    if (dist >= connect_dist) {
        return 0.0f;
    }
    return opacity * (connect_dist - dist) / half;
}

std::size_t draw_particles(Surface& surface, const std::vector<Particle>& particles) {
    std::size_t drawn = 0;
    for (const Particle& particle : particles) {
        if (!particle.is_visible) {
            continue;
        }
        if (particle.size > 1.0f) {
            surface.fill_circle(particle.x, particle.y, particle.size);
        } else {
            // A square of the same extent is far cheaper and looks the same at this scale.
            surface.fill_rect(particle.x - particle.size,
                              particle.y - particle.size,
                              particle.size * 2.0f,
                              particle.size * 2.0f);
        }
        ++drawn;
    }
    return drawn;
}

void draw_connections(Surface& surface,
                      const std::vector<Particle>& particles,
                      const Options& options,
                      RenderStats& stats) {
    const ContextColor& color = options.particles.resolved_color;
    const float connect_dist = options.particles.connect_dist;
    const float connect_dist_sq = connect_dist * connect_dist;
    const float half_dist = connect_dist / 2.0f;
    const float half_dist_sq = half_dist * half_dist;
    const bool draw_all = connect_dist >= static_cast<float>(std::min(surface.width(), surface.height()));
    const double max_work =
        static_cast<double>(options.particles.max_work) * static_cast<double>(connect_dist_sq);

    std::vector<std::pair<std::size_t, std::size_t>> batched;

    const std::size_t count = particles.size();
    for (std::size_t i = 0; i < count; ++i) {
        const Particle& a = particles[i];
        double work = 0.0;

        for (std::size_t j = i + 1; j < count; ++j) {
            // Runs count^2 / 2 times per frame.
            if (work >= max_work) {
                break;
            }

            const Particle& b = particles[j];
            if (!draw_all && !is_line_visible(a, b)) {
                continue;
            }

            const float dist_x = a.x - b.x;
            const float dist_y = a.y - b.y;
            const float dist_sq = dist_x * dist_x + dist_y * dist_y;
            if (dist_sq > connect_dist_sq) {
                continue;
            }

            if (dist_sq <= half_dist_sq) {
                batched.emplace_back(i, j);
            } else {
                surface.set_stroke_color(color.rgb, line_alpha(std::sqrt(dist_sq), connect_dist, color.alpha));
                surface.begin_path();
                surface.move_to(a.x, a.y);
                surface.line_to(b.x, b.y);
                surface.stroke();
            }

            ++stats.lines_drawn;
            work += static_cast<double>(dist_sq);
        }
    }

    if (batched.empty()) {
        return;
    }

    surface.set_stroke_color(color.rgb, color.alpha);
    surface.begin_path();
    for (const auto& [i, j] : batched) {
        surface.move_to(particles[i].x, particles[i].y);
        surface.line_to(particles[j].x, particles[j].y);
    }
    surface.stroke();
    stats.batched_lines += batched.size();
}

RenderStats render(Surface& surface, const std::vector<Particle>& particles, const Options& options) {
    RenderStats stats;
    const ContextColor& color = options.particles.resolved_color;

    surface.clear();
    surface.set_fill_color(color.rgb, color.alpha);
    surface.set_stroke_color(color.rgb, color.alpha);
    surface.set_line_width(1.0f);

    stats.particles_drawn = draw_particles(surface, particles);
    if (options.particles.draw_lines) {
        draw_connections(surface, particles, options, stats);
    }
    return stats;
}

} // namespace plexus::particles
