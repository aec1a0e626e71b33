#include "force_integrator.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace plexus::particles {
namespace {

constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;

void relax_offset(Particle& particle, float easing) {
    particle.off_x -= particle.off_x * easing;
    particle.off_y -= particle.off_y * easing;
}

void ease_mouse_offset(Particle& particle,
                       const Options& options,
                       const SimulationBox& box,
                       const MousePosition& mouse,
                       float easing) {
    const float dist_x = particle.pos_x + box.off_x - mouse.x;
    const float dist_y = particle.pos_y + box.off_y - mouse.y;
    const float dist = std::sqrt(dist_x * dist_x + dist_y * dist_y + kGravityEpsilon);
    const float dist_ratio = options.mouse.connect_dist / dist;

    // Inside the interaction radius the particle is kept at arm's length:
    // its drawn position is pushed out to mouse.connect_dist along the ray.
    if (std::isfinite(dist_ratio) && options.mouse.dist_ratio < dist_ratio) {
        particle.off_x += (dist_ratio * dist_x - dist_x - particle.off_x) * easing;
        particle.off_y += (dist_ratio * dist_y - dist_y - particle.off_y) * easing;
    } else {
        relax_offset(particle, easing);
    }
}

} // namespace

float wrap_coordinate(float value, float extent) {
    if (!(extent > 0.0f) || !std::isfinite(value)) {
        return 0.0f;
    }
    float wrapped = std::fmod(value, extent);
    if (wrapped < 0.0f) {
        wrapped += extent;
    }
    // fmod of a tiny negative value plus extent can round up to extent itself.
    if (wrapped >= extent) {
        wrapped = 0.0f;
    }
    return wrapped;
}

void apply_gravity(std::vector<Particle>& particles, const Options& options, float step) {
    const float repulsive = options.gravity.repulsive;
    const float pulling = options.gravity.pulling;
    const bool repulsive_enabled = repulsive > 0.0f;
    const bool pulling_enabled = pulling > 0.0f;
    if (!repulsive_enabled && !pulling_enabled) {
        return;
    }

    const float connect_dist = options.particles.connect_dist;
    const float repulsive_mult = connect_dist * repulsive;
    const float pulling_mult = connect_dist * pulling;
    const float max_repulsive_dist = connect_dist / 2.0f;
    const float max_repulsive_dist_sq = max_repulsive_dist * max_repulsive_dist;
    const float max_grav = connect_dist * kMaxGravityRatio;

    const std::size_t count = particles.size();
    for (std::size_t i = 0; i < count; ++i) {
        Particle& a = particles[i];
        for (std::size_t j = i + 1; j < count; ++j) {
            // Runs count^2 / 2 times per frame.
            Particle& b = particles[j];

            const float dist_x = b.pos_x - a.pos_x;
            const float dist_y = b.pos_y - a.pos_y;
            const float dist_sq = dist_x * dist_x + dist_y * dist_y;
            const bool repel = repulsive_enabled && dist_sq < max_repulsive_dist_sq;
            if (!repel && !pulling_enabled) {
                continue;
            }

            const float dist = std::sqrt(dist_sq + kGravityEpsilon);
            const float grav = std::pow(dist, -kGravityExponent);
            const float unit_x = dist_x / dist;
            const float unit_y = dist_y / dist;

            if (repel) {
                const float force = std::min(max_grav, grav * repulsive_mult) * step;
                a.vel_x -= unit_x * force;
                a.vel_y -= unit_y * force;
                b.vel_x += unit_x * force;
                b.vel_y += unit_y * force;
            }

            if (pulling_enabled) {
                const float force = std::min(max_grav, grav * pulling_mult) * step;
                a.vel_x += unit_x * force;
                a.vel_y += unit_y * force;
                b.vel_x -= unit_x * force;
                b.vel_y -= unit_y * force;
            }
        }
    }
}

void integrate_particles(std::vector<Particle>& particles,
                         const Options& options,
                         const SimulationBox& box,
                         const MousePosition& mouse,
                         Random& random,
                         float step) {
    const float rotation = options.particles.rotation_speed * step;
    const float friction = std::pow(options.gravity.friction, step);
    const InteractionType interaction = options.mouse.interaction_type;
    const float easing = 1.0f - std::pow(1.0f - kMouseEasing, step);

    for (Particle& particle : particles) {
        particle.dir = std::fmod(particle.dir + (random.next() * 2.0f - 1.0f) * rotation, kTwoPi);

        const float drift_x = std::sin(particle.dir) * particle.speed;
        const float drift_y = std::cos(particle.dir) * particle.speed;
        particle.pos_x = wrap_coordinate(particle.pos_x + (drift_x + particle.vel_x) * step, box.width);
        particle.pos_y = wrap_coordinate(particle.pos_y + (drift_y + particle.vel_y) * step, box.height);
        particle.vel_x *= friction;
        particle.vel_y *= friction;

        if (interaction != InteractionType::None) {
            ease_mouse_offset(particle, options, box, mouse, easing);
        } else {
            // Offsets left over from a live mode switch fade out.
            relax_offset(particle, easing);
        }

        particle.x = particle.pos_x + particle.off_x;
        particle.y = particle.pos_y + particle.off_y;

        if (interaction == InteractionType::Move) {
            particle.pos_x = wrap_coordinate(particle.x, box.width);
            particle.pos_y = wrap_coordinate(particle.y, box.height);
        }

        particle.x += box.off_x;
        particle.y += box.off_y;

        particle.grid_pos = classify_grid(particle);
        particle.is_visible = particle.grid_pos.x == 1 && particle.grid_pos.y == 1;
    }
}

void refresh_visuals(std::vector<Particle>& particles, const SimulationBox& box) {
    for (Particle& particle : particles) {
        particle.x = particle.pos_x + particle.off_x + box.off_x;
        particle.y = particle.pos_y + particle.off_y + box.off_y;
        particle.grid_pos = classify_grid(particle);
        particle.is_visible = particle.grid_pos.x == 1 && particle.grid_pos.y == 1;
    }
}

GridPos classify_grid(const Particle& particle) {
    GridPos grid;
    grid.x = static_cast<int>(particle.x >= particle.bounds.left) + static_cast<int>(particle.x > particle.bounds.right);
    grid.y = static_cast<int>(particle.y >= particle.bounds.top) + static_cast<int>(particle.y > particle.bounds.bottom);
    return grid;
}

} // namespace plexus::particles
