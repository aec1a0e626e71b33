#pragma once

#include <vector>

#include "../config.h"
#include "../random.h"
#include "particle.h"

namespace plexus::particles {

// Added under the square root of every pairwise distance so coincident
// particles do not produce an infinite force.
inline constexpr float kGravityEpsilon = 1e-3f;

// Steeper than inverse-square: d^-1.8 applied to the force magnitude.
inline constexpr float kGravityExponent = 1.8f;

// Largest velocity change one pair can cause per reference frame, relative
// to the connect distance.
inline constexpr float kMaxGravityRatio = 0.1f;

// Share of the remaining distance the mouse offset covers per reference frame.
inline constexpr float kMouseEasing = 0.25f;

// Pairwise repulsion (within half the connect distance) and pulling (at any
// distance). O(n^2); returns immediately when both strengths are zero.
void apply_gravity(std::vector<Particle>& particles, const Options& options, float step);

// Direction jitter, drift, wrap, friction, mouse displacement and grid
// classification for every particle.
void integrate_particles(std::vector<Particle>& particles,
                         const Options& options,
                         const SimulationBox& box,
                         const MousePosition& mouse,
                         Random& random,
                         float step);

// Recomputes drawn positions and grid cells without moving anything; used
// after the box changed so a frame can be drawn before the next integration.
void refresh_visuals(std::vector<Particle>& particles, const SimulationBox& box);

GridPos classify_grid(const Particle& particle);

// Euclidean modulo into [0, extent).
float wrap_coordinate(float value, float extent);

} // namespace plexus::particles
