#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "../config.h"
#include "../random.h"
#include "particle.h"

namespace plexus::particles {

// Explicit attributes for a new particle; anything left empty is randomized.
// x and y are surface coordinates.
struct ParticleSeed {
    std::optional<float> x{};
    std::optional<float> y{};
    std::optional<float> dir{};
    std::optional<float> speed{};
    std::optional<float> size{};
};

class ParticleStore {
public:
    explicit ParticleStore(Random& random = default_random());

    // min(max, round(ppm * box area / 1e6)). Throws std::range_error when the
    // result is not finite.
    static std::size_t target_count(const ParticleOptions& options, const SimulationBox& box);

    // Drops the automatic particles (every particle with `clear_manual`) and
    // creates target_count() fresh ones. Manual-only mode creates none.
    void regenerate(const ParticleOptions& options, const SimulationBox& box, bool clear_manual = false);

    // Grows or shrinks the automatic particles toward target_count() while
    // keeping manual ones. `update_bounds` recomputes bounds after a resize.
    void match_count(const ParticleOptions& options, const SimulationBox& box, bool update_bounds);

    Particle& create_particle(const ParticleOptions& options,
                              const SimulationBox& box,
                              const ParticleSeed& seed,
                              bool is_manual = true);

    void update_bounds(const SimulationBox& box);
    void clear();

    std::vector<Particle>& particles() { return particles_; }
    const std::vector<Particle>& particles() const { return particles_; }
    std::size_t size() const { return particles_.size(); }
    std::size_t auto_count() const;
    std::size_t manual_count() const { return size() - auto_count(); }
    bool has_manual() const { return has_manual_; }

private:
    static void apply_bounds(Particle& particle, const SimulationBox& box);
    void remove_automatic();

    Random& random_;
    std::vector<Particle> particles_;
    bool has_manual_ = false;
};

} // namespace plexus::particles
