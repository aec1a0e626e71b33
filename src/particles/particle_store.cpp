#include "particle_store.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace plexus::particles {

SimulationBox make_simulation_box(int surface_width, int surface_height, float connect_dist) {
    SimulationBox box;
    box.surface_width = std::max(surface_width, 0);
    box.surface_height = std::max(surface_height, 0);
    box.width = std::max(static_cast<float>(box.surface_width) + connect_dist * 2.0f, 1.0f);
    box.height = std::max(static_cast<float>(box.surface_height) + connect_dist * 2.0f, 1.0f);
    box.off_x = (static_cast<float>(box.surface_width) - box.width) / 2.0f;
    box.off_y = (static_cast<float>(box.surface_height) - box.height) / 2.0f;
    return box;
}

ParticleStore::ParticleStore(Random& random)
    : random_(random) {}

std::size_t ParticleStore::target_count(const ParticleOptions& options, const SimulationBox& box) {
    const double area = static_cast<double>(box.width) * static_cast<double>(box.height);
    const double wanted = std::round(static_cast<double>(options.ppm) * area / 1e6);
    const double count = std::min(static_cast<double>(options.max), wanted);
    if (!std::isfinite(count)) {
        throw std::range_error("number of particles must be finite (particles.ppm)");
    }
    if (count > static_cast<double>(kMaxParticleCount)) {
        throw std::range_error("number of particles exceeds the supported maximum (particles.max)");
    }
    return static_cast<std::size_t>(std::max(count, 0.0));
}

void ParticleStore::regenerate(const ParticleOptions& options, const SimulationBox& box, bool clear_manual) {
    const std::size_t count =
        options.generation_type == GenerationType::Manual ? 0u : target_count(options, box);

    if (clear_manual) {
        particles_.clear();
        has_manual_ = false;
    } else {
        remove_automatic();
    }

    particles_.reserve(particles_.size() + count);
    for (std::size_t i = 0; i < count; ++i) {
        create_particle(options, box, ParticleSeed{}, false);
    }
}

void ParticleStore::match_count(const ParticleOptions& options, const SimulationBox& box, bool update_bounds) {
    const std::size_t count =
        options.generation_type == GenerationType::Manual ? auto_count() : target_count(options, box);

    std::size_t kept = 0;
    std::size_t write = 0;
    for (std::size_t read = 0; read < particles_.size(); ++read) {
        if (!particles_[read].is_manual) {
            if (kept >= count) {
                continue;
            }
            ++kept;
        }
        if (write != read) {
            particles_[write] = particles_[read];
        }
        ++write;
    }
    particles_.resize(write);

    if (update_bounds) {
        this->update_bounds(box);
    }

    for (; kept < count; ++kept) {
        create_particle(options, box, ParticleSeed{}, false);
    }
}

Particle& ParticleStore::create_particle(const ParticleOptions& options,
                                         const SimulationBox& box,
                                         const ParticleSeed& seed,
                                         bool is_manual) {
    Particle particle;
    particle.pos_x = seed.x ? *seed.x - box.off_x : random_.next() * box.width;
    particle.pos_y = seed.y ? *seed.y - box.off_y : random_.next() * box.height;
    particle.x = particle.pos_x;
    particle.y = particle.pos_y;
    particle.dir = seed.dir ? *seed.dir : random_.next() * 2.0f * std::numbers::pi_v<float>;
    particle.speed = seed.speed ? *seed.speed : (0.5f + random_.next() * 0.5f) * options.rel_speed;
    particle.size = seed.size ? *seed.size : (0.5f + std::pow(random_.next(), 5.0f) * 2.0f) * options.rel_size;
    particle.is_manual = is_manual;
    apply_bounds(particle, box);

    if (is_manual) {
        has_manual_ = true;
    }
    particles_.push_back(particle);
    return particles_.back();
}

void ParticleStore::update_bounds(const SimulationBox& box) {
    for (Particle& particle : particles_) {
        apply_bounds(particle, box);
    }
}

void ParticleStore::clear() {
    particles_.clear();
    has_manual_ = false;
}

std::size_t ParticleStore::auto_count() const {
    return static_cast<std::size_t>(std::count_if(particles_.begin(), particles_.end(), [](const Particle& particle) {
        return !particle.is_manual;
    }));
}

void ParticleStore::apply_bounds(Particle& particle, const SimulationBox& box) {
    particle.bounds.top = -particle.size;
    particle.bounds.right = static_cast<float>(box.surface_width) + particle.size;
    particle.bounds.bottom = static_cast<float>(box.surface_height) + particle.size;
    particle.bounds.left = -particle.size;
}

void ParticleStore::remove_automatic() {
    particles_.erase(std::remove_if(particles_.begin(),
                                    particles_.end(),
                                    [](const Particle& particle) { return !particle.is_manual; }),
                     particles_.end());
}

} // namespace plexus::particles
