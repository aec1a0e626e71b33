#pragma once

#include <cstdint>

namespace plexus {

// Fast 32-bit mix generator (mulberry32). Not suitable for anything but visuals.
class Random {
public:
    static constexpr std::uint32_t kDefaultSeed = 0x9E3779B9u;

    Random();
    explicit Random(std::uint32_t seed);

    void seed(std::uint32_t seed);

    // Uniform float in [0, 1).
    float next();

    std::uint32_t next_u32();
    std::uint32_t state() const { return state_; }

private:
    std::uint32_t state_ = kDefaultSeed;
};

// Process-lifetime source shared by every particle field: particle creation and
// per-frame direction jitter both draw from it.
Random& default_random();

} // namespace plexus
