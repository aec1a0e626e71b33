#include "random.h"

namespace plexus {

Random::Random()
    : state_(kDefaultSeed) {}

Random::Random(std::uint32_t seed)
    : state_(seed) {}

void Random::seed(std::uint32_t seed) {
    state_ = seed;
}

std::uint32_t Random::next_u32() {
    state_ += 0x6D2B79F5u;
    std::uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return t ^ (t >> 14);
}

float Random::next() {
    // 24 high bits keep the result strictly below 1.0f after conversion.
    return static_cast<float>(next_u32() >> 8) * (1.0f / 16777216.0f);
}

Random& default_random() {
    static Random instance;
    return instance;
}

} // namespace plexus
