#pragma once

#include <optional>
#include <unordered_map>

#include "surface.h"

namespace plexus {

class ParticleField;

// Tracks which observed surfaces intersect the viewport and tells the owning
// field when that changes. Owns the surface -> field lookup so surfaces need
// no back-reference to their field.
class ViewportMonitor {
public:
    void observe(const Surface* surface, ParticleField* field);
    void unobserve(const Surface* surface);
    bool observing(const Surface* surface) const;

    // Recomputes intersection of every observed surface with `viewport`. The
    // first refresh after observe() always notifies; later ones only on change.
    void refresh(const SurfaceRect& viewport);

    // Delivers an intersection state directly.
    void notify(const Surface* surface, bool intersecting);

    std::optional<bool> intersecting(const Surface* surface) const;

private:
    struct Entry {
        ParticleField* field = nullptr;
        std::optional<bool> intersecting{};
    };

    std::unordered_map<const Surface*, Entry> entries_;
};

bool rects_intersect(const SurfaceRect& a, const SurfaceRect& b);

} // namespace plexus
