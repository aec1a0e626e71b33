#include "viewport_monitor.h"

#include <utility>
#include <vector>

#include "particle_field.h"

namespace plexus {

bool rects_intersect(const SurfaceRect& a, const SurfaceRect& b) {
    return a.left < b.left + b.width && b.left < a.left + a.width &&
           a.top < b.top + b.height && b.top < a.top + a.height;
}

void ViewportMonitor::observe(const Surface* surface, ParticleField* field) {
    if (!surface || !field) {
        return;
    }
    entries_[surface] = Entry{field, std::nullopt};
}

void ViewportMonitor::unobserve(const Surface* surface) {
    entries_.erase(surface);
}

bool ViewportMonitor::observing(const Surface* surface) const {
    return entries_.find(surface) != entries_.end();
}

void ViewportMonitor::refresh(const SurfaceRect& viewport) {
    std::vector<std::pair<const Surface*, bool>> changes;
    for (const auto& [surface, entry] : entries_) {
        const bool now = rects_intersect(surface->bounding_rect(), viewport);
        if (!entry.intersecting || *entry.intersecting != now) {
            changes.emplace_back(surface, now);
        }
    }
    // Handlers may unobserve, so deliver outside the iteration.
    for (const auto& [surface, now] : changes) {
        notify(surface, now);
    }
}

void ViewportMonitor::notify(const Surface* surface, bool intersecting) {
    const auto it = entries_.find(surface);
    if (it == entries_.end()) {
        return;
    }
    it->second.intersecting = intersecting;
    it->second.field->handle_viewport_change(intersecting);
}

std::optional<bool> ViewportMonitor::intersecting(const Surface* surface) const {
    const auto it = entries_.find(surface);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.intersecting;
}

} // namespace plexus
