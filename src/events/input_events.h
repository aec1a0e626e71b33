#pragma once

namespace plexus {

class Surface;

namespace events {

// Pointer position in viewport ("client") coordinates.
struct PointerMovedEvent {
    double client_x = 0.0;
    double client_y = 0.0;
};

// The viewport scrolled; surfaces may have moved under a stationary pointer.
struct ScrollEvent {};

struct SurfaceResizedEvent {
    const Surface* surface = nullptr;
    int width = 0;
    int height = 0;
};

} // namespace events
} // namespace plexus
