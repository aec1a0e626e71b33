#pragma once

#include <limits>

namespace plexus::particles {

// A particle counts as visible while its visual position lies inside these.
struct ParticleBounds {
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;
};

// Location in a 3x3 grid laid over the surface; (1, 1) is the visible center.
//   (0,0) top-left  (1,0) top     (2,0) top-right
//   (0,1) left      (1,1) center  (2,1) right
//   (0,2) bot-left  (1,2) bottom  (2,2) bot-right
struct GridPos {
    int x = 1;
    int y = 1;

    bool operator==(const GridPos&) const = default;
};

struct Particle {
    float pos_x = 0.0f; // Logical position inside the simulation box
    float pos_y = 0.0f;
    float x = 0.0f;     // Visual position in surface pixels
    float y = 0.0f;
    float vel_x = 0.0f; // Gravity-driven velocity, pixels per reference frame
    float vel_y = 0.0f;
    float off_x = 0.0f; // Mouse-induced distance from logical to drawn position
    float off_y = 0.0f;
    float dir = 0.0f;   // Drift direction in radians
    float speed = 0.0f; // Drift speed, pixels per reference frame
    float size = 1.0f;  // Radius in pixels
    ParticleBounds bounds{};
    GridPos grid_pos{};
    bool is_visible = false;
    bool is_manual = false;
};

// Surface inflated by the connect distance on every side, so particles that
// wrapped off-screen still connect across the visible edge.
struct SimulationBox {
    float width = 1.0f;
    float height = 1.0f;
    float off_x = 0.0f; // Box origin relative to the surface origin
    float off_y = 0.0f;
    int surface_width = 0;
    int surface_height = 0;
};

SimulationBox make_simulation_box(int surface_width, int surface_height, float connect_dist);

struct MousePosition {
    float x = std::numeric_limits<float>::infinity();
    float y = std::numeric_limits<float>::infinity();
};

} // namespace plexus::particles
