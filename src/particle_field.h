#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "events/event_bus.h"
#include "events/input_events.h"
#include "frame_scheduler.h"
#include "particles/connection_renderer.h"
#include "particles/particle.h"
#include "particles/particle_store.h"
#include "surface.h"
#include "viewport_monitor.h"

namespace plexus {

// Host services a field attaches to. All must outlive the field.
struct FieldHost {
    FrameScheduler& scheduler;
    events::EventBus& bus;
    ViewportMonitor& viewport;
};

struct StartOptions {
    bool automatic = false; // Triggered by visibility rather than by the user
};

struct StopOptions {
    bool automatic = false;
    bool clear = true;
};

struct MatchOptions {
    bool update_bounds = false;
};

struct NewParticlesOptions {
    bool clear_manual = false;
};

// One animated particle network bound to one surface.
//
// Two flags drive the lifecycle: `enabled` is what the user asked for and
// `animating` is whether frames are currently executing. Leaving the viewport
// pauses the animation without clearing `enabled`, so re-entering resumes it.
class ParticleField {
public:
    static constexpr double kReferenceFrameMs = 1000.0 / 60.0;
    // Longer gaps (stalls, a suspended terminal) are simulated as one 50 FPS frame.
    static constexpr double kMaxFrameMs = 1000.0 / 50.0;

    // Throws std::invalid_argument on a null surface or an invalid background.
    ParticleField(Surface* surface, FieldHost host, const OptionsInput& input = {});
    ~ParticleField();

    ParticleField(const ParticleField&) = delete;
    ParticleField& operator=(const ParticleField&) = delete;
    ParticleField(ParticleField&&) = delete;
    ParticleField& operator=(ParticleField&&) = delete;

    ParticleField& start(StartOptions opts = {});
    bool stop(StopOptions opts = {});

    // Stops, detaches from every host service, detaches the surface and drops
    // the particles. The field is inert afterwards: setters and lifecycle calls
    // are ignored and create_particle throws std::logic_error.
    void destroy();

    // Re-derives the simulation box from the surface size and reconciles the
    // particles with the generation policy. Renders once when animating.
    void resize_surface();

    void new_particles(NewParticlesOptions opts = {});
    void match_particle_count(MatchOptions opts = {});

    particles::Particle& create_particle(const particles::ParticleSeed& seed = {});
    particles::Particle& create_particle(float x, float y, float dir, float speed, float size);

    void set_background(const BackgroundInput& background);
    void set_mouse_connect_dist_mult(double connect_dist_mult);
    void set_particle_color(const std::string& color);

    // Validating bulk update; re-derives the box and the particle count.
    void set_options(const OptionsInput& input);

    // Raw access for live tuning. Edits are not validated.
    Options& options() { return options_; }
    const Options& options() const { return options_; }

    void handle_viewport_change(bool intersecting);

    bool animating() const { return animating_; }
    bool enabled() const { return enabled_; }
    bool in_viewport() const { return in_viewport_; }
    bool destroyed() const { return destroyed_; }

    const Surface* surface() const { return surface_; }
    particles::ParticleStore& store() { return store_; }
    const std::vector<particles::Particle>& particles() const { return store_.particles(); }
    const particles::SimulationBox& box() const { return box_; }
    const particles::MousePosition& mouse() const { return mouse_; }
    const particles::RenderStats& last_frame_stats() const { return last_stats_; }
    float last_step() const { return last_step_; }
    std::uint64_t frame_count() const { return frame_count_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    void subscribe_events();
    void animate(double timestamp_ms);
    void request_next_frame();
    void render_frame();
    float compute_step(double timestamp_ms);
    void apply_background();
    void update_mouse_position();
    void log_warnings(const std::vector<std::string>& warnings);
    particles::SimulationBox validated_box(const Options& options) const;

    Surface* surface_ = nullptr;
    FrameScheduler& scheduler_;
    events::EventBus& bus_;
    ViewportMonitor& viewport_;
    std::vector<events::EventBus::Subscription> subscriptions_;

    Options options_{};
    std::vector<std::string> warnings_;
    particles::ParticleStore store_;
    particles::SimulationBox box_{};
    particles::MousePosition mouse_{};
    std::optional<std::pair<double, double>> client_position_{};

    bool enabled_ = false;
    bool animating_ = false;
    bool in_viewport_ = true;
    bool destroyed_ = false;

    std::optional<FrameScheduler::RequestId> pending_request_{};
    std::optional<double> last_frame_ms_{};
    float last_step_ = 1.0f;
    particles::RenderStats last_stats_{};
    std::uint64_t frame_count_ = 0;
};

} // namespace plexus
