#include "particle_field.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "config/options_resolver.h"
#include "particles/force_integrator.h"
#include "random.h"

namespace plexus {

ParticleField::ParticleField(Surface* surface, FieldHost host, const OptionsInput& input)
    : surface_(surface),
      scheduler_(host.scheduler),
      bus_(host.bus),
      viewport_(host.viewport),
      store_(default_random()) {
    if (!surface_) {
        throw std::invalid_argument("surface must not be null");
    }

    set_options(input);

    viewport_.observe(surface_, this);
    subscribe_events();
}

ParticleField::~ParticleField() {
    if (pending_request_) {
        scheduler_.cancel_frame(*pending_request_);
    }
    if (!destroyed_ && surface_) {
        viewport_.unobserve(surface_);
    }
}

void ParticleField::subscribe_events() {
    subscriptions_.push_back(bus_.subscribe<events::SurfaceResizedEvent>(
        [this](const events::SurfaceResizedEvent& event) {
            if (event.surface == surface_) {
                resize_surface();
            }
        }));

    subscriptions_.push_back(bus_.subscribe<events::PointerMovedEvent>(
        [this](const events::PointerMovedEvent& event) {
            if (!enabled_) {
                return;
            }
            client_position_ = std::make_pair(event.client_x, event.client_y);
            update_mouse_position();
        }));

    subscriptions_.push_back(bus_.subscribe<events::ScrollEvent>([this](const events::ScrollEvent&) {
        if (!enabled_) {
            return;
        }
        update_mouse_position();
    }));
}

ParticleField& ParticleField::start(StartOptions opts) {
    if (destroyed_) {
        return *this;
    }

    if (!animating_ && (!opts.automatic || enabled_)) {
        enabled_ = true;
        animating_ = true;
        last_frame_ms_.reset();
        if (!pending_request_) {
            request_next_frame();
        }
    }

    // Entering the viewport starts it again.
    if (!in_viewport_ && options_.animation.start_on_enter) {
        animating_ = false;
    }

    return *this;
}

bool ParticleField::stop(StopOptions opts) {
    if (!opts.automatic) {
        enabled_ = false;
    }
    animating_ = false;
    if (opts.clear && surface_) {
        surface_->clear();
    }
    return true;
}

void ParticleField::destroy() {
    if (destroyed_) {
        return;
    }
    stop();

    viewport_.unobserve(surface_);
    subscriptions_.clear();
    if (pending_request_) {
        scheduler_.cancel_frame(*pending_request_);
        pending_request_.reset();
    }

    surface_->detach();
    store_.clear();
    surface_ = nullptr;
    destroyed_ = true;
}

particles::SimulationBox ParticleField::validated_box(const Options& options) const {
    const particles::SimulationBox box =
        particles::make_simulation_box(surface_->width(), surface_->height(), options.particles.connect_dist);
    if (options.particles.generation_type != GenerationType::Manual) {
        // Throws before any state is touched.
        (void)particles::ParticleStore::target_count(options.particles, box);
    }
    return box;
}

void ParticleField::resize_surface() {
    if (destroyed_) {
        return;
    }

    box_ = validated_box(options_);

    // Until the pointer moves again it must not act as if it sits at (0, 0).
    mouse_ = particles::MousePosition{};

    if (options_.particles.generation_type == GenerationType::New || store_.size() == 0) {
        store_.regenerate(options_.particles, box_);
    } else {
        store_.match_count(options_.particles, box_, true);
    }
    particles::refresh_visuals(store_.particles(), box_);

    if (animating_) {
        render_frame();
    }
}

void ParticleField::new_particles(NewParticlesOptions opts) {
    if (destroyed_) {
        return;
    }
    store_.regenerate(options_.particles, box_, opts.clear_manual);
    particles::refresh_visuals(store_.particles(), box_);
}

void ParticleField::match_particle_count(MatchOptions opts) {
    if (destroyed_) {
        return;
    }
    store_.match_count(options_.particles, box_, opts.update_bounds);
}

particles::Particle& ParticleField::create_particle(const particles::ParticleSeed& seed) {
    if (destroyed_) {
        throw std::logic_error("create_particle called on a destroyed field");
    }
    return store_.create_particle(options_.particles, box_, seed, true);
}

particles::Particle& ParticleField::create_particle(float x, float y, float dir, float speed, float size) {
    particles::ParticleSeed seed;
    seed.x = x;
    seed.y = y;
    seed.dir = dir;
    seed.speed = speed;
    seed.size = size;
    return create_particle(seed);
}

void ParticleField::set_background(const BackgroundInput& background) {
    if (destroyed_) {
        return;
    }
    options_.background = config::resolve_background(background);
    apply_background();
}

void ParticleField::set_mouse_connect_dist_mult(double connect_dist_mult) {
    const double mult = std::isnan(connect_dist_mult) ? config::kDefaultConnectDistMult : connect_dist_mult;
    options_.mouse.connect_dist_mult = static_cast<float>(mult);
    options_.mouse.connect_dist = config::resolve_mouse_connect_dist(options_.particles.connect_dist, mult);
}

void ParticleField::set_particle_color(const std::string& color) {
    std::vector<std::string> warnings;
    options_.particles.color = color;
    options_.particles.resolved_color = config::resolve_color(color, warnings);
    log_warnings(warnings);
}

void ParticleField::set_options(const OptionsInput& input) {
    if (destroyed_) {
        return;
    }
    std::vector<std::string> warnings;
    Options resolved = config::resolve_options(input, warnings);
    (void)validated_box(resolved);

    log_warnings(warnings);
    warnings_ = std::move(warnings);
    options_ = std::move(resolved);
    apply_background();
    resize_surface();
}

void ParticleField::handle_viewport_change(bool intersecting) {
    in_viewport_ = intersecting;
    if (intersecting) {
        if (options_.animation.start_on_enter) {
            start(StartOptions{true});
        }
    } else if (options_.animation.stop_on_leave) {
        // Keep the last frame on screen.
        stop(StopOptions{true, false});
    }
}

void ParticleField::animate(double timestamp_ms) {
    if (!animating_) {
        return;
    }

    // Scheduled before simulating so an exception thrown below does not end the loop.
    request_next_frame();

    const float step = compute_step(timestamp_ms);
    std::vector<particles::Particle>& state = store_.particles();
    particles::apply_gravity(state, options_, step);
    particles::integrate_particles(state, options_, box_, mouse_, default_random(), step);
    render_frame();
    ++frame_count_;
}

void ParticleField::request_next_frame() {
    pending_request_ = scheduler_.request_frame([this](double timestamp_ms) {
        pending_request_.reset();
        animate(timestamp_ms);
    });
}

void ParticleField::render_frame() {
    last_stats_ = particles::render(*surface_, store_.particles(), options_);
}

float ParticleField::compute_step(double timestamp_ms) {
    if (!last_frame_ms_) {
        last_frame_ms_ = timestamp_ms;
        last_step_ = 1.0f;
        return last_step_;
    }
    const double elapsed = std::clamp(timestamp_ms - *last_frame_ms_, 0.0, kMaxFrameMs);
    last_frame_ms_ = timestamp_ms;
    last_step_ = static_cast<float>(elapsed / kReferenceFrameMs);
    return last_step_;
}

void ParticleField::apply_background() {
    if (!surface_) {
        return;
    }
    if (!options_.background) {
        surface_->set_background(std::nullopt);
        return;
    }
    if (const auto color = parse_css_color(*options_.background)) {
        surface_->set_background(color->rgb);
        return;
    }
    std::clog << "[options] background '" << *options_.background
              << "' is not a plain color; drawing without a background" << std::endl;
    surface_->set_background(std::nullopt);
}

void ParticleField::update_mouse_position() {
    if (!client_position_) {
        return;
    }
    const SurfaceRect rect = surface_->bounding_rect();
    mouse_.x = static_cast<float>(client_position_->first - rect.left);
    mouse_.y = static_cast<float>(client_position_->second - rect.top);
}

void ParticleField::log_warnings(const std::vector<std::string>& warnings) {
    for (const std::string& warning : warnings) {
        std::clog << "[options] " << warning << std::endl;
    }
}

} // namespace plexus
