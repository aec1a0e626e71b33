#include <algorithm>
#include <chrono>
#include <clocale>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <cxxopts.hpp>
#include <notcurses/notcurses.h>

#include "config.h"
#include "events/event_bus.h"
#include "events/input_events.h"
#include "frame_scheduler.h"
#include "particle_field.h"
#include "presets.h"
#include "random.h"
#include "render/notcurses_surface.h"
#include "render/pixel_canvas.h"
#include "viewport_monitor.h"

namespace {

struct SurfaceSize {
    int width = 640;
    int height = 360;
};

std::optional<SurfaceSize> parse_size(const std::string& text) {
    const auto sep = text.find_first_of("xX");
    if (sep == std::string::npos) {
        return std::nullopt;
    }
    try {
        std::size_t processed = 0;
        const int width = std::stoi(text.substr(0, sep), &processed);
        if (processed != sep) {
            return std::nullopt;
        }
        const std::string rest = text.substr(sep + 1);
        const int height = std::stoi(rest, &processed);
        if (processed != rest.size() || width <= 0 || height <= 0) {
            return std::nullopt;
        }
        return SurfaceSize{width, height};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Runs the simulation without a terminal and reports the mean frame cost.
int run_headless(const plexus::OptionsInput& options, SurfaceSize size, int frames, double target_fps) {
    plexus::FrameScheduler scheduler;
    plexus::events::EventBus bus;
    plexus::ViewportMonitor viewport;
    plexus::render::PixelCanvas canvas(size.width, size.height);

    plexus::ParticleField field(&canvas, plexus::FieldHost{scheduler, bus, viewport}, options);
    viewport.refresh(plexus::SurfaceRect{0.0, 0.0, static_cast<double>(size.width), static_cast<double>(size.height)});
    field.start();

    const double frame_ms = 1000.0 / target_fps;
    const auto begin = std::chrono::steady_clock::now();
    for (int frame = 0; frame < frames; ++frame) {
        scheduler.run_frame(frame * frame_ms);
    }
    const auto end = std::chrono::steady_clock::now();

    const double total_ms = std::chrono::duration<double, std::milli>(end - begin).count();
    const auto& stats = field.last_frame_stats();
    std::clog << "[bench] " << frames << " frames, " << field.particles().size() << " particles, "
              << stats.lines_drawn << " lines in last frame, "
              << (frames > 0 ? total_ms / frames : 0.0) << " ms/frame" << std::endl;
    return 0;
}

plexus::SurfaceRect terminal_viewport(ncplane* stdplane, const plexus::render::BlitterGeometry& geometry) {
    unsigned int rows = 0;
    unsigned int cols = 0;
    ncplane_dim_yx(stdplane, &rows, &cols);
    return plexus::SurfaceRect{0.0,
                               0.0,
                               static_cast<double>(cols) * geometry.scale_x,
                               static_cast<double>(rows) * geometry.scale_y};
}

void draw_metrics(ncplane* plane, const plexus::ParticleField& field) {
    if (!plane) {
        return;
    }
    const auto& stats = field.last_frame_stats();
    std::ostringstream oss;
    oss << "particles " << field.particles().size() << "  lines " << stats.lines_drawn << "  step "
        << field.last_step() << (field.animating() ? "" : "  [paused]");
    ncplane_erase(plane);
    ncplane_putstr_yx(plane, 0, 0, oss.str().c_str());
}

} // namespace

int main(int argc, char** argv) {
    std::setlocale(LC_ALL, "");

    cxxopts::Options options("plexus", "Animated particle network for the terminal");
    options.add_options()
        ("c,config", "Path to configuration file", cxxopts::value<std::string>()->default_value("plexus.toml"))
        ("p,preset", "Built-in option preset (all, gravity, shapes, empty)", cxxopts::value<std::string>())
        ("seed", "Seed for the random source", cxxopts::value<std::uint32_t>())
        ("fps", "Target frames per second", cxxopts::value<double>())
        ("headless", "Simulate N frames without a terminal and report timings", cxxopts::value<int>())
        ("size", "Headless surface size in pixels (WxH)", cxxopts::value<std::string>()->default_value("640x360"))
        ("h,help", "Print usage");

    std::string config_path;
    std::string preset_override;
    std::optional<std::uint32_t> seed_override;
    std::optional<double> fps_override;
    std::optional<int> headless_frames;
    SurfaceSize headless_size{};

    try {
        const auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        config_path = result["config"].as<std::string>();

        if (result.count("preset")) {
            preset_override = result["preset"].as<std::string>();
        }
        if (result.count("seed")) {
            seed_override = result["seed"].as<std::uint32_t>();
        }
        if (result.count("fps")) {
            fps_override = result["fps"].as<double>();
            if (!(*fps_override > 0.0)) {
                std::cerr << "--fps must be positive" << std::endl;
                return 1;
            }
        }
        if (result.count("headless")) {
            headless_frames = result["headless"].as<int>();
            if (*headless_frames < 0) {
                std::cerr << "--headless expects a non-negative frame count" << std::endl;
                return 1;
            }
        }
        const auto size = parse_size(result["size"].as<std::string>());
        if (!size) {
            std::cerr << "--size expects WIDTHxHEIGHT" << std::endl;
            return 1;
        }
        headless_size = *size;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    }

    const plexus::ConfigLoadResult config_result = plexus::load_app_config(config_path);
    plexus::AppConfig config = config_result.config;
    if (!config_result.loaded_file) {
        std::clog << "[config] using built-in defaults (missing '" << config_path << "')" << std::endl;
    } else {
        std::clog << "[config] loaded '" << config_path << "'" << std::endl;
    }
    for (const std::string& warning : config_result.warnings) {
        std::cerr << "[config] " << warning << std::endl;
    }

    const std::string preset_name = preset_override.empty() ? config.visual.preset : preset_override;
    plexus::OptionsInput field_options = config.options;
    if (!preset_name.empty()) {
        const auto preset = plexus::find_preset(preset_name);
        if (!preset) {
            std::cerr << "[config] unknown preset '" << preset_name << "'" << std::endl;
            return 1;
        }
        // File options refine the preset.
        field_options = plexus::merge_options(*preset, config.options);
    }

    if (seed_override) {
        config.visual.seed = seed_override;
    }
    if (config.visual.seed) {
        plexus::default_random().seed(*config.visual.seed);
    }
    if (fps_override) {
        config.visual.target_fps = *fps_override;
    }

    if (headless_frames) {
        try {
            return run_headless(field_options, headless_size, *headless_frames, config.visual.target_fps);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to run benchmark: " << ex.what() << std::endl;
            return 1;
        }
    }

    auto geometry = plexus::render::blitter_geometry(config.visual.blitter);
    if (!geometry) {
        std::cerr << "[config] unknown blitter '" << config.visual.blitter << "', using braille" << std::endl;
        geometry = plexus::render::blitter_geometry("braille");
    }

    notcurses_options opts{};
    opts.flags = NCOPTION_SUPPRESS_BANNERS;
    notcurses* nc = notcurses_init(&opts, nullptr);
    if (!nc) {
        std::cerr << "Failed to initialize notcurses" << std::endl;
        return 1;
    }
    if (notcurses_mice_enable(nc, NCMICE_BUTTON_EVENT | NCMICE_DRAG_EVENT | NCMICE_MOVE_EVENT) != 0) {
        std::clog << "[input] mouse events unavailable" << std::endl;
    }

    ncplane* stdplane = notcurses_stdplane(nc);
    unsigned int term_rows = 0;
    unsigned int term_cols = 0;
    ncplane_dim_yx(stdplane, &term_rows, &term_cols);

    plexus::FrameScheduler scheduler;
    plexus::events::EventBus bus;
    plexus::ViewportMonitor viewport;

    std::unique_ptr<plexus::render::NotcursesSurface> surface;
    std::unique_ptr<plexus::ParticleField> field;
    std::string startup_error;
    try {
        surface = std::make_unique<plexus::render::NotcursesSurface>(nc, *geometry, term_rows, term_cols);
        field = std::make_unique<plexus::ParticleField>(surface.get(),
                                                        plexus::FieldHost{scheduler, bus, viewport},
                                                        field_options);
    } catch (const std::exception& ex) {
        startup_error = ex.what();
    }
    if (!field) {
        surface.reset();
        notcurses_stop(nc);
        std::cerr << "Failed to create particle field: " << startup_error << std::endl;
        return 1;
    }

    ncplane* metrics_plane = nullptr;
    if (config.runtime.show_metrics) {
        ncplane_options metrics_opts{};
        metrics_opts.rows = 1;
        metrics_opts.cols = std::max(term_cols, 1u);
        metrics_plane = ncplane_create(stdplane, &metrics_opts);
    }

    viewport.refresh(terminal_viewport(stdplane, *geometry));
    field->start();

    const std::chrono::duration<double> frame_time(1.0 / config.visual.target_fps);
    const auto start_time = std::chrono::steady_clock::now();
    bool running = true;

    auto scroll_by = [&](int rows) {
        surface->move_cells(surface->cell_y() + rows, surface->cell_x());
        bus.publish(plexus::events::ScrollEvent{});
        viewport.refresh(terminal_viewport(stdplane, *geometry));
    };

    while (running) {
        const auto now = std::chrono::steady_clock::now();
        const double time_ms = std::chrono::duration<double, std::milli>(now - start_time).count();

        scheduler.run_frame(time_ms);
        if (!surface->present()) {
            std::cerr << "[render] blit failed" << std::endl;
        }
        if (metrics_plane) {
            draw_metrics(metrics_plane, *field);
        }

        if (notcurses_render(nc) != 0) {
            std::cerr << "Failed to render frame" << std::endl;
            break;
        }

        ncinput input{};
        const timespec ts{0, 0};
        uint32_t key = 0;
        while ((key = notcurses_get(nc, &ts, &input)) != 0) {
            if (key == static_cast<uint32_t>(-1)) {
                running = false;
                break;
            }
            if (key == 'q' || key == 'Q') {
                running = false;
                break;
            }
            if (input.evtype == NCTYPE_RELEASE) {
                continue;
            }

            if (nckey_mouse_p(key)) {
                const auto [client_x, client_y] = surface->cell_to_client(input.y, input.x);
                bus.publish(plexus::events::PointerMovedEvent{client_x, client_y});
                if (key == NCKEY_BUTTON1 && input.evtype == NCTYPE_PRESS) {
                    const plexus::SurfaceRect rect = surface->bounding_rect();
                    plexus::particles::ParticleSeed seed;
                    seed.x = static_cast<float>(client_x - rect.left);
                    seed.y = static_cast<float>(client_y - rect.top);
                    field->create_particle(seed);
                }
                continue;
            }

            if (key == ' ') {
                if (field->enabled()) {
                    field->stop();
                } else {
                    field->start();
                }
            } else if (key == 'r' || key == 'R') {
                field->new_particles();
            } else if (key == NCKEY_UP) {
                scroll_by(1);
            } else if (key == NCKEY_DOWN) {
                scroll_by(-1);
            } else if (key == NCKEY_PGUP) {
                scroll_by(static_cast<int>(term_rows) / 2);
            } else if (key == NCKEY_PGDOWN) {
                scroll_by(-static_cast<int>(term_rows) / 2);
            } else if (key == NCKEY_RESIZE) {
                ncplane_dim_yx(stdplane, &term_rows, &term_cols);
                surface->resize_cells(term_rows, term_cols);
                try {
                    bus.publish(plexus::events::SurfaceResizedEvent{surface.get(), surface->width(), surface->height()});
                } catch (const std::exception& ex) {
                    std::cerr << "[options] resize rejected: " << ex.what() << std::endl;
                }
                viewport.refresh(terminal_viewport(stdplane, *geometry));
            }
        }

        const auto frame_end = std::chrono::steady_clock::now();
        if (frame_end - now < frame_time) {
            std::this_thread::sleep_for(frame_time - (frame_end - now));
        }
    }

    field->destroy();
    field.reset();
    surface.reset();
    if (metrics_plane) {
        ncplane_destroy(metrics_plane);
    }

    if (notcurses_stop(nc) != 0) {
        std::cerr << "Failed to stop notcurses cleanly" << std::endl;
        return 1;
    }

    return 0;
}
