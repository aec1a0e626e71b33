#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "events/event_bus.h"
#include "events/input_events.h"
#include "frame_scheduler.h"
#include "particle_field.h"
#include "recording_surface.h"
#include "viewport_monitor.h"

using plexus::BackgroundInput;
using plexus::FieldHost;
using plexus::OptionsInput;
using plexus::ParticleField;
using plexus::StartOptions;
using plexus::StopOptions;
using plexus::testing::RecordingSurface;

namespace {

class ParticleFieldTest : public ::testing::Test {
protected:
    FieldHost host() { return FieldHost{scheduler, bus, viewport}; }

    plexus::FrameScheduler scheduler;
    plexus::events::EventBus bus;
    plexus::ViewportMonitor viewport;
    RecordingSurface surface{800, 600};
};

} // namespace

TEST_F(ParticleFieldTest, NullSurfaceIsRejected) {
    EXPECT_THROW(ParticleField(nullptr, host()), std::invalid_argument);
}

TEST_F(ParticleFieldTest, InvalidBackgroundIsRejected) {
    OptionsInput input;
    input.background = BackgroundInput{true};
    EXPECT_THROW(ParticleField(&surface, host(), input), std::invalid_argument);
}

TEST_F(ParticleFieldTest, ConstructionPopulatesToTargetCount) {
    ParticleField field(&surface, host());
    EXPECT_EQ(field.particles().size(), 99u); // 100 ppm over 1100 x 900
    EXPECT_FALSE(field.animating());
    EXPECT_FALSE(field.enabled());
    EXPECT_TRUE(viewport.observing(&surface));
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(ParticleFieldTest, ManualOnlyFieldKeepsCreatedParticle) {
    OptionsInput input;
    input.mouse.interaction_type = 0;
    input.particles.max = 0;
    input.particles.generation_type = 0;

    ParticleField field(&surface, host(), input);
    ASSERT_TRUE(field.particles().empty());

    field.create_particle(10.0f, 10.0f, 0.0f, 1.0f, 5.0f);
    field.match_particle_count();
    field.match_particle_count({true});

    ASSERT_EQ(field.particles().size(), 1u);
    EXPECT_TRUE(field.particles()[0].is_manual);
    EXPECT_FLOAT_EQ(field.particles()[0].size, 5.0f);
}

TEST_F(ParticleFieldTest, StartSchedulesExactlyOneFrame) {
    ParticleField field(&surface, host());
    field.start();
    field.start();
    EXPECT_TRUE(field.animating());
    EXPECT_TRUE(field.enabled());
    EXPECT_EQ(scheduler.pending(), 1u);

    scheduler.run_frame(1000.0);
    EXPECT_EQ(field.frame_count(), 1u);
    EXPECT_FLOAT_EQ(field.last_step(), 1.0f);
    EXPECT_EQ(scheduler.pending(), 1u);
}

TEST_F(ParticleFieldTest, StepIsNormalizedAndClamped) {
    ParticleField field(&surface, host());
    field.start();

    scheduler.run_frame(0.0);
    scheduler.run_frame(ParticleField::kReferenceFrameMs / 2.0);
    EXPECT_NEAR(field.last_step(), 0.5f, 1e-5f);

    scheduler.run_frame(500.0);
    EXPECT_NEAR(field.last_step(), 1.2f, 1e-5f);
}

TEST_F(ParticleFieldTest, StopTurnsPendingFrameIntoNoop) {
    ParticleField field(&surface, host());
    field.start();
    surface.reset_counters();

    EXPECT_TRUE(field.stop());
    EXPECT_FALSE(field.enabled());
    EXPECT_EQ(surface.clears, 1u);

    scheduler.run_frame(16.0);
    EXPECT_EQ(field.frame_count(), 0u);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(ParticleFieldTest, StopWithoutClearKeepsLastFrame) {
    ParticleField field(&surface, host());
    field.start();
    surface.reset_counters();

    field.stop(StopOptions{false, false});
    EXPECT_EQ(surface.clears, 0u);
}

TEST_F(ParticleFieldTest, LeavingViewportPausesAndEnteringResumes) {
    ParticleField field(&surface, host());
    field.start();

    viewport.notify(&surface, false);
    EXPECT_FALSE(field.animating());
    EXPECT_TRUE(field.enabled());

    viewport.notify(&surface, true);
    EXPECT_TRUE(field.animating());
    EXPECT_EQ(scheduler.pending(), 1u);
}

TEST_F(ParticleFieldTest, ExplicitStopIsNotUndoneByViewport) {
    ParticleField field(&surface, host());
    field.start();
    field.stop();

    viewport.notify(&surface, false);
    viewport.notify(&surface, true);
    EXPECT_FALSE(field.animating());
    EXPECT_FALSE(field.enabled());
}

TEST_F(ParticleFieldTest, StartOutsideViewportWaitsForEntry) {
    ParticleField field(&surface, host());
    viewport.notify(&surface, false);

    field.start();
    EXPECT_TRUE(field.enabled());
    EXPECT_FALSE(field.animating());

    viewport.notify(&surface, true);
    EXPECT_TRUE(field.animating());
}

TEST_F(ParticleFieldTest, ViewportIgnoredWhenBothFlagsAreOff) {
    OptionsInput input;
    input.animation.start_on_enter = false;
    input.animation.stop_on_leave = false;
    ParticleField field(&surface, host(), input);
    field.start();

    viewport.notify(&surface, false);
    EXPECT_TRUE(field.animating());

    field.stop();
    viewport.notify(&surface, true);
    EXPECT_FALSE(field.animating());
}

TEST_F(ParticleFieldTest, ViewportRefreshUsesSurfaceRect) {
    ParticleField field(&surface, host());
    surface.set_rect(0.0, 0.0);
    field.start();

    viewport.refresh(plexus::SurfaceRect{0.0, 1000.0, 800.0, 600.0});
    EXPECT_FALSE(field.animating());

    surface.set_rect(0.0, 900.0);
    viewport.refresh(plexus::SurfaceRect{0.0, 1000.0, 800.0, 600.0});
    EXPECT_TRUE(field.animating());
}

TEST_F(ParticleFieldTest, ResizeMatchesCountAndKeepsManualParticles) {
    ParticleField field(&surface, host());
    field.create_particle(plexus::particles::ParticleSeed{});

    surface.resize(400, 300);
    bus.publish(plexus::events::SurfaceResizedEvent{&surface, 400, 300});

    // 100 ppm over 700 x 600
    EXPECT_EQ(field.store().auto_count(), 42u);
    EXPECT_EQ(field.store().manual_count(), 1u);
    EXPECT_FLOAT_EQ(field.box().width, 700.0f);
    EXPECT_FLOAT_EQ(field.particles().back().bounds.right, 400.0f + field.particles().back().size);
    EXPECT_TRUE(std::isinf(field.mouse().x));
}

TEST_F(ParticleFieldTest, ResizeEventForOtherSurfaceIsIgnored) {
    ParticleField field(&surface, host());
    RecordingSurface other(10, 10);
    bus.publish(plexus::events::SurfaceResizedEvent{&other, 10, 10});
    EXPECT_EQ(field.particles().size(), 99u);
}

TEST_F(ParticleFieldTest, RegeneratePolicyReplacesAutomaticParticles) {
    OptionsInput input;
    input.particles.regenerate_on_resize = true;
    ParticleField field(&surface, host(), input);
    const float first_x = field.particles().front().pos_x;

    field.resize_surface();
    EXPECT_EQ(field.particles().size(), 99u);
    EXPECT_NE(field.particles().front().pos_x, first_x);
}

TEST_F(ParticleFieldTest, ResizeWhileAnimatingRendersOnce) {
    ParticleField field(&surface, host());
    field.start();
    surface.reset_counters();

    field.resize_surface();
    EXPECT_EQ(surface.clears, 1u);
}

TEST_F(ParticleFieldTest, InvalidResizeLeavesFieldUnchanged) {
    ParticleField field(&surface, host());
    const auto count = field.particles().size();
    const float box_width = field.box().width;

    field.options().particles.ppm = std::numeric_limits<float>::infinity();
    field.options().particles.max = std::numeric_limits<float>::infinity();
    surface.resize(1000, 1000);

    EXPECT_THROW(field.resize_surface(), std::range_error);
    EXPECT_EQ(field.particles().size(), count);
    EXPECT_FLOAT_EQ(field.box().width, box_width);
}

TEST_F(ParticleFieldTest, UnboundedMaxIsClampedBySetOptions) {
    ParticleField field(&surface, host());

    OptionsInput input;
    input.particles.max = std::numeric_limits<double>::infinity();
    field.set_options(input);

    EXPECT_FLOAT_EQ(field.options().particles.max, static_cast<float>(plexus::kMaxParticleCount));
    EXPECT_EQ(field.particles().size(),
              plexus::particles::ParticleStore::target_count(field.options().particles, field.box()));
}

TEST_F(ParticleFieldTest, SetOptionsRederivesCount) {
    ParticleField field(&surface, host());
    OptionsInput input;
    input.particles.max = 10;
    input.particles.connect_distance = -5;
    field.set_options(input);

    EXPECT_EQ(field.particles().size(), 10u);
    EXPECT_FLOAT_EQ(field.options().particles.connect_dist, 1.0f);
    EXPECT_EQ(field.warnings().size(), 1u);
}

TEST_F(ParticleFieldTest, PointerIsIgnoredUntilEnabled) {
    ParticleField field(&surface, host());
    surface.set_rect(50.0, 20.0);

    bus.publish(plexus::events::PointerMovedEvent{150.0, 120.0});
    EXPECT_TRUE(std::isinf(field.mouse().x));

    field.start();
    bus.publish(plexus::events::PointerMovedEvent{150.0, 120.0});
    EXPECT_FLOAT_EQ(field.mouse().x, 100.0f);
    EXPECT_FLOAT_EQ(field.mouse().y, 100.0f);

    surface.set_rect(50.0, 70.0);
    bus.publish(plexus::events::ScrollEvent{});
    EXPECT_FLOAT_EQ(field.mouse().y, 50.0f);
}

TEST_F(ParticleFieldTest, SettersUpdateResolvedState) {
    ParticleField field(&surface, host());

    field.set_background(BackgroundInput{std::string{"#ff0000"}});
    ASSERT_TRUE(surface.background.has_value());
    EXPECT_EQ(*surface.background, (plexus::Rgb{255, 0, 0}));

    field.set_background(BackgroundInput{false});
    EXPECT_FALSE(surface.background.has_value());
    EXPECT_THROW(field.set_background(BackgroundInput{1.0}), std::invalid_argument);

    field.set_mouse_connect_dist_mult(0.5);
    EXPECT_FLOAT_EQ(field.options().mouse.connect_dist, 75.0f);

    field.set_particle_color("rgba(0,128,255,0.5)");
    EXPECT_EQ(field.options().particles.resolved_color.hex, "#0080ff");
    EXPECT_NEAR(field.options().particles.resolved_color.alpha, 0.5f, 1e-6f);
}

TEST_F(ParticleFieldTest, NewParticlesOptionallyClearsManual) {
    ParticleField field(&surface, host());
    field.create_particle(1.0f, 2.0f, 0.0f, 1.0f, 1.0f);

    field.new_particles();
    EXPECT_EQ(field.store().manual_count(), 1u);
    field.new_particles({true});
    EXPECT_EQ(field.store().manual_count(), 0u);
    EXPECT_EQ(field.particles().size(), 99u);
}

TEST_F(ParticleFieldTest, DestroyReleasesEverything) {
    ParticleField field(&surface, host());
    field.start();

    field.destroy();
    EXPECT_TRUE(field.destroyed());
    EXPECT_FALSE(field.animating());
    EXPECT_TRUE(surface.detached);
    EXPECT_TRUE(field.particles().empty());
    EXPECT_FALSE(viewport.observing(&surface));
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_EQ(bus.subscriber_count<plexus::events::PointerMovedEvent>(), 0u);

    field.start();
    EXPECT_FALSE(field.animating());

    OptionsInput input;
    input.particles.max = 10;
    EXPECT_NO_THROW(field.set_background(BackgroundInput{std::string("#fff")}));
    EXPECT_NO_THROW(field.set_options(input));
    EXPECT_TRUE(field.particles().empty());
    EXPECT_EQ(field.surface(), nullptr);
}

TEST_F(ParticleFieldTest, DestructorCancelsPendingFrame) {
    {
        auto field = std::make_unique<ParticleField>(&surface, host());
        field->start();
        ASSERT_EQ(scheduler.pending(), 1u);
    }
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(viewport.observing(&surface));
    EXPECT_EQ(scheduler.run_frame(0.0), 0u);
}

TEST_F(ParticleFieldTest, RawOptionEditsApplyOnNextFrame) {
    ParticleField field(&surface, host());
    field.start();
    field.options().particles.draw_lines = false;

    scheduler.run_frame(0.0);
    EXPECT_EQ(field.last_frame_stats().lines_drawn, 0u);
}
