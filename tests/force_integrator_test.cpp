#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "config.h"
#include "particles/force_integrator.h"
#include "particles/particle_store.h"
#include "random.h"

using plexus::InteractionType;
using plexus::Options;
using plexus::Random;
using plexus::particles::GridPos;
using plexus::particles::MousePosition;
using plexus::particles::Particle;
using plexus::particles::ParticleStore;
using plexus::particles::SimulationBox;
using plexus::particles::apply_gravity;
using plexus::particles::classify_grid;
using plexus::particles::integrate_particles;
using plexus::particles::make_simulation_box;
using plexus::particles::wrap_coordinate;

namespace {

Particle still_particle(float pos_x, float pos_y) {
    Particle particle;
    particle.pos_x = pos_x;
    particle.pos_y = pos_y;
    particle.speed = 0.0f;
    return particle;
}

} // namespace

TEST(ForceIntegratorTest, WrapCoordinateIsEuclideanModulo) {
    EXPECT_FLOAT_EQ(wrap_coordinate(5.0f, 10.0f), 5.0f);
    EXPECT_FLOAT_EQ(wrap_coordinate(12.5f, 10.0f), 2.5f);
    EXPECT_FLOAT_EQ(wrap_coordinate(-2.5f, 10.0f), 7.5f);
    EXPECT_FLOAT_EQ(wrap_coordinate(10.0f, 10.0f), 0.0f);
    EXPECT_LT(wrap_coordinate(-1e-9f, 10.0f), 10.0f);
}

TEST(ForceIntegratorTest, PositionsStayInsideBoxAfterIntegration) {
    Options options;
    options.particles.rel_speed = 40.0f;
    options.mouse.interaction_type = InteractionType::Move;
    Random random(21u);
    ParticleStore store(random);
    const SimulationBox box = make_simulation_box(320, 200, options.particles.connect_dist);
    options.particles.max = 150.0f;
    options.particles.ppm = 1000.0f;
    store.regenerate(options.particles, box);

    MousePosition mouse{100.0f, 80.0f};
    for (int frame = 0; frame < 50; ++frame) {
        integrate_particles(store.particles(), options, box, mouse, random, 1.2f);
        for (const Particle& particle : store.particles()) {
            ASSERT_GE(particle.pos_x, 0.0f);
            ASSERT_LT(particle.pos_x, box.width);
            ASSERT_GE(particle.pos_y, 0.0f);
            ASSERT_LT(particle.pos_y, box.height);
        }
    }
}

TEST(ForceIntegratorTest, FrictionDecaysGravityVelocity) {
    Options options;
    options.gravity.friction = 0.8f;
    options.particles.rotation_speed = 0.0f;
    options.mouse.interaction_type = InteractionType::None;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(1u);

    std::vector<Particle> particles{still_particle(100.0f, 100.0f)};
    particles[0].vel_x = 4.0f;
    particles[0].vel_y = -3.0f;

    float previous = std::hypot(particles[0].vel_x, particles[0].vel_y);
    for (int frame = 0; frame < 10; ++frame) {
        apply_gravity(particles, options, 1.0f);
        integrate_particles(particles, options, box, MousePosition{}, random, 1.0f);
        const float speed = std::hypot(particles[0].vel_x, particles[0].vel_y);
        EXPECT_LT(speed, previous);
        previous = speed;
    }
    EXPECT_NEAR(particles[0].vel_x, 4.0f * std::pow(0.8f, 10.0f), 1e-4f);
}

TEST(ForceIntegratorTest, RepulsionPushesCloseParticlesApart) {
    Options options;
    options.particles.connect_dist = 100.0f;
    options.gravity.repulsive = 1.0f;

    std::vector<Particle> particles{still_particle(100.0f, 100.0f), still_particle(110.0f, 100.0f)};
    apply_gravity(particles, options, 1.0f);

    EXPECT_LT(particles[0].vel_x, 0.0f);
    EXPECT_GT(particles[1].vel_x, 0.0f);
    EXPECT_FLOAT_EQ(particles[0].vel_x, -particles[1].vel_x);
    EXPECT_LE(particles[1].vel_x, 100.0f * plexus::particles::kMaxGravityRatio + 1e-5f);
}

TEST(ForceIntegratorTest, RepulsionIgnoresFarPairsButPullingDoesNot) {
    Options options;
    options.particles.connect_dist = 100.0f;
    options.gravity.repulsive = 1.0f;

    std::vector<Particle> particles{still_particle(0.0f, 0.0f), still_particle(80.0f, 0.0f)};
    apply_gravity(particles, options, 1.0f);
    EXPECT_FLOAT_EQ(particles[0].vel_x, 0.0f);

    options.gravity.repulsive = 0.0f;
    options.gravity.pulling = 1.0f;
    apply_gravity(particles, options, 1.0f);
    EXPECT_GT(particles[0].vel_x, 0.0f);
    EXPECT_LT(particles[1].vel_x, 0.0f);
}

TEST(ForceIntegratorTest, GravityScalesWithStep) {
    Options options;
    options.particles.connect_dist = 100.0f;
    options.gravity.pulling = 0.5f;

    std::vector<Particle> once{still_particle(0.0f, 0.0f), still_particle(200.0f, 0.0f)};
    std::vector<Particle> doubled = once;
    apply_gravity(once, options, 1.0f);
    apply_gravity(doubled, options, 2.0f);
    EXPECT_NEAR(doubled[0].vel_x, once[0].vel_x * 2.0f, 1e-6f);
}

TEST(ForceIntegratorTest, CoincidentParticlesStayFinite) {
    Options options;
    options.gravity.repulsive = 5.0f;
    options.gravity.pulling = 5.0f;

    std::vector<Particle> particles{still_particle(50.0f, 50.0f), still_particle(50.0f, 50.0f)};
    apply_gravity(particles, options, 1.0f);
    EXPECT_TRUE(std::isfinite(particles[0].vel_x));
    EXPECT_TRUE(std::isfinite(particles[1].vel_y));
}

TEST(ForceIntegratorTest, ShiftModeDisplacesNearbyParticleWithoutMovingIt) {
    Options options;
    options.particles.rotation_speed = 0.0f;
    options.mouse.interaction_type = InteractionType::Shift;
    options.mouse.connect_dist = 100.0f;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(4u);

    // Surface (200, 200), 20 px right of the mouse.
    std::vector<Particle> particles{still_particle(200.0f - box.off_x, 200.0f - box.off_y)};
    const MousePosition mouse{180.0f, 200.0f};
    for (int frame = 0; frame < 60; ++frame) {
        integrate_particles(particles, options, box, mouse, random, 1.0f);
    }

    EXPECT_FLOAT_EQ(particles[0].pos_x, 200.0f - box.off_x);
    EXPECT_NEAR(particles[0].x - mouse.x, 100.0f, 0.5f);
    EXPECT_NEAR(particles[0].y, 200.0f, 0.5f);
}

TEST(ForceIntegratorTest, MoveModeCommitsDisplacementToPosition) {
    Options options;
    options.particles.rotation_speed = 0.0f;
    options.mouse.interaction_type = InteractionType::Move;
    options.mouse.connect_dist = 100.0f;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(4u);

    const float start_x = 200.0f - box.off_x;
    const float start_y = 200.0f - box.off_y;
    std::vector<Particle> particles{still_particle(start_x, start_y)};
    const MousePosition mouse{180.0f, 200.0f};
    integrate_particles(particles, options, box, mouse, random, 1.0f);

    // Pushed away from the mouse, along +x only.
    EXPECT_GT(particles[0].pos_x, start_x);
    EXPECT_NEAR(particles[0].pos_y, start_y, 1e-3f);
    EXPECT_FLOAT_EQ(particles[0].x, particles[0].pos_x + box.off_x);
}

TEST(ForceIntegratorTest, NoneModeIgnoresMouse) {
    Options options;
    options.particles.rotation_speed = 0.0f;
    options.mouse.interaction_type = InteractionType::None;
    options.mouse.connect_dist = 100.0f;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(4u);

    const float start_x = 200.0f - box.off_x;
    std::vector<Particle> particles{still_particle(start_x, 200.0f - box.off_y)};
    const MousePosition mouse{180.0f, 200.0f};
    for (int frame = 0; frame < 10; ++frame) {
        integrate_particles(particles, options, box, mouse, random, 1.0f);
    }

    EXPECT_FLOAT_EQ(particles[0].off_x, 0.0f);
    EXPECT_FLOAT_EQ(particles[0].off_y, 0.0f);
    EXPECT_FLOAT_EQ(particles[0].pos_x, start_x);
    EXPECT_FLOAT_EQ(particles[0].x, 200.0f);
}

TEST(ForceIntegratorTest, SwitchingToNoneModeRelaxesLeftoverOffset) {
    Options options;
    options.particles.rotation_speed = 0.0f;
    options.mouse.connect_dist = 100.0f;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(4u);

    std::vector<Particle> particles{still_particle(200.0f - box.off_x, 200.0f - box.off_y)};
    const MousePosition mouse{180.0f, 200.0f};
    for (int frame = 0; frame < 30; ++frame) {
        integrate_particles(particles, options, box, mouse, random, 1.0f);
    }
    ASSERT_GT(particles[0].off_x, 50.0f);

    options.mouse.interaction_type = InteractionType::None;
    for (int frame = 0; frame < 40; ++frame) {
        integrate_particles(particles, options, box, mouse, random, 1.0f);
    }
    EXPECT_NEAR(particles[0].off_x, 0.0f, 0.01f);
    EXPECT_NEAR(particles[0].x, 200.0f, 0.01f);
}

TEST(ForceIntegratorTest, OffsetRelaxesOnceMouseLeaves) {
    Options options;
    options.particles.rotation_speed = 0.0f;
    options.mouse.connect_dist = 100.0f;
    const SimulationBox box = make_simulation_box(400, 400, 150.0f);
    Random random(4u);

    std::vector<Particle> particles{still_particle(200.0f, 200.0f)};
    particles[0].off_x = 30.0f;
    for (int frame = 0; frame < 40; ++frame) {
        integrate_particles(particles, options, box, MousePosition{}, random, 1.0f);
    }
    EXPECT_NEAR(particles[0].off_x, 0.0f, 0.01f);
}

TEST(ForceIntegratorTest, GridClassification) {
    Particle particle;
    particle.bounds = {-1.0f, 101.0f, 51.0f, -1.0f};

    particle.x = 50.0f;
    particle.y = 25.0f;
    EXPECT_EQ(classify_grid(particle), (GridPos{1, 1}));

    particle.x = -5.0f;
    particle.y = 60.0f;
    EXPECT_EQ(classify_grid(particle), (GridPos{0, 2}));

    particle.x = 120.0f;
    particle.y = -3.0f;
    EXPECT_EQ(classify_grid(particle), (GridPos{2, 0}));
}
