#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/math_util.hpp"
#include "../src/components.hpp"
#include "../src/events.hpp"
#include "../src/debug_panel.hpp"
#include "../src/pipeline.hpp"
#include "../src/modules/event_bus_module.hpp"
#include "../src/systems/camera.hpp"
#include "../src/systems/character_input.hpp"
#include <ecs/ecs.hpp>
#include <cmath>
#include <limits>
#include <string>

// components.hpp and the movement systems are free of engine-library
// dependencies, so everything here runs without linking Jolt or Raylib.

using namespace strafe::math;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Angle Normalization", "[math]") {
    const float pi = kPi;

    SECTION("Inside range") {
        CHECK_THAT(normalize_angle(1.0f), WithinRel(1.0f));
        CHECK_THAT(normalize_angle(-1.0f), WithinRel(-1.0f));
    }

    SECTION("Outside range (positive)") {
        CHECK_THAT(normalize_angle(1.5f * pi), WithinRel(-0.5f * pi));
        CHECK_THAT(normalize_angle(3.0f * pi), WithinRel(pi));
    }

    SECTION("Outside range (negative)") {
        CHECK_THAT(normalize_angle(-1.5f * pi), WithinRel(0.5f * pi));
        CHECK_THAT(normalize_angle(-3.0f * pi), WithinRel(-pi));
    }
}

TEST_CASE("Pitch clamp stays short of vertical", "[math]") {
    const float limit = 0.5f * kPi - kPitchMargin;

    CHECK_THAT(clamp_pitch(0.3f),  WithinRel(0.3f));
    CHECK_THAT(clamp_pitch(2.0f),  WithinRel(limit));
    CHECK_THAT(clamp_pitch(-9.0f), WithinRel(-limit));
}

TEST_CASE("Yaw basis vectors", "[math]") {
    SECTION("Yaw 0 looks down -Z with +X on the right") {
        ecs::Vec3 f = yaw_forward(0.0f);
        ecs::Vec3 r = yaw_right(0.0f);
        CHECK_THAT(f.z, WithinAbs(-1.0f, 1e-6f));
        CHECK_THAT(r.x, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("Forward and right are perpendicular at any yaw") {
        for (float yaw : {-2.0f, 0.4f, 1.9f, 3.0f}) {
            CHECK_THAT(dot_xz(yaw_forward(yaw), yaw_right(yaw)), WithinAbs(0.0f, 1e-6f));
        }
    }

    SECTION("Pitch tilts the view vector up") {
        ecs::Vec3 v = view_forward(0.0f, 0.5f);
        CHECK(v.y > 0.0f);
        CHECK_THAT(length(v), WithinAbs(1.0f, 1e-5f));
    }
}

// ---------------------------------------------------------------------------
// Move input validation
// ---------------------------------------------------------------------------

TEST_CASE("sanitize_move_input", "[math][input]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    SECTION("Non-finite axes become zero") {
        ecs::Vec3 v = sanitize_move_input({nan, 0.0f, -inf});
        CHECK(v.x == 0.0f);
        CHECK(v.z == 0.0f);
    }

    SECTION("Axes are clamped to [-1, 1]") {
        ecs::Vec3 v = sanitize_move_input({5.0f, 0.0f, 0.0f});
        CHECK(v.x == 1.0f);
        CHECK(v.z == 0.0f);
    }

    SECTION("Diagonals are normalized to unit length") {
        ecs::Vec3 v = sanitize_move_input({1.0f, 0.0f, -1.0f});
        CHECK_THAT(horizontal_length(v), WithinAbs(1.0f, 1e-6f));
        CHECK_THAT(v.x, WithinAbs(0.70710678f, 1e-6f));
    }

    SECTION("Short vectors keep their magnitude") {
        ecs::Vec3 v = sanitize_move_input({0.3f, 0.0f, 0.4f});
        CHECK_THAT(horizontal_length(v), WithinAbs(0.5f, 1e-6f));
    }

    SECTION("Y is unused") {
        CHECK(sanitize_move_input({0.0f, 7.0f, 0.0f}).y == 0.0f);
    }
}

// ---------------------------------------------------------------------------
// CharacterInputSystem / CameraSystem
// ---------------------------------------------------------------------------

TEST_CASE("apply_look — yaw wraps and pitch clamps", "[character_input]") {
    CharacterState state{};
    state.yaw = 3.0f;

    CharacterInputSystem::apply_look({0.5f, 4.0f}, state);

    CHECK_THAT(state.yaw,   WithinAbs(3.5f - 2.0f * kPi, 1e-5f));
    CHECK_THAT(state.pitch, WithinAbs(0.5f * kPi - kPitchMargin, 1e-6f));
}

TEST_CASE("make_intent — copies the press and sanitizes movement", "[character_input]") {
    PlayerInput input{};
    input.move_input    = {2.0f, 0.0f, -2.0f};
    input.sprint_held   = true;
    input.jump_pressed  = true;
    input.jump_press_ms = 1234.0;

    CharacterIntent intent = CharacterInputSystem::make_intent(input);

    CHECK_THAT(horizontal_length(intent.move_input), WithinAbs(1.0f, 1e-6f));
    CHECK(intent.sprint);
    CHECK(intent.jump_pressed);
    CHECK(intent.jump_press_ms == 1234.0);
}

TEST_CASE("CameraSystem::place — eye height and view direction", "[camera]") {
    CharacterState state{};
    state.position = {1.0f, 2.0f, 3.0f};
    MainCamera cam;

    CameraSystem::place(state, 1.6f, cam);

    CHECK_THAT(cam.position.y, WithinAbs(3.6f, 1e-5f));
    CHECK_THAT(cam.target.x,   WithinAbs(1.0f, 1e-5f));
    CHECK_THAT(cam.target.z,   WithinAbs(2.0f, 1e-5f));
    CHECK_THAT(cam.forward.z,  WithinAbs(-1.0f, 1e-6f));
}

// ---------------------------------------------------------------------------
// TickClock
// ---------------------------------------------------------------------------

TEST_CASE("TickClock — advance accumulates milliseconds and ticks", "[clock]") {
    TickClock clock;
    clock.advance(0.5f);
    clock.advance(0.25f);

    CHECK(clock.now_ms == 750.0);
    CHECK(clock.tick == 2);
    CHECK(clock.dt == 0.25f);
}

// ---------------------------------------------------------------------------
// Events<T>
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;

    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    REQUIRE(queue.size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events — clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();

    CHECK(queue.empty());
    CHECK(queue.read().empty());
}

TEST_CASE("EventRegistry — registration is idempotent and flush clears", "[events]") {
    ecs::World world;
    EventRegistry registry;

    registry.register_queue<TestEvent>(world);
    registry.register_queue<TestEvent>(world);
    registry.register_queue<JumpEvent>(world);
    CHECK(registry.queue_count() == 2);

    world.resource<Events<TestEvent>>().send({3});
    REQUIRE(world.resource<Events<TestEvent>>().size() == 1);

    registry.flush_all();
    CHECK(world.resource<Events<TestEvent>>().empty());
}

TEST_CASE("EventBusModule — movement queues exist and flush before input", "[events]") {
    ecs::World world;
    strafe::Pipeline pipeline;
    EventBusModule::install(world, pipeline);

    REQUIRE(world.try_resource<Events<JumpEvent>>());
    REQUIRE(world.try_resource<Events<LandEvent>>());
    CHECK(world.resource<EventRegistry>().queue_count() == 2);

    world.resource<Events<LandEvent>>().send({world.create(), 250.0});
    pipeline.update(world, 0.01f, true);

    CHECK(world.resource<Events<LandEvent>>().empty());
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — watch creates section and row", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine", "FPS", []() { return std::string("60"); });

    REQUIRE(panel.sections().size() == 1);
    CHECK(panel.sections()[0].title == "Engine");
    REQUIRE(panel.sections()[0].rows.size() == 1);
    CHECK(panel.sections()[0].rows[0].label == "FPS");
    CHECK(panel.sections()[0].rows[0].fn() == "60");
}

TEST_CASE("DebugPanel — multiple sections ordered by insertion", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",    "FPS",      []() { return std::string("60"); });
    panel.watch("Character", "Grounded", []() { return std::string("yes"); });
    panel.watch("Engine",    "Tick",     []() { return std::string("12"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[1].title == "Character");
    CHECK(panel.sections()[0].rows.size() == 2);
    CHECK(panel.row_count() == 3);
}

TEST_CASE("DebugPanel — provider is called and returns current value", "[debug]") {
    int counter = 0;
    DebugPanel panel;
    panel.watch("Test", "Count", [&counter]() { return std::to_string(counter); });

    CHECK(panel.sections()[0].rows[0].fn() == "0");
    counter = 42;
    CHECK(panel.sections()[0].rows[0].fn() == "42");
}

TEST_CASE("DebugPanel — visible defaults to false, toggle works", "[debug]") {
    DebugPanel panel;
    CHECK_FALSE(panel.visible);
    panel.toggle();
    CHECK(panel.visible);
    panel.toggle();
    CHECK_FALSE(panel.visible);
}

// ---------------------------------------------------------------------------
// Pipeline / FixedStep
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — paused frames skip the logic phase", "[pipeline]") {
    ecs::World world;
    strafe::Pipeline pipeline;
    int pre = 0, logic = 0;
    pipeline.add_pre_update([&](ecs::World&, float) { ++pre; });
    pipeline.add_logic([&](ecs::World&, float) { ++logic; });

    pipeline.update(world, 0.01f);
    pipeline.update(world, 0.01f, true);

    CHECK(pre == 2);
    CHECK(logic == 1);
    CHECK(pipeline.logic_count() == 1);
}

TEST_CASE("FixedStep — hands out whole steps and keeps the remainder", "[pipeline]") {
    strafe::FixedStep step(0.25f, 4);

    step.accumulate(0.625f);
    int taken = 0;
    while (step.take()) ++taken;

    CHECK(taken == 2);
    CHECK(step.pending() == 0.125f);
}

TEST_CASE("FixedStep — backlog is capped", "[pipeline]") {
    strafe::FixedStep step(0.25f, 4);

    step.accumulate(10.0f);
    int taken = 0;
    while (step.take()) ++taken;

    CHECK(taken == 4);

    step.accumulate(0.5f);
    step.reset();
    CHECK_FALSE(step.take());
}
