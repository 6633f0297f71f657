#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/arena.hpp"
#include "../src/components.hpp"
#include "../src/config.hpp"
#include "../src/events.hpp"
#include "../src/math_util.hpp"
#include "../src/systems/camera.hpp"
#include "../src/systems/character_input.hpp"
#include "../src/systems/character_state.hpp"
#include "../src/systems/locomotion.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// A headless world with the movement systems registered but no physics:
// the test stands in for the motor by writing PhysicsBody directly.

using Catch::Matchers::WithinAbs;

static constexpr float kTick = 1.0f / 120.0f;

static void setup_world(ecs::World& world) {
    world.set_resource(TickClock{});
    world.set_resource(MovementTuning{});
    world.set_resource(MainCamera{});
    world.set_resource(EventRegistry{});
    world.resource<EventRegistry>().register_queue<JumpEvent>(world);
    world.resource<EventRegistry>().register_queue<LandEvent>(world);

    CharacterInputSystem::Register(world);
    CharacterStateSystem::Register(world);
    LocomotionSystem::Register(world);
}

static void run_logic(ecs::World& world, float dt) {
    world.resource<TickClock>().advance(dt);
    CharacterInputSystem::Update(world, dt);
    CharacterStateSystem::Update(world, dt);
    LocomotionSystem::Update(world, dt);
    CameraSystem::Update(world, dt);
}

// ---------------------------------------------------------------------------
// Arena
// ---------------------------------------------------------------------------

TEST_CASE("Arena — spawns the course and one player", "[arena]") {
    ecs::World world;
    setup_world(world);

    Arena::spawn(world);

    // floor, ledge, wall, 4 steps, 3 crates, player
    CHECK(world.count() == 11);

    int players = 0;
    world.each<PlayerTag, PlayerInput, CharacterIntent, CharacterState, LocomotionState, PhysicsBody>(
        [&](ecs::Entity, PlayerTag&, PlayerInput&, CharacterIntent&, CharacterState&,
            LocomotionState&, PhysicsBody&) { ++players; });
    CHECK(players == 1);

    int dynamic = 0;
    world.each<RigidBodyConfig, BoxCollider>([&](ecs::Entity, RigidBodyConfig& cfg, BoxCollider&) {
        if (cfg.type == BodyType::Dynamic) ++dynamic;
    });
    CHECK(dynamic == 3);
}

TEST_CASE("Arena — player body starts at its spawn transform", "[arena]") {
    ecs::World world;
    setup_world(world);

    ecs::Entity player = Arena::spawn(world);

    auto* body  = world.try_get<PhysicsBody>(player);
    auto* state = world.try_get<CharacterState>(player);
    REQUIRE(body);
    REQUIRE(state);
    CHECK_THAT(body->position.z,  WithinAbs(8.0f, 1e-6f));
    CHECK_THAT(state->position.y, WithinAbs(0.1f, 1e-6f));
    CHECK(state->jump_count == 0);
}

TEST_CASE("Arena — unload removes every spawned entity", "[arena]") {
    ecs::World world;
    setup_world(world);

    Arena::spawn(world);
    Arena::unload(world);

    CHECK(world.count() == 0);
}

// ---------------------------------------------------------------------------
// One logic tick through the systems
// ---------------------------------------------------------------------------

TEST_CASE("Logic tick — grounded jump press with forward input", "[world]") {
    ecs::World world;
    setup_world(world);
    ecs::Entity player = Arena::spawn(world);

    auto& body  = *world.try_get<PhysicsBody>(player);
    auto& state = *world.try_get<CharacterState>(player);
    body.on_ground  = true;
    state.on_ground = true;

    auto& input = *world.try_get<PlayerInput>(player);
    input.move_input    = {0, 0, -1};
    input.jump_pressed  = true;
    input.jump_press_ms = world.resource<TickClock>().now_ms + 1000.0 * kTick;

    run_logic(world, kTick);

    const auto& params = world.resource<MovementTuning>().locomotion;
    CHECK_THAT(body.velocity.y, WithinAbs(params.jump_force, 1e-5f));
    CHECK(state.jump_count == 1);

    // Reaches walk speed in one tick, then the one-shot boost on top.
    CHECK_THAT(body.velocity.z,
               WithinAbs(-(params.walk_speed + params.jump_forward_boost * params.walk_speed), 1e-4f));
    CHECK_FALSE(state.forward_boost_pending);

    const auto& jumps = world.resource<Events<JumpEvent>>().read();
    REQUIRE(jumps.size() == 1);
    CHECK(jumps[0].ground);
    CHECK(jumps[0].jump_number == 1);

    // Camera follows the character's eye.
    const auto& cam = world.resource<MainCamera>();
    CHECK_THAT(cam.position.y, WithinAbs(state.position.y + CharacterControllerConfig{}.eye_height, 1e-5f));
}

TEST_CASE("Logic tick — landing emits LandEvent with the air time", "[world]") {
    ecs::World world;
    setup_world(world);
    ecs::Entity player = Arena::spawn(world);

    auto& body  = *world.try_get<PhysicsBody>(player);
    auto& state = *world.try_get<CharacterState>(player);
    world.resource<TickClock>().now_ms = 800.0;
    state.on_ground        = false;
    state.last_grounded_ms = 500.0;
    state.jump_count       = 2;
    body.on_ground         = true;

    run_logic(world, 0.0f);

    const auto& lands = world.resource<Events<LandEvent>>().read();
    REQUIRE(lands.size() == 1);
    CHECK(lands[0].air_ms == 300.0);
    CHECK(state.jump_count == 0);

    world.resource<EventRegistry>().flush_all();
    CHECK(world.resource<Events<LandEvent>>().empty());
}

TEST_CASE("Logic tick — look input turns the movement direction", "[world]") {
    ecs::World world;
    setup_world(world);
    ecs::Entity player = Arena::spawn(world);

    auto& body = *world.try_get<PhysicsBody>(player);
    body.on_ground = true;
    world.try_get<CharacterState>(player)->on_ground = true;

    auto& input = *world.try_get<PlayerInput>(player);
    input.move_input = {0, 0, -1};
    input.look_delta = {0.5f * strafe::math::kPi, 0.0f};  // quarter turn left

    run_logic(world, kTick);

    CHECK_THAT(body.velocity.x, WithinAbs(-6.0f, 1e-3f));
    CHECK_THAT(body.velocity.z, WithinAbs(0.0f, 1e-3f));
}

// ---------------------------------------------------------------------------
// Retuning at runtime
// ---------------------------------------------------------------------------

TEST_CASE("retune — lowering max_jumps mid-air pulls jump_count back", "[world][tuning]") {
    ecs::World world;
    setup_world(world);

    MovementTuning triple;
    triple.jump.max_jumps = 3;
    CharacterStateSystem::retune(world, triple);

    ecs::Entity player = Arena::spawn(world);
    auto& state = *world.try_get<CharacterState>(player);
    state.on_ground  = false;
    state.jump_count = 3;

    MovementTuning single;
    single.jump.max_jumps = 1;
    CharacterStateSystem::retune(world, single);

    CHECK(world.resource<MovementTuning>().jump.max_jumps == 1);
    CHECK(world.try_get<CharacterState>(player)->jump_count == 1);

    SECTION("no further air jump is granted") {
        auto& input = *world.try_get<PlayerInput>(player);
        input.jump_pressed  = true;
        input.jump_press_ms = world.resource<TickClock>().now_ms + 1000.0 * kTick;

        run_logic(world, kTick);

        CHECK(world.try_get<CharacterState>(player)->jump_count == 1);
        CHECK(world.resource<Events<JumpEvent>>().empty());
    }
}

TEST_CASE("retune — raising max_jumps leaves jump_count alone", "[world][tuning]") {
    ecs::World world;
    setup_world(world);
    ecs::Entity player = Arena::spawn(world);
    world.try_get<CharacterState>(player)->jump_count = 2;

    MovementTuning more;
    more.jump.max_jumps = 4;
    CharacterStateSystem::retune(world, more);

    CHECK(world.try_get<CharacterState>(player)->jump_count == 2);
}
