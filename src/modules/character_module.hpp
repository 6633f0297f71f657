#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "../pipeline.hpp"
#include "../systems/character_input.hpp"
#include "../systems/character_motor.hpp"
#include "../systems/character_state.hpp"
#include "../systems/locomotion.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CharacterModule
//
// Registers lifecycle hooks for the character systems, registers the event
// queues that CharacterStateSystem emits (JumpEvent, LandEvent), wires
// CharacterInput, CharacterState and Locomotion into the Logic phase, and
// adds "Character" debug rows.
//
// install_motor() must be called AFTER TuningModule so that
// CharacterMotorSystem is the last step to touch the body velocity: it
// calls ExtendedUpdate on the Jolt character, which must complete before
// the fixed Physics step.
//
// Ordering summary:
//   CharacterModule::install       → logic: CharInput, CharState, Locomotion
//   TuningModule::install          → logic: Tuning, Telemetry
//   CharacterModule::install_motor → logic: CharMotor
//   CameraModule::install          → logic: Camera
// ---------------------------------------------------------------------------

struct CharacterModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline) {
        // Lifecycle hooks. The motor hook runs last so the capsule is created
        // once the headless components are in place.
        CharacterInputSystem::Register(world);
        CharacterStateSystem::Register(world);
        LocomotionSystem::Register(world);
        CharacterMotorSystem::Register(world);

        // Logic pipeline: CharInput, CharState, then Locomotion
        pipeline.add_logic([](ecs::World& w, float dt) { CharacterInputSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { CharacterStateSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { LocomotionSystem::Update(w, dt); });

        // Debug rows
        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Character", "Grounded", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, CharacterState>([&](ecs::Entity, PlayerTag&, CharacterState& s) {
                    r = s.on_ground ? "yes" : "no";
                });
                return r;
            });
            panel->watch("Character", "Jump Count", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, CharacterState>([&](ecs::Entity, PlayerTag&, CharacterState& s) {
                    r = std::to_string(s.jump_count);
                });
                return r;
            });
            panel->watch("Character", "Pending Jump", [&world]() {
                std::string r = "-";
                auto* clock = world.try_resource<TickClock>();
                world.single<PlayerTag, CharacterState>([&](ecs::Entity, PlayerTag&, CharacterState& s) {
                    if (!s.jump_requested || !clock) { r = "none"; return; }
                    char b[24];
                    std::snprintf(b, sizeof(b), "%.0f ms old", clock->now_ms - s.jump_request_ms);
                    r = b;
                });
                return r;
            });
            panel->watch("Character", "Speed (h)", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, PhysicsBody>([&](ecs::Entity, PlayerTag&, PhysicsBody& body) {
                    char b[16];
                    std::snprintf(b, sizeof(b), "%.2f m/s", strafe::math::horizontal_length(body.velocity));
                    r = b;
                });
                return r;
            });
            panel->watch("Character", "Sprint", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, CharacterState>([&](ecs::Entity, PlayerTag&, CharacterState& s) {
                    r = s.sprinting ? "on" : "off";
                });
                return r;
            });
            panel->watch("Character", "Dir Change", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, LocomotionState>([&](ecs::Entity, PlayerTag&, LocomotionState& l) {
                    r = l.dir_change_armed_ms ? "active" : "-";
                });
                return r;
            });
        }
    }

    // Adds CharacterMotorSystem to the Logic phase.
    // Must be called after every other system that writes PhysicsBody.
    static void install_motor(ecs::World& /*world*/, strafe::Pipeline& pipeline) {
        pipeline.add_logic([](ecs::World& w, float dt) { CharacterMotorSystem::Update(w, dt); });
    }
};
