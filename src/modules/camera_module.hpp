#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../math_util.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the MainCamera resource, adds CameraSystem to the Logic phase and
// registers "Camera" debug rows.
//
// Pipeline placement: CameraSystem reads the character position synced by
// CharacterMotorSystem, so install this module after
// CharacterModule::install_motor.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline, float fovy) {
        MainCamera cam;
        cam.fovy = fovy;
        world.set_resource(cam);

        pipeline.add_logic([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Yaw / Pitch", [&world]() {
                std::string r = "-";
                world.single<PlayerTag, CharacterState>([&](ecs::Entity, PlayerTag&, CharacterState& s) {
                    char b[32];
                    std::snprintf(b, sizeof(b), "%.0f / %.0f deg",
                                  s.yaw * 180.0f / strafe::math::kPi,
                                  s.pitch * 180.0f / strafe::math::kPi);
                    r = b;
                });
                return r;
            });
        }
    }
};
