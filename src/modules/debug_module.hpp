#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// install() creates the DebugPanel world resource and registers Engine-level
// debug rows (FPS, Frame Time, Tick, Entities, Paused). It must run BEFORE
// any game module that wants to add its own debug rows, so that the
// DebugPanel resource exists when those modules call
// world.try_resource<DebugPanel>()->watch(...).
//
// install_overlay() adds DebugSystem to the Render phase; call it after
// RenderModule::install so the overlay draws on top of the scene.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, bool visible) {
        DebugPanel panel;
        panel.visible = visible;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%.1f ms", GetFrameTime() * 1000.0f);
            return std::string(b);
        });
        panel.watch("Engine", "Tick", [&world]() {
            auto* clock = world.try_resource<TickClock>();
            if (!clock) return std::string("-");
            char b[40];
            std::snprintf(b, sizeof(b), "%llu (%.1f ms)",
                          static_cast<unsigned long long>(clock->tick), clock->dt * 1000.0f);
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Paused", [&world]() {
            auto* clock = world.try_resource<TickClock>();
            return std::string(clock && clock->paused ? "yes" : "no");
        });

        world.set_resource(std::move(panel));
    }

    static void install_overlay(ecs::World& /*world*/, strafe::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
