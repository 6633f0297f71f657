#pragma once
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/telemetry.hpp"
#include "../systems/tuning.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// TuningModule
//
// Creates the TuningSource and MovementTelemetry resources, adds
// TuningSystem (F5 hot reload) and TelemetrySystem to the Logic phase and
// registers "Movement" debug rows.
//
// Pipeline placement: after CharacterModule::install (TelemetrySystem reads
// the events CharacterStateSystem emits this frame). A reload applies from
// the next frame on.
// ---------------------------------------------------------------------------

struct TuningModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline,
                        const std::string& tuning_path) {
        world.set_resource(TuningSource{tuning_path, 0, {}});
        world.set_resource(MovementTelemetry{});

        pipeline.add_logic([](ecs::World& w, float dt) { TuningSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { TelemetrySystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Movement", "Last Jump", [&world]() {
                auto* t = world.try_resource<MovementTelemetry>();
                return t ? t->last_jump : std::string("-");
            });
            panel->watch("Movement", "Jumps / Air", [&world]() {
                auto* t = world.try_resource<MovementTelemetry>();
                if (!t) return std::string("-");
                return std::to_string(t->jumps) + " / " + std::to_string(t->air_jumps);
            });
            panel->watch("Movement", "Last Air Time", [&world]() {
                auto* t = world.try_resource<MovementTelemetry>();
                if (!t) return std::string("-");
                char b[16];
                std::snprintf(b, sizeof(b), "%.0f ms", t->last_air_ms);
                return std::string(b);
            });
            panel->watch("Movement", "Tuning", [&world]() {
                auto* s = world.try_resource<TuningSource>();
                if (!s) return std::string("-");
                if (!s->last_error.empty()) return std::string("reload failed");
                return "reloads: " + std::to_string(s->reloads);
            });
        }
    }
};
