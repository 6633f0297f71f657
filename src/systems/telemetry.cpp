#include "telemetry.hpp"
#include "../events.hpp"
#include <raylib.h>
#include <cstdio>

void TelemetrySystem::Update(ecs::World& world, float /*dt*/) {
    auto* stats = world.try_resource<MovementTelemetry>();
    if (!stats) return;

    if (auto* jumps = world.try_resource<Events<JumpEvent>>()) {
        for (const auto& ev : jumps->read()) {
            stats->jumps++;
            if (!ev.ground) stats->air_jumps++;

            char b[48];
            std::snprintf(b, sizeof(b), "#%d %s %.2f m/s", ev.jump_number,
                          ev.ground ? "ground" : "air", ev.impulse);
            stats->last_jump = b;
            TraceLog(LOG_DEBUG, "CHARACTER: jump %s", b);
        }
    }

    if (auto* lands = world.try_resource<Events<LandEvent>>()) {
        for (const auto& ev : lands->read()) {
            stats->landings++;
            stats->last_air_ms = ev.air_ms;
            TraceLog(LOG_DEBUG, "CHARACTER: landed after %.0f ms", ev.air_ms);
        }
    }
}
