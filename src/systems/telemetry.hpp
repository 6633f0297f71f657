#pragma once
#include <ecs/ecs.hpp>
#include <string>

// Running movement counters for the debug overlay. Stored as a World resource.
struct MovementTelemetry {
    int         jumps       = 0;
    int         air_jumps   = 0;
    int         landings    = 0;
    double      last_air_ms = 0.0;
    std::string last_jump   = "-";
};

// ---------------------------------------------------------------------------
// TelemetrySystem: Logic phase, after CharacterStateSystem.
//
// Drains this frame's JumpEvent / LandEvent queues into MovementTelemetry
// and logs each event at LOG_DEBUG.
// ---------------------------------------------------------------------------

class TelemetrySystem {
public:
    static void Update(ecs::World& world, float dt);
};
