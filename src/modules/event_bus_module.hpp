#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry, registers the movement queues (JumpEvent and
// LandEvent, emitted by CharacterStateSystem and drained by TelemetrySystem)
// and makes the flush the first Pre-Update step. Install it before any
// module that sends or reads events.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline) {
        EventRegistry registry;
        registry.register_queue<JumpEvent>(world);
        registry.register_queue<LandEvent>(world);
        world.set_resource(std::move(registry));

        // Queues live for one frame: whatever was sent last frame is gone
        // before input is gathered for this one.
        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
