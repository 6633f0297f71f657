#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds the tick clock advance, InputGatherSystem and PlayerInputSystem to
// the Pre-Update phase, in that order: the clock moves first so a jump press
// is stamped with this tick's time. A paused clock does not advance.
// All three run after the EventBus flush.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline) {
        if (!world.try_resource<TickClock>()) world.set_resource(TickClock{});

        pipeline.add_pre_update([](ecs::World& w, float dt) {
            auto& clock = w.resource<TickClock>();
            if (!clock.paused) clock.advance(dt);
        });
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float dt) { PlayerInputSystem::Update(w, dt); });
    }
};
