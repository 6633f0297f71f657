#include "character_state.hpp"
#include "../events.hpp"
#include <ecs/modules/transform.hpp>
#include <cmath>

using namespace ecs;

void CharacterStateSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            CharacterState state{};
            PhysicsBody    body{};
            if (auto* lt = w.try_get<LocalTransform>(e)) {
                state.position = lt->position;
                body.position  = lt->position;
            }
            w.add(e, std::move(state));
            w.add(e, std::move(body));
        });
}

JumpResult CharacterStateSystem::apply_state(bool on_ground, double now_ms,
                                             const CharacterIntent& intent,
                                             const MovementTuning& tuning,
                                             CharacterState& state,
                                             ecs::Vec3& velocity) {
    const JumpTuning&       jt = tuning.jump;
    const LocomotionParams& lp = tuning.locomotion;

    // 1. Ground edges. Evaluated before consumption so that a press buffered
    //    mid-air is consumed as a ground jump on the landing tick.
    const bool was_grounded = state.on_ground;
    if (on_ground && !was_grounded) {
        state.jump_count = 0;
    } else if (!on_ground && was_grounded) {
        state.last_grounded_ms = now_ms;
    }
    state.on_ground = on_ground;

    // 2. Latch this tick's press edge.
    if (intent.jump_pressed) {
        state.jump_requested  = true;
        state.jump_request_ms = intent.jump_press_ms;
    }

    if (!state.jump_requested) return JumpResult::None;

    // 3. Buffer expiry: the request is dropped silently.
    if (now_ms - state.jump_request_ms >= jt.buffer_window_ms) {
        state.jump_requested = false;
        return JumpResult::None;
    }

    // 4. Cooldown: the request stays pending.
    if (now_ms - state.last_jump_ms < jt.cooldown_ms) return JumpResult::None;

    const bool in_coyote       = (now_ms - state.last_grounded_ms) < jt.coyote_ms;
    const bool can_ground_jump = on_ground || in_coyote;

    // 5. Consume.
    if (can_ground_jump && state.jump_count == 0) {
        velocity.y                  = lp.jump_force;
        state.jump_count            = 1;
        state.last_jump_ms          = now_ms;
        state.jump_requested        = false;
        // A coyote jump leaves from the air and gets no forward boost.
        state.forward_boost_pending = on_ground;
        return JumpResult::Ground;
    }
    if (!can_ground_jump && state.jump_count < jt.max_jumps) {
        velocity.y            = lp.jump_force * jt.air_jump_scale;
        state.jump_count     += 1;
        state.last_jump_ms    = now_ms;
        state.jump_requested  = false;
        return JumpResult::Air;
    }

    // Not consumable yet; retried next tick until the buffer window closes.
    return JumpResult::None;
}

void CharacterStateSystem::retune(World& world, const MovementTuning& tuning) {
    world.set_resource(tuning);
    world.each<CharacterState>([&](Entity, CharacterState& state) {
        if (state.jump_count > tuning.jump.max_jumps) state.jump_count = tuning.jump.max_jumps;
    });
}

void CharacterStateSystem::Update(World& world, float /*dt*/) {
    auto* clock  = world.try_resource<TickClock>();
    auto* tuning = world.try_resource<MovementTuning>();
    if (!clock || !tuning) return;

    auto* jumps = world.try_resource<Events<JumpEvent>>();
    auto* lands = world.try_resource<Events<LandEvent>>();

    world.each<CharacterIntent, CharacterState, PhysicsBody>(
        [&](Entity e, CharacterIntent& intent, CharacterState& state, PhysicsBody& body) {
            const bool   was_grounded = state.on_ground;
            const double left_ground  = state.last_grounded_ms;

            JumpResult result = apply_state(body.on_ground, clock->now_ms, intent,
                                            *tuning, state, body.velocity);

            if (lands && body.on_ground && !was_grounded) {
                // A character spawned in the air has no take-off time.
                const double air_ms = std::isfinite(left_ground) ? clock->now_ms - left_ground : 0.0;
                lands->send({e, air_ms});
            }
            if (jumps && result != JumpResult::None) {
                jumps->send({e, state.jump_count, body.velocity.y,
                             result == JumpResult::Ground});
            }
        });
}
