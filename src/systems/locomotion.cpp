#include "locomotion.hpp"
#include "../math_util.hpp"
#include <algorithm>

using namespace ecs;
namespace sm = strafe::math;

void LocomotionSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            w.add(e, LocomotionState{});
        });
}

ecs::Vec3 LocomotionSystem::move_direction(const ecs::Vec3& move_input, float yaw) {
    // Pitch is deliberately ignored: movement stays on the horizontal plane.
    const ecs::Vec3 fwd   = sm::yaw_forward(yaw);
    const ecs::Vec3 right = sm::yaw_right(yaw);

    ecs::Vec3 dir = {
        fwd.x * -move_input.z + right.x * move_input.x,
        0.0f,
        fwd.z * -move_input.z + right.z * move_input.x,
    };
    return sm::normalize_xz(dir);
}

bool LocomotionSystem::detect_direction_change(const LocomotionParams& params,
                                               const ecs::Vec3& direction,
                                               double now_ms,
                                               LocomotionState& loco) {
    if (sm::length_sq(loco.last_direction) == 0.0f) {
        loco.dir_change_armed_ms.reset();
        return false;
    }

    const float alignment = sm::dot_xz(loco.last_direction, direction);
    if (alignment < params.dir_change_threshold) {
        loco.dir_change_armed_ms = now_ms;
    } else if (loco.dir_change_armed_ms &&
               now_ms - *loco.dir_change_armed_ms >= params.dir_change_window_ms) {
        loco.dir_change_armed_ms.reset();
    }
    return loco.dir_change_armed_ms.has_value();
}

void LocomotionSystem::apply_friction(const LocomotionParams& params, bool on_ground,
                                      float dt, ecs::Vec3& velocity) {
    const float speed = sm::horizontal_length(velocity);

    // Snap instead of creeping toward zero forever.
    if (speed < params.idle_stop_speed) {
        velocity.x = 0.0f;
        velocity.z = 0.0f;
        return;
    }

    float friction = on_ground ? params.ground_friction : params.air_friction;
    if (speed > params.fast_speed) friction *= 0.5f;

    const float damping = std::max(0.0f, 1.0f - friction * dt);
    velocity.x *= damping;
    velocity.z *= damping;
}

void LocomotionSystem::apply(const LocomotionParams& params, const LocomotionFrame& frame,
                             double now_ms, float dt, CharacterState& state,
                             LocomotionState& loco, ecs::Vec3& velocity) {
    // --- 1. Idle ---
    if (frame.move_input.x == 0.0f && frame.move_input.z == 0.0f) {
        apply_friction(params, frame.on_ground, dt, velocity);
        state.forward_boost_pending = false;
        return;
    }

    // --- 2. Direction + turn detection ---
    const ecs::Vec3 dir     = move_direction(frame.move_input, frame.yaw);
    const bool      changed = detect_direction_change(params, dir, now_ms, loco);

    const float     speed   = frame.sprinting ? params.run_speed : params.walk_speed;
    const ecs::Vec3 target  = {dir.x * speed, 0.0f, dir.z * speed};
    const ecs::Vec3 current = {velocity.x, 0.0f, velocity.z};
    const float current_speed = sm::horizontal_length(current);

    // --- 3. Blend ---
    ecs::Vec3 next;
    if (changed && current_speed > params.momentum_min_speed) {
        // Carry most of the existing momentum through the turn.
        const float keep  = params.momentum_retention;
        const float steer = 1.0f - keep;
        next = {current.x * keep + target.x * steer, 0.0f,
                current.z * keep + target.z * steer};
    } else {
        float accel = frame.on_ground ? params.ground_acceleration : params.air_acceleration;
        if (current_speed < params.momentum_min_speed || changed) accel *= params.dir_change_boost;
        if (!frame.on_ground) accel *= params.air_control;

        // Never overshoot the target in a single tick.
        const float t = std::min(accel * dt, 1.0f);
        next = {current.x + (target.x - current.x) * t, 0.0f,
                current.z + (target.z - current.z) * t};
    }

    // --- 4. Speed cap ---
    const float next_speed = sm::horizontal_length(next);
    if (next_speed > params.max_speed) {
        const float s = params.max_speed / next_speed;
        next.x *= s;
        next.z *= s;
    }

    // --- 5. Forward jump boost (once, after the cap) ---
    if (state.forward_boost_pending) {
        const float boost = params.jump_forward_boost * params.walk_speed;
        next.x += dir.x * boost;
        next.z += dir.z * boost;
        state.forward_boost_pending = false;
    }

    velocity.x          = next.x;
    velocity.z          = next.z;
    loco.last_direction = dir;
}

void LocomotionSystem::Update(World& world, float dt) {
    auto* clock  = world.try_resource<TickClock>();
    auto* tuning = world.try_resource<MovementTuning>();
    if (!clock || !tuning) return;

    world.each<CharacterIntent, CharacterState, LocomotionState, PhysicsBody>(
        [&](Entity, CharacterIntent& intent, CharacterState& state,
            LocomotionState& loco, PhysicsBody& body) {
            LocomotionFrame frame;
            frame.move_input = intent.move_input;
            frame.yaw        = state.yaw;
            frame.sprinting  = state.sprinting;
            frame.on_ground  = body.on_ground;

            apply(tuning->locomotion, frame, clock->now_ms, dt, state, loco, body.velocity);
        });
}
