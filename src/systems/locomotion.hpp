#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../config.hpp"

// Everything the locomotion model reads about the character for one tick.
struct LocomotionFrame {
    ecs::Vec3 move_input = {0, 0, 0};  // sanitized; -z is forward
    float     yaw        = 0.0f;
    bool      sprinting  = false;
    bool      on_ground  = false;
};

// Horizontal movement: acceleration with momentum-preserving turns, speed
// cap, one-shot forward jump boost, and a separate friction model when idle.
// Runs in the Logic phase after CharacterStateSystem. Writes only the x/z
// components of PhysicsBody::velocity.
class LocomotionSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // World-space unit direction on the XZ plane for a move input at the
    // given view yaw. Zero input gives a zero direction.
    static ecs::Vec3 move_direction(const ecs::Vec3& move_input, float yaw);

    // Updates the sticky direction-change flag and returns whether it is
    // active this tick. Read once per tick.
    static bool detect_direction_change(const LocomotionParams& params,
                                        const ecs::Vec3& direction, double now_ms,
                                        LocomotionState& loco);

    // Idle decay of the horizontal velocity.
    static void apply_friction(const LocomotionParams& params, bool on_ground,
                               float dt, ecs::Vec3& velocity);

    // One full tick of the model. Consumes state.forward_boost_pending.
    static void apply(const LocomotionParams& params, const LocomotionFrame& frame,
                      double now_ms, float dt, CharacterState& state,
                      LocomotionState& loco, ecs::Vec3& velocity);
};
