#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../config.hpp"

enum class JumpResult { None, Ground, Air };

// Owns the jump state machine: ground edges, jump buffering, coyote time,
// jump-count limit and cooldown.
// Runs in the Logic phase, after CharacterInputSystem and before
// LocomotionSystem. Reads PhysicsBody, writes PhysicsBody::velocity.y.
class CharacterStateSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Pure state transition for one tick: no Jolt dependency.
    // on_ground: ground contact reported by the physics layer this tick.
    // now_ms: the tick time; every window in JumpTuning is measured against it.
    // Writes velocity.y only when a jump is performed.
    static JumpResult apply_state(bool on_ground, double now_ms,
                                  const CharacterIntent& intent,
                                  const MovementTuning& tuning,
                                  CharacterState& state, ecs::Vec3& velocity);

    // Installs new tuning as the live MovementTuning resource. Characters
    // already past a lowered max_jumps are pulled back to it.
    static void retune(ecs::World& world, const MovementTuning& tuning);
};
