#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PhysicsSystem: rigid bodies of the arena.
//
// Register() installs lifecycle hooks: RigidBodyConfig creates a Jolt body,
// removing RigidBodyHandle destroys it. Update() steps the Jolt world at the
// fixed physics rate and syncs dynamic bodies back to their transforms.
// ---------------------------------------------------------------------------

class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
