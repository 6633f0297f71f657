#pragma once
#include <ecs/ecs.hpp>

// The physics-layer half of the character: owns the Jolt CharacterVirtual.
// Pushes PhysicsBody::velocity (plus gravity) into Jolt, steps the character
// through the world with ExtendedUpdate, then pulls position, velocity and
// ground contact back into PhysicsBody and mirrors them into CharacterState.
// Must run last in the Logic phase, immediately before PhysicsSystem.
class CharacterMotorSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
