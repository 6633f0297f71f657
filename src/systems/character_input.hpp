#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Translates the PlayerInput snapshot into a CharacterIntent and applies the
// look delta to the character's view angles.
// Runs first in the Logic phase; the snapshot is read exactly once per tick.
class CharacterInputSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Adds the look delta to yaw (wrapped to [-pi, pi]) and pitch (clamped).
    static void apply_look(const ecs::Vec2& look_delta, CharacterState& state);

    static CharacterIntent make_intent(const PlayerInput& input);
};
