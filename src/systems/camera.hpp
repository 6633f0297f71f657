#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// First-person view: places MainCamera at the player's eye and points it
// along the view yaw/pitch.
// Runs at the end of the Logic phase, after CharacterMotorSystem has synced
// the character position for this tick.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);

    static void place(const CharacterState& state, float eye_height, MainCamera& cam);
};
