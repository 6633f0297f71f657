#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// Arena: the fixed test course the sandbox runs in.
//
// A floor, a raised ledge to walk off (coyote time), a wall that needs the
// air jump, a staircase of floating platforms and a few loose crates.
// Components are added in lifecycle-safe order (transform and colliders
// before RigidBodyConfig, player components before CharacterControllerConfig)
// so on_add hooks fire with sibling data present.
// No Jolt or Raylib dependency: compilable in the headless test target.
// ---------------------------------------------------------------------------

class Arena {
public:
    // Spawns the course and the player. Returns the player entity.
    static ecs::Entity spawn(ecs::World& world);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
