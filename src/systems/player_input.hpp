#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PlayerInputSystem: Pre-Update; maps InputRecord to the PlayerInput
// snapshot for this tick.
//
// Bindings: WASD / left stick move, mouse / right stick look, Left Shift /
// left stick click sprint, Space / south button jump. A jump press is stamped
// with TickClock::now_ms so buffering is measured in tick time.
// ---------------------------------------------------------------------------

class PlayerInputSystem {
public:
    static void Update(ecs::World& world, float dt);
};
