#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputGatherSystem: Pre-Update; samples Raylib devices into InputRecord.
//
// Also owns mouse capture: a left click captures the cursor, Esc releases it.
// Mouse motion only counts as look input while captured.
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
