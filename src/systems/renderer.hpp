#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem: Render phase.
//
// Update() opens the frame, draws every MeshRenderer from the MainCamera
// eye and the HUD. Present() closes the frame; it is installed after every
// other Render-phase step so overlays land in the same frame.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
