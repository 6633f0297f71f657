#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// install() adds RenderSystem (frame open, scene, HUD) to the Render phase.
// install_present() adds the frame close; call it after every other module
// that draws, so their output lands in the same frame.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, strafe::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, strafe::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }
};
