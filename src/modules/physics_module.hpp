#pragma once
#include "../config.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <raylib.h>
#include <memory>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Builds the Jolt world from HostSettings (gravity along -Y) and wires the
// fixed step plus transform propagation into the Physics phase. The caller
// drives that phase at 1 / physics_hz through FixedStep.
//
// Rigid bodies are created by the RigidBodyConfig hooks registered here, so
// install before the arena is spawned.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, strafe::Pipeline& pipeline) {
        const HostSettings settings = world.try_resource<HostSettings>()
                                          ? world.resource<HostSettings>()
                                          : HostSettings{};

        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>(settings.gravity));
        PhysicsSystem::Register(world);
        TraceLog(LOG_INFO, "PHYSICS: gravity %.2f m/s^2, fixed step %d Hz",
                 settings.gravity, settings.physics_hz);

        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });
    }
};
