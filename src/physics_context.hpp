#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <raylib.h>
#include <algorithm>
#include <thread>

// Object layers: the arena is NON_MOVING, the character and props are MOVING.
namespace Layers {
    static constexpr JPH::ObjectLayer NON_MOVING = 0;
    static constexpr JPH::ObjectLayer MOVING     = 1;
    static constexpr JPH::ObjectLayer NUM_LAYERS = 2;
};

namespace BroadPhaseLayers {
    static constexpr JPH::BroadPhaseLayer NON_MOVING(0);
    static constexpr JPH::BroadPhaseLayer MOVING(1);
    static constexpr JPH::uint NUM_LAYERS(2);
};

// ---------------------------------------------------------------------------
// Layer interfaces required by JPH::PhysicsSystem::Init
// ---------------------------------------------------------------------------

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    BPLayerInterfaceImpl() {
        mObjectToBroadPhase[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
        mObjectToBroadPhase[Layers::MOVING]     = BroadPhaseLayers::MOVING;
    }

    JPH::uint GetNumBroadPhaseLayers() const override {
        return BroadPhaseLayers::NUM_LAYERS;
    }

    JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
        return mObjectToBroadPhase[inLayer];
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        return inLayer == BroadPhaseLayers::NON_MOVING ? "NON_MOVING" : "MOVING";
    }
#endif

private:
    JPH::BroadPhaseLayer mObjectToBroadPhase[Layers::NUM_LAYERS];
};

class ObjectVsBroadPhaseLayerFilterImpl : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override {
        if (inLayer1 == Layers::NON_MOVING) return inLayer2 == BroadPhaseLayers::MOVING;
        return true;
    }
};

class ObjectLayerPairFilterImpl : public JPH::ObjectLayerPairFilter {
public:
    bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override {
        if (inObject1 == Layers::NON_MOVING) return inObject2 == Layers::MOVING;
        return true;
    }
};

// ---------------------------------------------------------------------------
// PhysicsContext: owns the Jolt world. Stored as a World resource through
// std::shared_ptr so lifecycle hooks can reach it.
// ---------------------------------------------------------------------------

class PhysicsContext {
public:
    JPH::TempAllocatorImpl*   temp_allocator = nullptr;
    JPH::JobSystemThreadPool* job_system     = nullptr;
    JPH::PhysicsSystem*       physics_system = nullptr;

    BPLayerInterfaceImpl              broad_phase_layer_interface;
    ObjectVsBroadPhaseLayerFilterImpl object_vs_broadphase_layer_filter;
    ObjectLayerPairFilterImpl         object_layer_pair_filter;

    // Gravity used for character bodies (m/s^2, negative is down).
    float gravity = -20.0f;

    static void InitJoltAllocator() {
        JPH::RegisterDefaultAllocator();
    }

    explicit PhysicsContext(float gravity_y) : gravity(gravity_y) {
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();

        const int workers = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
        temp_allocator = new JPH::TempAllocatorImpl(10 * 1024 * 1024);
        job_system     = new JPH::JobSystemThreadPool(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, workers);

        physics_system = new JPH::PhysicsSystem();
        physics_system->Init(1024, 0, 1024, 1024, broad_phase_layer_interface,
                             object_vs_broadphase_layer_filter, object_layer_pair_filter);
        physics_system->SetGravity(JPH::Vec3(0.0f, gravity, 0.0f));

        TraceLog(LOG_INFO, "PHYSICS: Jolt initialized (%d worker threads, gravity %.1f)", workers, gravity);
    }

    ~PhysicsContext() {
        delete physics_system;
        delete job_system;
        delete temp_allocator;
        if (JPH::Factory::sInstance) {
            delete JPH::Factory::sInstance;
            JPH::Factory::sInstance = nullptr;
        }
    }

    PhysicsContext(const PhysicsContext&)            = delete;
    PhysicsContext& operator=(const PhysicsContext&) = delete;

    JPH::BodyInterface&       GetBodyInterface()       { return physics_system->GetBodyInterface(); }
    const JPH::BodyInterface& GetBodyInterface() const { return physics_system->GetBodyInterface(); }
};
