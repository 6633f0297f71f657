#include "physics.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <memory>

using namespace ecs;

static JPH::RefConst<JPH::Shape> make_shape(World& w, Entity e) {
    if (auto* box = w.try_get<BoxCollider>(e))
        return new JPH::BoxShape(MathBridge::ToJolt(box->half_extents));
    return new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
}

static JPH::EMotionType to_motion_type(BodyType type) {
    switch (type) {
        case BodyType::Static:    return JPH::EMotionType::Static;
        case BodyType::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyType::Dynamic:   return JPH::EMotionType::Dynamic;
    }
    return JPH::EMotionType::Static;
}

void PhysicsSystem::Register(World& world) {
    // --- Body creation (Config -> Handle). Colliders and LocalTransform must
    //     already be on the entity when RigidBodyConfig is added. ---
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;

        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();

        JPH::RVec3 pos = JPH::RVec3::sZero();
        JPH::Quat  rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJoltR(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        }

        JPH::ObjectLayer layer = (cfg.type == BodyType::Static) ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(make_shape(w, e), pos, rot, to_motion_type(cfg.type), layer);
        settings.mRestitution = cfg.restitution;
        settings.mFriction    = cfg.friction;
        if (cfg.type == BodyType::Dynamic) {
            settings.mOverrideMassProperties       = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
        }

        JPH::Body* body = bi.CreateBody(settings);
        if (!body) {
            TraceLog(LOG_WARNING, "PHYSICS: body limit reached, entity left without a body");
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);
        w.add(e, RigidBodyHandle{body->GetID()});
    });

    // --- Body destruction ---
    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    ctx.physics_system->Update(dt, 1, ctx.temp_allocator, ctx.job_system);

    // Jolt -> ECS for dynamic bodies only; static and kinematic bodies are
    // driven by the ECS.
    JPH::BodyInterface& bi = ctx.GetBodyInterface();
    world.each<RigidBodyHandle, RigidBodyConfig, LocalTransform, WorldTransform>(
        [&](Entity, RigidBodyHandle& h, RigidBodyConfig& cfg, LocalTransform& lt, WorldTransform& wt) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 pos;
            JPH::Quat  rot;
            bi.GetPositionAndRotation(h.id, pos, rot);

            // Physics bodies are roots; no parent transform to undo.
            lt.position = MathBridge::FromJolt(pos);
            lt.rotation = MathBridge::FromJolt(rot);
            wt.matrix   = mat4_compose(lt.position, lt.rotation, lt.scale);
        });
}
