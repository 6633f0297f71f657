#include "character_motor.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <ecs/modules/transform.hpp>
#include <raylib.h>

using namespace ecs;

// Vertical velocity is owned by gravity here and by CharacterStateSystem on
// the tick of a jump. Resting on the ground cancels downward velocity.
static float integrate_gravity(float vy, bool on_ground, float gravity, float dt) {
    if (on_ground && vy <= 0.0f) return 0.0f;
    return vy + gravity * dt;
}

void CharacterMotorSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig& cfg) {
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx_ptr || !*ctx_ptr) return;
            auto& ctx = **ctx_ptr;

            // Capsule with its base at the entity origin (feet).
            const float half_cylinder = 0.5f * cfg.height - cfg.radius;
            JPH::RefConst<JPH::ShapeSettings> shape_settings =
                new JPH::RotatedTranslatedShapeSettings(
                    JPH::Vec3(0, 0.5f * cfg.height, 0), JPH::Quat::sIdentity(),
                    new JPH::CapsuleShapeSettings(half_cylinder, cfg.radius));

            auto shape_result = shape_settings->Create();
            if (shape_result.HasError()) {
                TraceLog(LOG_ERROR, "CHARACTER: capsule creation failed: %s",
                         shape_result.GetError().c_str());
                return;
            }

            JPH::RVec3 pos = JPH::RVec3::sZero();
            if (auto* lt = w.try_get<LocalTransform>(e)) {
                pos = MathBridge::ToJoltR(lt->position);
            }

            JPH::CharacterVirtualSettings settings;
            settings.mMass             = cfg.mass;
            settings.mMaxSlopeAngle    = JPH::DegreesToRadians(cfg.max_slope_angle);
            settings.mShape            = shape_result.Get();
            settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -cfg.radius);

            auto character = std::make_shared<JPH::CharacterVirtual>(
                &settings, pos, JPH::Quat::sIdentity(), ctx.physics_system);

            w.add(e, CharacterHandle{character});
            TraceLog(LOG_INFO, "CHARACTER: spawned at (%.1f, %.1f, %.1f)",
                     static_cast<float>(pos.GetX()), static_cast<float>(pos.GetY()),
                     static_cast<float>(pos.GetZ()));
        });
}

void CharacterMotorSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    world.each<CharacterHandle, PhysicsBody, CharacterState, WorldTransform>(
        [&](Entity e, CharacterHandle& h, PhysicsBody& body, CharacterState& state,
            WorldTransform& wt) {
            auto* ch = h.character.get();

            // --- 1. Velocity in: core output + gravity ---
            body.velocity.y = integrate_gravity(body.velocity.y, body.on_ground, ctx.gravity, dt);
            ch->SetLinearVelocity(MathBridge::ToJolt(body.velocity));
            ch->SetRotation(MathBridge::YawToJolt(state.yaw));

            // --- 2. Step the character through the world ---
            JPH::DefaultBroadPhaseLayerFilter bp_filter(
                ctx.object_vs_broadphase_layer_filter, Layers::MOVING);
            JPH::DefaultObjectLayerFilter obj_filter(
                ctx.object_layer_pair_filter, Layers::MOVING);
            JPH::BodyFilter  body_filter;
            JPH::ShapeFilter shape_filter;
            JPH::CharacterVirtual::ExtendedUpdateSettings ext_settings;

            ch->ExtendedUpdate(dt, JPH::Vec3(0.0f, ctx.gravity, 0.0f), ext_settings,
                               bp_filter, obj_filter, body_filter, shape_filter,
                               *ctx.temp_allocator);

            // --- 3. State out: physics body is the source of truth ---
            body.position  = MathBridge::FromJolt(ch->GetPosition());
            body.velocity  = MathBridge::FromJolt(ch->GetLinearVelocity());
            body.on_ground = MathBridge::IsGrounded(ch->GetGroundState());

            state.position = body.position;
            state.velocity = body.velocity;

            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = body.position;
                lt->rotation = MathBridge::FromJolt(ch->GetRotation());
                wt.matrix    = mat4_compose(lt->position, lt->rotation, lt->scale);
            }
        });
}
