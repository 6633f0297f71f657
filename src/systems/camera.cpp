#include "camera.hpp"
#include "../math_util.hpp"

using namespace ecs;

void CameraSystem::place(const CharacterState& state, float eye_height, MainCamera& cam) {
    const ecs::Vec3 eye = {state.position.x, state.position.y + eye_height, state.position.z};
    const ecs::Vec3 fwd = strafe::math::view_forward(state.yaw, state.pitch);

    cam.position = eye;
    cam.forward  = fwd;
    cam.target   = {eye.x + fwd.x, eye.y + fwd.y, eye.z + fwd.z};
}

void CameraSystem::Update(World& world, float /*dt*/) {
    auto* cam = world.try_resource<MainCamera>();
    if (!cam) return;

    world.single<PlayerTag, CharacterState, CharacterControllerConfig>(
        [&](Entity, PlayerTag&, CharacterState& state, CharacterControllerConfig& cfg) {
            place(state, cfg.eye_height, *cam);
        });
}
