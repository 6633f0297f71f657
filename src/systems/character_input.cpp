#include "character_input.hpp"
#include "../math_util.hpp"

using namespace ecs;

void CharacterInputSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            w.add(e, CharacterIntent{});
        });
}

void CharacterInputSystem::apply_look(const ecs::Vec2& look_delta, CharacterState& state) {
    state.yaw   = strafe::math::normalize_angle(state.yaw + look_delta.x);
    state.pitch = strafe::math::clamp_pitch(state.pitch + look_delta.y);
}

CharacterIntent CharacterInputSystem::make_intent(const PlayerInput& input) {
    CharacterIntent intent;
    intent.move_input    = strafe::math::sanitize_move_input(input.move_input);
    intent.sprint        = input.sprint_held;
    intent.jump_pressed  = input.jump_pressed;
    intent.jump_press_ms = input.jump_press_ms;
    return intent;
}

void CharacterInputSystem::Update(World& world, float /*dt*/) {
    world.each<PlayerTag, PlayerInput, CharacterIntent, CharacterState>(
        [](Entity, PlayerTag&, PlayerInput& input, CharacterIntent& intent,
           CharacterState& state) {
            apply_look(input.look_delta, state);
            intent          = make_intent(input);
            state.sprinting = intent.sprint;
        });
}
