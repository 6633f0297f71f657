#include "player_input.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"
#include <cmath>

using namespace ecs;

void PlayerInputSystem::Update(World& world, float dt) {
    auto* input_ptr = world.try_resource<InputRecord>();
    auto* clock     = world.try_resource<TickClock>();
    if (!input_ptr || !clock) return;
    const auto& record = *input_ptr;

    HostSettings defaults;
    const auto* settings = world.try_resource<HostSettings>();
    if (!settings) settings = &defaults;

    world.single<PlayerInput>([&](Entity, PlayerInput& input) {
        // Reset per-tick state
        input.move_input   = {0, 0, 0};
        input.look_delta   = {0, 0};
        input.sprint_held  = false;
        input.jump_pressed = false;

        // 1. Keyboard + mouse. -Z is forward.
        if (record.keys_down[KEY_W]) input.move_input.z -= 1.0f;
        if (record.keys_down[KEY_S]) input.move_input.z += 1.0f;
        if (record.keys_down[KEY_A]) input.move_input.x -= 1.0f;
        if (record.keys_down[KEY_D]) input.move_input.x += 1.0f;

        if (record.keys_down[KEY_LEFT_SHIFT]) input.sprint_held  = true;
        if (record.keys_pressed[KEY_SPACE])   input.jump_pressed = true;

        input.look_delta.x -= record.mouse_delta.x * settings->mouse_sensitivity;
        input.look_delta.y -= record.mouse_delta.y * settings->mouse_sensitivity;

        // 2. Gamepads ("activity wins": idle pads do not zero active ones)
        const float deadzone = 0.15f;
        for (const auto& gp : record.gamepads) {
            float lx = gp.axes[GAMEPAD_AXIS_LEFT_X];
            float ly = gp.axes[GAMEPAD_AXIS_LEFT_Y];
            float rx = gp.axes[GAMEPAD_AXIS_RIGHT_X];
            float ry = gp.axes[GAMEPAD_AXIS_RIGHT_Y];

            // Stick Y is positive toward the player, which is +Z (backward).
            if (std::abs(lx) > deadzone) input.move_input.x += lx;
            if (std::abs(ly) > deadzone) input.move_input.z += ly;
            if (std::abs(rx) > deadzone) input.look_delta.x -= rx * settings->gamepad_look_rate * dt;
            if (std::abs(ry) > deadzone) input.look_delta.y -= ry * settings->gamepad_look_rate * dt;

            if (gp.buttons[GAMEPAD_BUTTON_LEFT_THUMB])               input.sprint_held  = true;
            if (gp.buttons_pressed[GAMEPAD_BUTTON_RIGHT_FACE_DOWN])  input.jump_pressed = true;
        }

        if (input.jump_pressed) input.jump_press_ms = clock->now_ms;

        // 3. Final Input Normalization
        input.move_input = strafe::math::sanitize_move_input(input.move_input);
    });
}
