#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

static bool IsRealGamepad(int i) {
    if (!IsGamepadAvailable(i)) return false;
    if (GetGamepadAxisCount(i) < 4) return false;

    const char* name = GetGamepadName(i);
    if (!name) return false;
    const std::string n = name;
    const char* blacklist[] = {
        "Keyboard", "Mouse", "Trackpad", "Touchpad",
        "SMC", "Accelerometer", "Mic", "Headset",
        "Video", "Sensor", "Consumer Control", "System Control",
        "Power Button", "Speaker", "HDA Intel", "Apple Internal Keyboard"
    };
    for (const char* b : blacklist) {
        if (n.find(b) != std::string::npos) return false;
    }
    return true;
}

static void update_capture(InputRecord& input) {
    if (!input.mouse_captured && input.mouse_buttons_pressed[MOUSE_BUTTON_LEFT]) {
        DisableCursor();
        input.mouse_captured = true;
        TraceLog(LOG_DEBUG, "INPUT: mouse captured");
    } else if (input.mouse_captured && input.keys_pressed[KEY_ESCAPE]) {
        EnableCursor();
        input.mouse_captured = false;
        TraceLog(LOG_DEBUG, "INPUT: mouse released");
    }
}

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    // 1. Keyboard
    for (int i = 0; i < 512; i++) {
        input.keys_down[i]    = IsKeyDown(i);
        input.keys_pressed[i] = IsKeyPressed(i);
    }

    // 2. Mouse
    for (int i = 0; i < 8; i++) {
        input.mouse_buttons_pressed[i] = IsMouseButtonPressed(i);
    }
    update_capture(input);
    input.mouse_delta = input.mouse_captured ? GetMouseDelta() : Vector2{0, 0};

    // 3. Gamepads
    static int last_gamepad_count = -1;
    input.gamepads.clear();
    for (int i = 0; i < 16; i++) {
        if (!IsRealGamepad(i)) continue;

        GamepadState gp;
        gp.id        = i;
        gp.connected = true;

        int axis_count = GetGamepadAxisCount(i);
        for (int a = 0; a < 8 && a < axis_count; a++) {
            gp.axes[a] = GetGamepadAxisMovement(i, a);
        }
        for (int b = 0; b < 32; b++) {
            gp.buttons[b]         = IsGamepadButtonDown(i, b);
            gp.buttons_pressed[b] = IsGamepadButtonPressed(i, b);
        }
        input.gamepads.push_back(gp);
    }

    const int count = static_cast<int>(input.gamepads.size());
    if (count != last_gamepad_count) {
        TraceLog(LOG_INFO, "INPUT: %d gamepad(s) connected", count);
        last_gamepad_count = count;
    }
}
