#pragma once
#include <raylib.h>
#include <vector>

struct GamepadState {
    int id = -1;
    bool connected = false;
    float axes[8] = {0};
    bool buttons[32] = {false};
    bool buttons_pressed[32] = {false};
};

// Raw device state for one frame, written by InputGatherSystem.
// Stored as a World resource; nothing else calls Raylib input functions.
struct InputRecord {
    // Keyboard
    bool keys_down[512] = {false};
    bool keys_pressed[512] = {false};

    // Mouse
    Vector2 mouse_delta = {0, 0};
    bool mouse_buttons_pressed[8] = {false};
    bool mouse_captured = false;  // cursor locked to the window for mouse look

    // Gamepads (filtered to real controllers)
    std::vector<GamepadState> gamepads;
};
