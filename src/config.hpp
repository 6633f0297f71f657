#pragma once
#include <string>

// ---------------------------------------------------------------------------
// Movement tuning: shared read-only by every character controller.
//
// Stored as a World resource. Replaced wholesale on hot reload; never
// mutated field by field during a session. Times are in milliseconds.
// ---------------------------------------------------------------------------

struct LocomotionParams {
    float walk_speed           = 6.0f;
    float run_speed            = 10.0f;
    float max_speed            = 12.0f;  // absolute horizontal cap

    float ground_acceleration  = 150.0f;
    float air_acceleration     = 20.0f;
    float ground_friction      = 0.5f;
    float air_friction         = 0.05f;

    float momentum_retention   = 0.9f;   // share of velocity kept through a sharp turn
    float dir_change_boost     = 4.0f;   // acceleration multiplier from rest / after a turn
    float air_control          = 0.9f;

    float jump_force           = 7.5f;
    float jump_forward_boost   = 0.2f;   // fraction of walk_speed added on a ground jump

    float dir_change_threshold = 0.85f;  // cosine; below this a turn counts as sharp
    float dir_change_window_ms = 100.0f;

    float momentum_min_speed   = 2.0f;
    float idle_stop_speed      = 0.01f;
    float fast_speed           = 5.0f;   // above this, idle friction is halved
};

struct JumpTuning {
    float cooldown_ms      = 100.0f;
    float buffer_window_ms = 200.0f;
    float coyote_ms        = 150.0f;
    int   max_jumps        = 2;
    float air_jump_scale   = 0.9f;
};

struct MovementTuning {
    LocomotionParams locomotion;
    JumpTuning       jump;
};

// ---------------------------------------------------------------------------
// Host settings: window, view and simulation rate. Read once at startup.
// ---------------------------------------------------------------------------

struct HostSettings {
    int         window_width      = 1280;
    int         window_height     = 720;
    std::string window_title      = "strafe";
    float       fov               = 95.0f;
    float       mouse_sensitivity = 0.002f;  // radians per pixel
    float       gamepad_look_rate = 2.5f;    // radians per second at full deflection
    float       gravity           = -20.0f;
    int         physics_hz        = 120;
    float       max_frame_dt      = 1.0f / 30.0f;
    bool        debug             = false;
};

// ---------------------------------------------------------------------------
// ConfigLoader: reads JSON configuration files.
//
// Every key is optional and falls back to the struct default. Validation
// failures reject the whole document: `out` is left untouched and `error`
// (when non-null) receives a description.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    static bool load_tuning(const std::string& path, MovementTuning& out,
                            std::string* error = nullptr);
    static bool load_tuning_from_string(const std::string& json, MovementTuning& out,
                                        std::string* error = nullptr);

    static bool load_settings(const std::string& path, HostSettings& out,
                              std::string* error = nullptr);
    static bool load_settings_from_string(const std::string& json, HostSettings& out,
                                          std::string* error = nullptr);
};
