#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static float read_float(const json& obj, const char* key, float fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& v = obj.at(key);
    if (!v.is_number())
        throw std::runtime_error(std::string("'") + key + "' must be a number");
    float f = v.get<float>();
    if (!std::isfinite(f))
        throw std::runtime_error(std::string("'") + key + "' must be finite");
    return f;
}

static void require_positive(float v, const char* key) {
    if (v <= 0.0f)
        throw std::runtime_error(std::string("'") + key + "' must be > 0");
}

static void require_non_negative(float v, const char* key) {
    if (v < 0.0f)
        throw std::runtime_error(std::string("'") + key + "' must be >= 0");
}

static void require_range(float v, float lo, float hi, const char* key) {
    if (v < lo || v > hi)
        throw std::runtime_error(std::string("'") + key + "' must be in [" +
                                 std::to_string(lo) + ", " + std::to_string(hi) + "]");
}

static std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("cannot open '" + path + "'");
    return std::string(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>{});
}

// ---------------------------------------------------------------------------
// Section parsers
// ---------------------------------------------------------------------------

static LocomotionParams parse_locomotion(const json& j) {
    LocomotionParams p;
    p.walk_speed           = read_float(j, "walk_speed",           p.walk_speed);
    p.run_speed            = read_float(j, "run_speed",            p.run_speed);
    p.max_speed            = read_float(j, "max_speed",            p.max_speed);
    p.ground_acceleration  = read_float(j, "ground_acceleration",  p.ground_acceleration);
    p.air_acceleration     = read_float(j, "air_acceleration",     p.air_acceleration);
    p.ground_friction      = read_float(j, "ground_friction",      p.ground_friction);
    p.air_friction         = read_float(j, "air_friction",         p.air_friction);
    p.momentum_retention   = read_float(j, "momentum_retention",   p.momentum_retention);
    p.dir_change_boost     = read_float(j, "dir_change_boost",     p.dir_change_boost);
    p.air_control          = read_float(j, "air_control",          p.air_control);
    p.jump_force           = read_float(j, "jump_force",           p.jump_force);
    p.jump_forward_boost   = read_float(j, "jump_forward_boost",   p.jump_forward_boost);
    p.dir_change_threshold = read_float(j, "dir_change_threshold", p.dir_change_threshold);
    p.dir_change_window_ms = read_float(j, "dir_change_window_ms", p.dir_change_window_ms);
    p.momentum_min_speed   = read_float(j, "momentum_min_speed",   p.momentum_min_speed);
    p.idle_stop_speed      = read_float(j, "idle_stop_speed",      p.idle_stop_speed);
    p.fast_speed           = read_float(j, "fast_speed",           p.fast_speed);

    require_positive(p.walk_speed, "walk_speed");
    require_positive(p.run_speed,  "run_speed");
    require_positive(p.max_speed,  "max_speed");
    require_non_negative(p.ground_acceleration, "ground_acceleration");
    require_non_negative(p.air_acceleration,    "air_acceleration");
    require_non_negative(p.ground_friction,     "ground_friction");
    require_non_negative(p.air_friction,        "air_friction");
    require_range(p.momentum_retention, 0.0f, 1.0f, "momentum_retention");
    require_non_negative(p.dir_change_boost,    "dir_change_boost");
    require_range(p.air_control, 0.0f, 1.0f, "air_control");
    require_non_negative(p.jump_force,          "jump_force");
    require_non_negative(p.jump_forward_boost,  "jump_forward_boost");
    require_range(p.dir_change_threshold, -1.0f, 1.0f, "dir_change_threshold");
    require_non_negative(p.dir_change_window_ms, "dir_change_window_ms");
    require_non_negative(p.momentum_min_speed,  "momentum_min_speed");
    require_non_negative(p.idle_stop_speed,     "idle_stop_speed");
    require_non_negative(p.fast_speed,          "fast_speed");
    return p;
}

static JumpTuning parse_jump(const json& j) {
    JumpTuning t;
    t.cooldown_ms      = read_float(j, "cooldown_ms",      t.cooldown_ms);
    t.buffer_window_ms = read_float(j, "buffer_window_ms", t.buffer_window_ms);
    t.coyote_ms        = read_float(j, "coyote_ms",        t.coyote_ms);
    t.air_jump_scale   = read_float(j, "air_jump_scale",   t.air_jump_scale);
    if (j.contains("max_jumps")) {
        if (!j.at("max_jumps").is_number_integer())
            throw std::runtime_error("'max_jumps' must be an integer");
        t.max_jumps = j.at("max_jumps").get<int>();
    }

    require_non_negative(t.cooldown_ms,      "cooldown_ms");
    require_non_negative(t.buffer_window_ms, "buffer_window_ms");
    require_non_negative(t.coyote_ms,        "coyote_ms");
    require_non_negative(t.air_jump_scale,   "air_jump_scale");
    if (t.max_jumps < 1) throw std::runtime_error("'max_jumps' must be >= 1");
    return t;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool ConfigLoader::load_tuning_from_string(const std::string& json_str,
                                           MovementTuning& out,
                                           std::string* error) {
    try {
        json doc = json::parse(json_str);
        MovementTuning parsed;
        if (doc.contains("locomotion")) parsed.locomotion = parse_locomotion(doc.at("locomotion"));
        if (doc.contains("jump"))       parsed.jump       = parse_jump(doc.at("jump"));
        out = parsed;
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool ConfigLoader::load_tuning(const std::string& path, MovementTuning& out,
                               std::string* error) {
    std::string content;
    try {
        content = read_file(path);
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
    return load_tuning_from_string(content, out, error);
}

bool ConfigLoader::load_settings_from_string(const std::string& json_str,
                                             HostSettings& out,
                                             std::string* error) {
    try {
        json doc = json::parse(json_str);
        HostSettings s;

        if (doc.contains("window")) {
            const auto& w = doc.at("window");
            s.window_width  = w.value("width",  s.window_width);
            s.window_height = w.value("height", s.window_height);
            s.window_title  = w.value("title",  s.window_title);
            if (s.window_width <= 0 || s.window_height <= 0)
                throw std::runtime_error("window size must be positive");
        }

        s.fov               = read_float(doc, "fov",               s.fov);
        s.mouse_sensitivity = read_float(doc, "mouse_sensitivity", s.mouse_sensitivity);
        s.gamepad_look_rate = read_float(doc, "gamepad_look_rate", s.gamepad_look_rate);
        s.gravity           = read_float(doc, "gravity",           s.gravity);
        s.max_frame_dt      = read_float(doc, "max_frame_dt",      s.max_frame_dt);
        s.physics_hz        = doc.value("physics_hz", s.physics_hz);
        s.debug             = doc.value("debug",      s.debug);

        require_range(s.fov, 1.0f, 179.0f, "fov");
        require_non_negative(s.mouse_sensitivity, "mouse_sensitivity");
        require_non_negative(s.gamepad_look_rate, "gamepad_look_rate");
        require_positive(s.max_frame_dt, "max_frame_dt");
        if (s.physics_hz <= 0) throw std::runtime_error("'physics_hz' must be > 0");

        out = s;
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool ConfigLoader::load_settings(const std::string& path, HostSettings& out,
                                 std::string* error) {
    std::string content;
    try {
        content = read_file(path);
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
    return load_settings_from_string(content, out, error);
}
