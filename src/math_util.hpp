#pragma once
#include <ecs/ecs.hpp>
#include <cmath>
#include <algorithm>

namespace strafe::math {

inline constexpr float kPi          = 3.1415926535f;
inline constexpr float kPitchMargin = 0.01f;

/**
 * @brief Normalizes an angle into the range [-PI, PI].
 */
inline float normalize_angle(float angle) {
    while (angle < -kPi) angle += 2.0f * kPi;
    while (angle >  kPi) angle -= 2.0f * kPi;
    return angle;
}

/**
 * @brief Clamps a view pitch to just short of straight up / straight down.
 */
inline float clamp_pitch(float pitch) {
    const float limit = 0.5f * kPi - kPitchMargin;
    return std::clamp(pitch, -limit, limit);
}

inline float length_sq(const ecs::Vec3& v) { return v.x*v.x + v.y*v.y + v.z*v.z; }
inline float length(const ecs::Vec3& v)    { return std::sqrt(length_sq(v)); }

inline float horizontal_length(const ecs::Vec3& v) {
    return std::sqrt(v.x*v.x + v.z*v.z);
}

inline float dot_xz(const ecs::Vec3& a, const ecs::Vec3& b) {
    return a.x*b.x + a.z*b.z;
}

/**
 * @brief Projects onto the XZ plane and normalizes. Zero stays zero.
 */
inline ecs::Vec3 normalize_xz(const ecs::Vec3& v) {
    float len = horizontal_length(v);
    if (len <= 0.0f) return {0, 0, 0};
    return {v.x / len, 0.0f, v.z / len};
}

/**
 * @brief Horizontal forward for a view yaw. Yaw 0 looks down -Z.
 */
inline ecs::Vec3 yaw_forward(float yaw) {
    return {-std::sin(yaw), 0.0f, -std::cos(yaw)};
}

/**
 * @brief Horizontal right for a view yaw. Yaw 0 has +X on the right.
 */
inline ecs::Vec3 yaw_right(float yaw) {
    return {std::cos(yaw), 0.0f, -std::sin(yaw)};
}

/**
 * @brief Full view direction including pitch (positive pitch looks up).
 */
inline ecs::Vec3 view_forward(float yaw, float pitch) {
    float cp = std::cos(pitch);
    return {-std::sin(yaw) * cp, std::sin(pitch), -std::cos(yaw) * cp};
}

/**
 * @brief Input-boundary validation for a move vector.
 *
 * Non-finite axes become 0, each axis is clamped to [-1, 1], and the result
 * is scaled to unit length when its magnitude exceeds 1. The y axis is unused
 * and always returned as 0.
 */
inline ecs::Vec3 sanitize_move_input(const ecs::Vec3& raw) {
    auto axis = [](float v) {
        if (!std::isfinite(v)) return 0.0f;
        return std::clamp(v, -1.0f, 1.0f);
    };
    ecs::Vec3 out = {axis(raw.x), 0.0f, axis(raw.z)};
    float mag_sq = out.x*out.x + out.z*out.z;
    if (mag_sq > 1.0f) {
        float mag = std::sqrt(mag_sq);
        out.x /= mag;
        out.z /= mag;
    }
    return out;
}

} // namespace strafe::math
