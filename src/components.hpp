#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cstdint>
#include <limits>
#include <optional>

// ---------------------------------------------------------------------------
// Data components and world resources.
//
// Free of Jolt and Raylib so the headless test target can include it.
// Runtime links into the Jolt simulation live in physics_handles.hpp.
// ---------------------------------------------------------------------------

// Sentinel for "has never happened" timestamps. (now - kNeverMs) is +inf, so
// every elapsed-time window comparison treats it as long expired.
inline constexpr double kNeverMs = -std::numeric_limits<double>::infinity();

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

enum class ShapeType { Box, Capsule };

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White    = {1.00f, 1.00f, 1.00f, 1.0f};
    inline constexpr Color4 Concrete = {0.45f, 0.45f, 0.48f, 1.0f};
    inline constexpr Color4 Slate    = {0.30f, 0.33f, 0.40f, 1.0f};
    inline constexpr Color4 Ochre    = {0.80f, 0.62f, 0.25f, 1.0f};
    inline constexpr Color4 Teal     = {0.20f, 0.55f, 0.55f, 1.0f};
    inline constexpr Color4 Maroon   = {0.75f, 0.13f, 0.22f, 1.0f};
}

struct MeshRenderer {
    ShapeType shape        = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
};

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

// If present, PhysicsSystem creates a Jolt body for the entity.
struct RigidBodyConfig {
    BodyType type        = BodyType::Dynamic;
    float    mass        = 1.0f;
    float    friction    = 0.5f;
    float    restitution = 0.0f;
};

// If present, CharacterMotorSystem creates a Jolt CharacterVirtual.
struct CharacterControllerConfig {
    float height          = 1.8f;
    float radius          = 0.4f;
    float mass            = 75.0f;
    float max_slope_angle = 45.0f; // degrees
    float eye_height      = 1.6f;  // above the feet
};

// ---------------------------------------------------------------------------
// PhysicsBody: the character's view of its physics body.
//
// CharacterMotorSystem writes position, velocity and on_ground after each
// ExtendedUpdate. The movement core reads all three and writes velocity
// (x/z always, y only on a jump); the motor pushes velocity back to Jolt.
// ---------------------------------------------------------------------------

struct PhysicsBody {
    ecs::Vec3 position  = {0, 0, 0};
    ecs::Vec3 velocity  = {0, 0, 0};
    bool      on_ground = false;
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

// Per-tick input snapshot, produced once by PlayerInputSystem.
// move_input: x = strafe (+right), z = forward axis (-1 is forward), y unused.
struct PlayerInput {
    ecs::Vec3 move_input    = {0, 0, 0};
    ecs::Vec2 look_delta    = {0, 0};  // radians this tick (yaw, pitch)
    bool      sprint_held   = false;
    bool      jump_pressed  = false;   // press edge this tick
    double    jump_press_ms = kNeverMs;
};

// What the character wants to do this tick, derived from PlayerInput by
// CharacterInputSystem. Consumed read-only by the movement core.
struct CharacterIntent {
    ecs::Vec3 move_input     = {0, 0, 0};
    bool      sprint         = false;
    bool      jump_pressed   = false;
    double    jump_press_ms  = kNeverMs;
};

// Authoritative movement state, owned by the character.
struct CharacterState {
    ecs::Vec3 position = {0, 0, 0};  // mirrored from PhysicsBody after each tick
    ecs::Vec3 velocity = {0, 0, 0};

    float yaw   = 0.0f;
    float pitch = 0.0f;  // kept inside (-pi/2 + eps, pi/2 - eps)

    bool on_ground  = false;
    int  jump_count = 0;

    double last_jump_ms     = kNeverMs;
    double last_grounded_ms = kNeverMs;  // time of the last ground -> air edge

    bool   jump_requested  = false;
    double jump_request_ms = kNeverMs;

    bool sprinting = false;

    // One-shot: set by a ground jump, consumed by LocomotionSystem.
    bool forward_boost_pending = false;
};

// Tick-to-tick memory of the locomotion model.
struct LocomotionState {
    ecs::Vec3 last_direction = {0, 0, 0};

    // Set when a sharp turn is detected; active until the window elapses.
    std::optional<double> dir_change_armed_ms;
};

struct MainCamera {
    ecs::Vec3 position = {0, 1.6f, 0};
    ecs::Vec3 target   = {0, 1.6f, -1};
    ecs::Vec3 forward  = {0, 0, -1};
    float     fovy     = 95.0f;
};

// Single injected time source for a tick. Every timing decision made during a
// tick reads now_ms; nothing samples a wall clock.
struct TickClock {
    double        now_ms = 0.0;
    std::uint64_t tick   = 0;
    float         dt     = 0.0f;
    bool          paused = false;

    void advance(float frame_dt) {
        dt      = frame_dt;
        now_ms += static_cast<double>(frame_dt) * 1000.0;
        ++tick;
    }
};

struct PlayerTag {};
struct WorldTag {};
