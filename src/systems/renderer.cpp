#include "renderer.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"
#include <raylib.h>
#include <rlgl.h>
#include <cstdio>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static inline Color darken(Color c) {
    return Color{static_cast<unsigned char>(c.r / 2), static_cast<unsigned char>(c.g / 2),
                 static_cast<unsigned char>(c.b / 2), c.a};
}

static void draw_crosshair() {
    const int cx = GetScreenWidth() / 2;
    const int cy = GetScreenHeight() / 2;
    DrawLine(cx - 8, cy, cx + 8, cy, RAYWHITE);
    DrawLine(cx, cy - 8, cx, cy + 8, RAYWHITE);
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    // 1. Build Camera3D from MainCamera data
    Camera3D camera = {};
    camera.up         = {0, 1, 0};
    camera.projection = CAMERA_PERSPECTIVE;
    if (auto* cam = world.try_resource<MainCamera>()) {
        camera.position = {cam->position.x, cam->position.y, cam->position.z};
        camera.target   = {cam->target.x,   cam->target.y,   cam->target.z};
        camera.fovy     = cam->fovy;
    }

    // 2. Render Scene. The player's own body is not drawn in first person.
    BeginMode3D(camera);
        DrawGrid(100, 2.0f);
        world.each<WorldTransform, MeshRenderer>(
            [&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
                if (world.has<PlayerTag>(e)) return;

                rlPushMatrix();
                rlMultMatrixf((float*)&wt.matrix);
                const Color     col = to_raylib(mesh.color);
                const ecs::Vec3 s   = mesh.scale_offset;
                switch (mesh.shape) {
                    case ShapeType::Box:
                        DrawCube({0,0,0}, s.x, s.y, s.z, col);
                        DrawCubeWires({0,0,0}, s.x, s.y, s.z, darken(col));
                        break;
                    case ShapeType::Capsule:
                        DrawCapsule({0, -0.5f * s.y, 0}, {0, 0.5f * s.y, 0}, 0.5f * s.x, 8, 8, col);
                        break;
                }
                rlPopMatrix();
            });
    EndMode3D();

    // 3. Render UI
    draw_crosshair();
    DrawText("WASD / L-STICK: Move | SHIFT / L3: Sprint | SPACE / SOUTH: Jump (Double)", 10, 10, 20, LIGHTGRAY);
    DrawText("R: Reset | P: Pause | F3: Debug | F5: Reload Tuning | ESC: Release Mouse",  10, 35, 20, YELLOW);

    world.single<PlayerTag, PhysicsBody>([&](Entity, PlayerTag&, PhysicsBody& body) {
        char b[32];
        std::snprintf(b, sizeof(b), "%.1f m/s", strafe::math::horizontal_length(body.velocity));
        DrawText(b, 10, GetScreenHeight() - 30, 20, RAYWHITE);
    });

    auto* input = world.try_resource<InputRecord>();
    if (input && !input->mouse_captured) {
        const char* hint = "CLICK TO CAPTURE MOUSE";
        DrawText(hint, (GetScreenWidth() - MeasureText(hint, 20)) / 2, GetScreenHeight() / 2 + 30, 20, SKYBLUE);
    }

    auto* clock = world.try_resource<TickClock>();
    if (clock && clock->paused) {
        const char* label = "PAUSED";
        DrawText(label, (GetScreenWidth() - MeasureText(label, 40)) / 2, GetScreenHeight() / 2 - 60, 40, ORANGE);
    }
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}
