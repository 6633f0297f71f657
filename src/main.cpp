#include "arena.hpp"
#include "components.hpp"
#include "config.hpp"
#include "input_state.hpp"
#include "pipeline.hpp"
#include "modules/camera_module.hpp"
#include "modules/character_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include "modules/tuning_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <algorithm>
#include <string>

static const char* SETTINGS_PATH = "resources/config/settings.json";
static const char* TUNING_PATH   = "resources/config/movement.json";

int main() {
  // --- Configuration (defaults stand in for a missing or invalid file) ---
  HostSettings settings;
  std::string  settings_error;
  const bool   settings_ok = ConfigLoader::load_settings(SETTINGS_PATH, settings, &settings_error);

  MovementTuning tuning;
  std::string    tuning_error;
  const bool     tuning_ok = ConfigLoader::load_tuning(TUNING_PATH, tuning, &tuning_error);

  SetTraceLogLevel(settings.debug ? LOG_DEBUG : LOG_INFO);
  InitWindow(settings.window_width, settings.window_height, settings.window_title.c_str());
  SetExitKey(KEY_NULL);  // Esc releases the mouse instead of quitting
  SetTargetFPS(144);

  if (!settings_ok) TraceLog(LOG_WARNING, "CONFIG: %s", settings_error.c_str());
  if (!tuning_ok)   TraceLog(LOG_WARNING, "TUNING: %s; using defaults", tuning_error.c_str());

  ecs::World world;
  world.set_resource(settings);
  world.set_resource(tuning);
  world.set_resource(TickClock{});
  world.set_resource(InputRecord{});

  // --- Modules (install order is pipeline order within each phase) ---
  strafe::Pipeline pipeline;

  EventBusModule::install(world, pipeline);
  DebugModule::install(world, settings.debug);
  InputModule::install(world, pipeline);
  PhysicsModule::install(world, pipeline);
  CharacterModule::install(world, pipeline);
  TuningModule::install(world, pipeline, TUNING_PATH);
  CharacterModule::install_motor(world, pipeline);
  CameraModule::install(world, pipeline, settings.fov);
  RenderModule::install(world, pipeline);
  DebugModule::install_overlay(world, pipeline);
  RenderModule::install_present(world, pipeline);

  Arena::spawn(world);

  // --- Main Loop ---
  strafe::FixedStep physics_step(1.0f / static_cast<float>(settings.physics_hz));
  bool user_paused = false;

  while (!WindowShouldClose()) {
    const float dt = std::min(GetFrameTime(), settings.max_frame_dt);

    if (IsKeyPressed(KEY_P)) {
        user_paused = !user_paused;
        TraceLog(LOG_INFO, "STRAFE: %s", user_paused ? "paused" : "resumed");
    }
    const bool paused = user_paused || !IsWindowFocused();
    world.resource<TickClock>().paused = paused;

    if (IsKeyPressed(KEY_R)) {
        Arena::unload(world);
        Arena::spawn(world);
        physics_step.reset();
        TraceLog(LOG_INFO, "STRAFE: arena reset");
    }

    // 1. Update Input & Logic
    pipeline.update(world, dt, paused);

    // 2. Step Physics (Fixed Timestep)
    if (!paused) {
        physics_step.accumulate(dt);
        while (physics_step.take()) {
            pipeline.step_physics(world, physics_step.step());
        }
    }

    // 3. Render
    pipeline.render(world);
  }

  Arena::unload(world);
  CloseWindow();
  return 0;
}
