#include "tuning.hpp"
#include "../config.hpp"
#include "../input_state.hpp"
#include "character_state.hpp"
#include <raylib.h>

bool TuningSystem::reload(ecs::World& world) {
    auto* source = world.try_resource<TuningSource>();
    if (!source) return false;

    MovementTuning tuning;
    std::string    error;
    if (!ConfigLoader::load_tuning(source->path, tuning, &error)) {
        source->last_error = error;
        TraceLog(LOG_WARNING, "TUNING: reload of %s rejected: %s",
                 source->path.c_str(), error.c_str());
        return false;
    }

    source->last_error.clear();
    source->reloads++;
    TraceLog(LOG_INFO, "TUNING: reloaded %s (walk %.2f, run %.2f, jump %.2f, max jumps %d)",
             source->path.c_str(), tuning.locomotion.walk_speed, tuning.locomotion.run_speed,
             tuning.locomotion.jump_force, tuning.jump.max_jumps);
    CharacterStateSystem::retune(world, tuning);
    return true;
}

void TuningSystem::Update(ecs::World& world, float /*dt*/) {
    auto* input = world.try_resource<InputRecord>();
    if (!input || !input->keys_pressed[KEY_F5]) return;
    reload(world);
}
