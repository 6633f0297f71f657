#pragma once
#include <ecs/ecs.hpp>
#include <string>

// Where the live MovementTuning came from. Stored as a World resource.
struct TuningSource {
    std::string path;
    int         reloads    = 0;
    std::string last_error;  // empty after a successful load
};

// ---------------------------------------------------------------------------
// TuningSystem: Logic phase; F5 re-reads the movement tuning file.
//
// A file that fails to parse or validate is logged and ignored; the tuning
// already in the world stays live.
// ---------------------------------------------------------------------------

class TuningSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Re-reads TuningSource::path into the MovementTuning resource.
    static bool reload(ecs::World& world);
};
