#pragma once
#include <ecs/ecs.hpp>
#include <algorithm>
#include <vector>
#include <functional>

namespace strafe {

/**
 * @brief Manages groups of systems categorized by execution phase.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(func); }
    void add_logic(SystemFunc func) { logic_.push_back(func); }
    void add_physics(SystemFunc func) { physics_.push_back(func); }
    void add_render(SystemFunc func) { render_.push_back(func); }

    /**
     * @brief Executes the standard update flow.
     *
     * Pre-update always runs so pause and capture toggles keep working.
     * A paused frame skips the logic phase entirely.
     */
    void update(ecs::World& world, float dt, bool paused = false) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        if (!paused) {
            for (auto& sys : logic_) sys(world, dt);
        }

        // 3. Sync structural changes before physics
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems.
     */
    void step_physics(ecs::World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(ecs::World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    std::size_t logic_count() const { return logic_.size(); }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

/**
 * @brief Fixed-timestep accumulator for the physics phase.
 *
 * Frame time is added once per frame; take() hands out whole steps. The
 * backlog is capped so a long stall cannot trigger a spiral of catch-up
 * steps.
 */
class FixedStep {
public:
    explicit FixedStep(float step, int max_steps = 8)
        : step_(step), max_steps_(max_steps) {}

    void accumulate(float frame_dt) {
        accumulator_ = std::min(accumulator_ + frame_dt, step_ * static_cast<float>(max_steps_));
    }

    bool take() {
        if (accumulator_ < step_) return false;
        accumulator_ -= step_;
        return true;
    }

    void reset() { accumulator_ = 0.0f; }

    float step() const { return step_; }
    float pending() const { return accumulator_; }

private:
    float step_;
    int   max_steps_;
    float accumulator_ = 0.0f;
};

} // namespace strafe
