#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T>: typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry: flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Registering the same type twice is a no-op.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (world.try_resource<Events<T>>()) return;
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

// Emitted by CharacterStateSystem when a buffered jump request is consumed.
// jump_number: jump_count after the jump (1 = ground/coyote jump).
// impulse: vertical velocity written to the body (m/s).
// ground: true for a ground or coyote jump, false for an air jump.
struct JumpEvent {
    ecs::Entity entity;
    int         jump_number;
    float       impulse;
    bool        ground;
};

// Emitted by CharacterStateSystem on the Airborne -> Grounded edge.
// air_ms: time since the character left the ground.
struct LandEvent {
    ecs::Entity entity;
    double      air_ms;
};
