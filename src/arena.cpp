#include "arena.hpp"
#include "components.hpp"
#include <ecs/modules/transform.hpp>
#include <vector>

namespace {

struct BlockDesc {
    ecs::Vec3 center;
    ecs::Vec3 half_extents;
    Color4    color;
    BodyType  type = BodyType::Static;
    float     mass = 1.0f;
};

ecs::Entity spawn_block(ecs::World& world, const BlockDesc& d) {
    auto ent = world.create();

    // 1. Transform (must precede physics hooks)
    world.add(ent, ecs::LocalTransform{d.center, ecs::Quat{0, 0, 0, 1}, ecs::Vec3{1, 1, 1}});
    world.add(ent, ecs::WorldTransform{});

    // 2. Collider, then visuals sized to match it
    world.add(ent, BoxCollider{d.half_extents});
    world.add(ent, MeshRenderer{ShapeType::Box, d.color,
                                {2.0f * d.half_extents.x, 2.0f * d.half_extents.y,
                                 2.0f * d.half_extents.z}});
    world.add(ent, WorldTag{});

    // 3. Body last
    RigidBodyConfig cfg;
    cfg.type = d.type;
    cfg.mass = d.mass;
    world.add(ent, std::move(cfg));
    return ent;
}

} // namespace

ecs::Entity Arena::spawn(ecs::World& world) {
    // Floor; top surface at y = 0.
    spawn_block(world, {{0, -0.5f, 0}, {30, 0.5f, 30}, Colors::Concrete});

    // Ledge, 2 m high. Run off the front edge to test the grace period.
    spawn_block(world, {{0, 1.0f, -12}, {4, 1.0f, 3}, Colors::Slate});

    // Wall, 2.5 m high: out of reach of a single jump.
    spawn_block(world, {{-10, 1.25f, -8}, {3, 1.25f, 0.75f}, Colors::Ochre});

    // Floating staircase, 1 m rise per step.
    for (int i = 0; i < 4; i++) {
        const float fi = static_cast<float>(i);
        spawn_block(world, {{8.0f + fi * 3.5f, 0.75f + fi, -4.0f - fi * 2.0f},
                            {1.5f, 0.25f, 1.5f}, Colors::Teal});
    }

    // Loose crates.
    for (int i = 0; i < 3; i++) {
        const float fi = static_cast<float>(i);
        spawn_block(world, {{-4.0f + fi * 1.5f, 0.5f + fi * 1.1f, 4.0f},
                            {0.5f, 0.5f, 0.5f}, Colors::Maroon, BodyType::Dynamic, 10.0f});
    }

    // Player: facing -Z toward the ledge.
    auto player = world.create();
    world.add(player, ecs::LocalTransform{ecs::Vec3{0, 0.1f, 8}, ecs::Quat{0, 0, 0, 1}, ecs::Vec3{1, 1, 1}});
    world.add(player, ecs::WorldTransform{});
    world.add(player, MeshRenderer{ShapeType::Capsule, Colors::White, {0.8f, 1.8f, 0.8f}});
    world.add(player, PlayerTag{});
    world.add(player, PlayerInput{});
    world.add(player, WorldTag{});
    world.add(player, CharacterControllerConfig{});
    return player;
}

void Arena::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
