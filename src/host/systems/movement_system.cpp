#include "movement_system.hpp"
#include "host/ecs/components.hpp"
#include <algorithm>
#include <vector>

namespace quadsync::host::systems {

void update_movement(entt::registry& registry, float dt, const WorldConfig& config) {
    auto view = registry.view<ecs::Transform, ecs::Velocity>();

    for (auto entity : view) {
        auto& transform = view.get<ecs::Transform>(entity);
        const auto& velocity = view.get<ecs::Velocity>(entity);

        transform.x += velocity.x * dt;
        transform.y += velocity.y * dt;
    }

    // Enemies bounce off the arena walls
    auto enemy_view = registry.view<ecs::EnemyTag, ecs::Transform, ecs::Velocity>();
    for (auto entity : enemy_view) {
        auto& transform = enemy_view.get<ecs::Transform>(entity);
        auto& velocity = enemy_view.get<ecs::Velocity>(entity);

        if (transform.x < 0.0f || transform.x > config.width) {
            velocity.x = -velocity.x;
        }
        if (transform.y < 0.0f || transform.y > config.height) {
            velocity.y = -velocity.y;
        }
        transform.x = std::clamp(transform.x, 0.0f, config.width);
        transform.y = std::clamp(transform.y, 0.0f, config.height);
    }
}

size_t update_projectiles(entt::registry& registry, float dt, const WorldConfig& config) {
    std::vector<entt::entity> expired;

    auto view = registry.view<ecs::Projectile, ecs::Transform>();
    for (auto entity : view) {
        auto& projectile = view.get<ecs::Projectile>(entity);
        const auto& transform = view.get<ecs::Transform>(entity);

        projectile.age += dt;

        bool out_of_bounds = transform.x < -config.bounds_margin ||
                             transform.y < -config.bounds_margin ||
                             transform.x > config.width + config.bounds_margin ||
                             transform.y > config.height + config.bounds_margin;

        if (projectile.age >= projectile.lifetime || out_of_bounds) {
            expired.push_back(entity);
        }
    }

    // Destroy after iterating so the view stays valid
    for (auto entity : expired) {
        registry.destroy(entity);
    }
    return expired.size();
}

} // namespace quadsync::host::systems
