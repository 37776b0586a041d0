#include "combat_system.hpp"
#include "host/ecs/components.hpp"
#include "host/world.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>
#include <vector>

namespace quadsync::host::systems {

namespace {

float distance(float x1, float y1, float x2, float y2) {
    float dx = x2 - x1;
    float dy = y2 - y1;
    return std::sqrt(dx * dx + dy * dy);
}

} // anonymous namespace

uint32_t update_combat(World& world, float hit_radius, float damage) {
    auto& registry = world.registry();

    // Collect first; damage_enemy destroys entities
    std::vector<entt::entity> spent_bullets;
    std::vector<uint32_t> hit_enemies;

    auto bullet_view = registry.view<ecs::PlayerBulletTag, ecs::Transform>();
    auto enemy_view = registry.view<ecs::EnemyTag, ecs::NetworkId, ecs::Transform>();

    for (auto bullet : bullet_view) {
        const auto& bt = bullet_view.get<ecs::Transform>(bullet);

        for (auto enemy : enemy_view) {
            const auto& et = enemy_view.get<ecs::Transform>(enemy);
            if (distance(bt.x, bt.y, et.x, et.y) <= hit_radius) {
                spent_bullets.push_back(bullet);
                hit_enemies.push_back(enemy_view.get<ecs::NetworkId>(enemy).id);
                break;
            }
        }
    }

    for (auto bullet : spent_bullets) {
        registry.destroy(bullet);
    }

    uint32_t kills = 0;
    for (uint32_t id : hit_enemies) {
        if (world.damage_enemy(id, damage)) {
            ++kills;
        }
    }
    return kills;
}

uint32_t update_pilot_hits(World& world, float hit_radius, float damage) {
    auto& registry = world.registry();

    std::vector<entt::entity> spent_bullets;
    uint32_t hits = 0;

    for (auto slot : {ecs::PilotSlot::P1, ecs::PilotSlot::P2}) {
        auto pose = world.pilot(slot);
        if (!pose.active) {
            continue;
        }

        float health = pose.health;
        auto bullet_view = registry.view<ecs::HostileBulletTag, ecs::Transform>();
        for (auto bullet : bullet_view) {
            if (std::find(spent_bullets.begin(), spent_bullets.end(), bullet) != spent_bullets.end()) {
                continue;
            }
            const auto& bt = bullet_view.get<ecs::Transform>(bullet);
            if (distance(bt.x, bt.y, pose.x, pose.y) <= hit_radius) {
                spent_bullets.push_back(bullet);
                health -= damage;
                ++hits;
            }
        }

        if (health != pose.health) {
            world.set_pilot_health(slot, health > 0.0f ? health : world.pilot_max_health(slot));
        }
    }

    for (auto bullet : spent_bullets) {
        registry.destroy(bullet);
    }
    return hits;
}

} // namespace quadsync::host::systems
