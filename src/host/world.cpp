#include "world.hpp"
#include "host/systems/movement_system.hpp"
#include <algorithm>
#include <cmath>

namespace quadsync::host {

using namespace quadsync::protocol;

World::World(const WorldConfig& config)
    : config_(config) {
    p1_ = registry_.create();
    registry_.emplace<ecs::Pilot>(p1_, ecs::PilotSlot::P1, true);
    registry_.emplace<ecs::Transform>(p1_, config_.width * 0.25f, config_.height * 0.5f, 0.0f);
    registry_.emplace<ecs::Health>(p1_);

    // The guest pilot stays inactive until its first pose arrives
    p2_ = registry_.create();
    registry_.emplace<ecs::Pilot>(p2_, ecs::PilotSlot::P2, false);
    registry_.emplace<ecs::Transform>(p2_, config_.width * 0.75f, config_.height * 0.5f, 0.0f);
    registry_.emplace<ecs::Health>(p2_);
}

uint32_t World::spawn_enemy(float x, float y, float health, const std::string& kind, glm::vec2 velocity) {
    auto entity = registry_.create();
    uint32_t id = next_enemy_id_++;

    registry_.emplace<ecs::NetworkId>(entity, id);
    registry_.emplace<ecs::Transform>(entity, x, y, 0.0f);
    registry_.emplace<ecs::Velocity>(entity, velocity.x, velocity.y);
    registry_.emplace<ecs::Health>(entity, health, health);
    registry_.emplace<ecs::EnemyInfo>(entity, kind);
    registry_.emplace<ecs::EnemyTag>(entity);
    return id;
}

uint32_t World::spawn_hostile_bullet(glm::vec2 position, glm::vec2 velocity) {
    auto entity = registry_.create();
    uint32_t id = next_hostile_bullet_id_++;

    registry_.emplace<ecs::NetworkId>(entity, id);
    registry_.emplace<ecs::Transform>(entity, position.x, position.y, std::atan2(velocity.y, velocity.x));
    registry_.emplace<ecs::Velocity>(entity, velocity.x, velocity.y);
    registry_.emplace<ecs::Projectile>(entity, 0.0f, config_.bullet_lifetime_s, ecs::Shooter::Host);
    registry_.emplace<ecs::HostileBulletTag>(entity);
    return id;
}

std::optional<uint32_t> World::spawn_player_bullet(glm::vec2 origin, glm::vec2 direction, ecs::Shooter shooter) {
    if (!std::isfinite(origin.x) || !std::isfinite(origin.y)) {
        return std::nullopt;
    }
    float len = glm::length(direction);
    if (!std::isfinite(len) || len <= 0.0f) {
        return std::nullopt;
    }
    glm::vec2 dir = direction / len;
    glm::vec2 velocity = dir * config_.player_bullet_speed;

    auto entity = registry_.create();
    uint32_t id = next_player_bullet_id_++;

    registry_.emplace<ecs::NetworkId>(entity, id);
    registry_.emplace<ecs::Transform>(entity, origin.x, origin.y, std::atan2(dir.y, dir.x));
    registry_.emplace<ecs::Velocity>(entity, velocity.x, velocity.y);
    registry_.emplace<ecs::Projectile>(entity, 0.0f, config_.bullet_lifetime_s, shooter);
    registry_.emplace<ecs::PlayerBulletTag>(entity);
    return id;
}

bool World::destroy_enemy(uint32_t id) {
    auto entity = find_enemy(id);
    if (entity == entt::null) {
        return false;
    }
    registry_.destroy(entity);
    return true;
}

bool World::damage_enemy(uint32_t id, float amount) {
    auto entity = find_enemy(id);
    if (entity == entt::null) {
        return false;
    }

    auto& health = registry_.get<ecs::Health>(entity);
    health.current = std::max(0.0f, health.current - amount);
    if (health.is_alive()) {
        return false;
    }
    registry_.destroy(entity);
    return true;
}

void World::set_pilot(ecs::PilotSlot slot, float x, float y, float rotation) {
    auto& transform = registry_.get<ecs::Transform>(pilot_entity(slot));
    transform.x = x;
    transform.y = y;
    transform.rotation = rotation;
}

void World::set_pilot_active(ecs::PilotSlot slot, bool active) {
    registry_.get<ecs::Pilot>(pilot_entity(slot)).active = active;
}

void World::set_pilot_health(ecs::PilotSlot slot, float health) {
    registry_.get<ecs::Health>(pilot_entity(slot)).current = health;
}

float World::pilot_max_health(ecs::PilotSlot slot) const {
    return registry_.get<ecs::Health>(pilot_entity(slot)).max;
}

PlayerPose World::pilot(ecs::PilotSlot slot) const {
    auto entity = pilot_entity(slot);
    const auto& transform = registry_.get<ecs::Transform>(entity);

    PlayerPose pose;
    pose.x = transform.x;
    pose.y = transform.y;
    pose.rotation = transform.rotation;
    pose.health = registry_.get<ecs::Health>(entity).current;
    pose.active = registry_.get<ecs::Pilot>(entity).active;
    return pose;
}

void World::update(float dt) {
    systems::update_movement(registry_, dt, config_);
    systems::update_projectiles(registry_, dt, config_);
}

Snapshot World::capture_snapshot(double now_ms) const {
    Snapshot snapshot;
    snapshot.timestamp_ms = now_ms;
    snapshot.players.p1 = pilot(ecs::PilotSlot::P1);
    snapshot.players.p2 = pilot(ecs::PilotSlot::P2);

    auto enemy_view = registry_.view<ecs::EnemyTag, ecs::NetworkId, ecs::Transform, ecs::Health, ecs::EnemyInfo>();
    for (auto entity : enemy_view) {
        const auto& transform = enemy_view.get<ecs::Transform>(entity);
        const auto& health = enemy_view.get<ecs::Health>(entity);

        EnemyRecord record;
        record.id = enemy_view.get<ecs::NetworkId>(entity).id;
        record.x = transform.x;
        record.y = transform.y;
        record.health = health.current;
        record.kind = enemy_view.get<ecs::EnemyInfo>(entity).kind;
        record.active = health.is_alive();
        snapshot.enemies.push_back(std::move(record));
    }

    auto hostile_view = registry_.view<ecs::HostileBulletTag, ecs::NetworkId, ecs::Transform, ecs::Velocity>();
    for (auto entity : hostile_view) {
        const auto& transform = hostile_view.get<ecs::Transform>(entity);
        const auto& velocity = hostile_view.get<ecs::Velocity>(entity);

        HostileBulletRecord record;
        record.id = hostile_view.get<ecs::NetworkId>(entity).id;
        record.x = transform.x;
        record.y = transform.y;
        record.vx = velocity.x;
        record.vy = velocity.y;
        snapshot.bullets.push_back(record);
    }

    auto friendly_view = registry_.view<ecs::PlayerBulletTag, ecs::NetworkId, ecs::Transform, ecs::Velocity>();
    for (auto entity : friendly_view) {
        const auto& transform = friendly_view.get<ecs::Transform>(entity);
        const auto& velocity = friendly_view.get<ecs::Velocity>(entity);

        FriendlyBulletRecord record;
        record.id = friendly_view.get<ecs::NetworkId>(entity).id;
        record.x = transform.x;
        record.y = transform.y;
        record.vx = velocity.x;
        record.vy = velocity.y;
        record.rotation = transform.rotation;
        snapshot.player_bullets.push_back(record);
    }

    // Storage order depends on destruction history; keep the wire order stable
    auto by_id = [](const auto& a, const auto& b) { return a.id < b.id; };
    std::sort(snapshot.enemies.begin(), snapshot.enemies.end(), by_id);
    std::sort(snapshot.bullets.begin(), snapshot.bullets.end(), by_id);
    std::sort(snapshot.player_bullets.begin(), snapshot.player_bullets.end(), by_id);

    snapshot.wave = run_state_.wave;
    snapshot.score = run_state_.score;
    snapshot.intermission_active = run_state_.intermission_active;
    snapshot.countdown = run_state_.countdown;
    snapshot.pending_wave = run_state_.pending_wave;
    return snapshot;
}

size_t World::networked_entity_count() const {
    return enemy_count() + hostile_bullet_count() + player_bullet_count();
}

size_t World::enemy_count() const {
    return registry_.view<ecs::EnemyTag>().size();
}

size_t World::hostile_bullet_count() const {
    return registry_.view<ecs::HostileBulletTag>().size();
}

size_t World::player_bullet_count() const {
    return registry_.view<ecs::PlayerBulletTag>().size();
}

void World::begin_intermission(float countdown, int32_t pending_wave) {
    run_state_.intermission_active = true;
    run_state_.countdown = countdown;
    run_state_.pending_wave = pending_wave;
}

void World::end_intermission() {
    run_state_.intermission_active = false;
    run_state_.countdown.reset();
    if (run_state_.pending_wave) {
        run_state_.wave = *run_state_.pending_wave;
    }
    run_state_.pending_wave.reset();
}

void World::set_countdown(float countdown) {
    if (run_state_.intermission_active) {
        run_state_.countdown = countdown;
    }
}

entt::entity World::find_enemy(uint32_t id) const {
    return find_by_network_id<ecs::EnemyTag>(id);
}

entt::entity World::find_hostile_bullet(uint32_t id) const {
    return find_by_network_id<ecs::HostileBulletTag>(id);
}

entt::entity World::find_player_bullet(uint32_t id) const {
    return find_by_network_id<ecs::PlayerBulletTag>(id);
}

template<typename Tag>
entt::entity World::find_by_network_id(uint32_t id) const {
    auto view = registry_.view<Tag, ecs::NetworkId>();
    for (auto entity : view) {
        if (view.template get<ecs::NetworkId>(entity).id == id) {
            return entity;
        }
    }
    return entt::null;
}

entt::entity World::pilot_entity(ecs::PilotSlot slot) const {
    return slot == ecs::PilotSlot::P1 ? p1_ : p2_;
}

} // namespace quadsync::host
