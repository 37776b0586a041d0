#pragma once

#include "host/ecs/components.hpp"
#include "protocol/snapshot.hpp"
#include "sync/sync_config.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace quadsync::host {

struct RunState {
    int32_t wave = 1;
    int32_t score = 0;
    bool intermission_active = false;
    std::optional<float> countdown;
    std::optional<int32_t> pending_wave;
};

// Authoritative simulation state. The gameplay rules driving it live in the
// host executable; this class owns the entities and turns them into snapshots.
class World {
public:
    explicit World(const WorldConfig& config = {});

    uint32_t spawn_enemy(float x, float y, float health, const std::string& kind,
                         glm::vec2 velocity = glm::vec2(0.0f));
    uint32_t spawn_hostile_bullet(glm::vec2 position, glm::vec2 velocity);

    // Single creation path for friendly fire, local or requested by the guest.
    // Returns std::nullopt for a zero or non-finite direction.
    std::optional<uint32_t> spawn_player_bullet(glm::vec2 origin, glm::vec2 direction, ecs::Shooter shooter);

    bool destroy_enemy(uint32_t id);

    // Destroys the enemy once its health reaches zero. Returns true on the kill.
    bool damage_enemy(uint32_t id, float amount);

    void set_pilot(ecs::PilotSlot slot, float x, float y, float rotation);
    void set_pilot_active(ecs::PilotSlot slot, bool active);
    void set_pilot_health(ecs::PilotSlot slot, float health);
    float pilot_max_health(ecs::PilotSlot slot) const;
    protocol::PlayerPose pilot(ecs::PilotSlot slot) const;

    void update(float dt);

    protocol::Snapshot capture_snapshot(double now_ms) const;

    // Entities that cost snapshot bandwidth
    size_t networked_entity_count() const;
    size_t enemy_count() const;
    size_t hostile_bullet_count() const;
    size_t player_bullet_count() const;

    const RunState& run_state() const { return run_state_; }
    void set_wave(int32_t wave) { run_state_.wave = wave; }
    void add_score(int32_t points) { run_state_.score += points; }
    void begin_intermission(float countdown, int32_t pending_wave);
    void end_intermission();
    void set_countdown(float countdown);

    entt::entity find_enemy(uint32_t id) const;
    entt::entity find_hostile_bullet(uint32_t id) const;
    entt::entity find_player_bullet(uint32_t id) const;

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }
    const WorldConfig& config() const { return config_; }

private:
    template<typename Tag>
    entt::entity find_by_network_id(uint32_t id) const;

    entt::entity pilot_entity(ecs::PilotSlot slot) const;

    WorldConfig config_;
    entt::registry registry_;
    entt::entity p1_ = entt::null;
    entt::entity p2_ = entt::null;
    RunState run_state_;

    // Ids are per collection and never reused
    uint32_t next_enemy_id_ = 1;
    uint32_t next_hostile_bullet_id_ = 1;
    uint32_t next_player_bullet_id_ = 1;
};

} // namespace quadsync::host
