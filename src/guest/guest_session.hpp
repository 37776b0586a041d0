#pragma once

#include "guest/ecs/components.hpp"
#include "net/transport.hpp"
#include "protocol/snapshot.hpp"
#include "sync/bullet_predictor.hpp"
#include "sync/entity_interpolator.hpp"
#include "sync/latency_estimator.hpp"
#include "sync/optimistic_predictor.hpp"
#include "sync/sync_config.hpp"
#include "sync/tick_context.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>

namespace quadsync::guest {

struct RunState {
    int32_t wave = 0;
    int32_t score = 0;
    bool intermission_active = false;
    std::optional<float> countdown;
    std::optional<int32_t> pending_wave;
};

// Guest end of the link. Rebuilds the host's world from snapshots into a local
// entity pool and keeps it moving smoothly between them.
//
// Incoming snapshots land in a single slot; update() consumes that slot at most
// once per frame, so a frame never sees two snapshots or half of one. An id
// missing from a snapshot is a deletion.
class GuestSession {
public:
    struct Stats {
        uint64_t snapshots_applied = 0;
        uint64_t snapshots_superseded = 0;  // Replaced in the slot before a frame took them
        uint64_t stale_dropped = 0;
        uint64_t malformed_dropped = 0;
        uint64_t shots_fired = 0;
        uint64_t shots_reconciled = 0;
        uint64_t shots_expired = 0;
        uint64_t enemies_spawned = 0;
        uint64_t enemies_removed = 0;
    };

    explicit GuestSession(const SyncConfig& config);

    void attach(std::shared_ptr<net::Transport> transport);
    void detach();

    void handle_message(protocol::MessageType type, std::span<const uint8_t> payload);

    // Put a decoded snapshot in the slot, replacing anything not yet applied.
    // `received_ms` is the local wall clock when it came off the wire; latency
    // and bullet samples are taken at that time, not at apply time.
    void stage_snapshot(protocol::Snapshot snapshot, double received_ms);
    bool has_pending_snapshot() const { return pending_.has_value(); }

    void update(const TickContext& ctx);

    // Send a fire request and show the shot locally right away. Returns false
    // while the cooldown runs or for an unusable direction.
    bool fire(float x, float y, float dir_x, float dir_y, double now_ms);

    // Report the local pilot to the host, throttled. Returns true if sent.
    bool send_pose(float x, float y, float rotation, bool active, double now_ms);

    // Drop every tracked entity and all prediction state
    void stop();

    // Rendered positions, as of the last update()
    std::optional<glm::vec2> enemy_position(uint32_t id) const;
    std::optional<glm::vec2> hostile_bullet_position(uint32_t id) const;
    std::optional<glm::vec2> friendly_bullet_position(uint32_t id) const;
    std::optional<glm::vec2> speculative_shot_position(int32_t id) const;
    std::optional<glm::vec2> remote_pilot_position() const;

    bool has_enemy(uint32_t id) const { return enemies_.count(id) > 0; }
    size_t enemy_count() const { return enemies_.size(); }
    size_t hostile_bullet_count() const { return hostile_bullets_.size(); }
    size_t friendly_bullet_count() const { return friendly_bullets_.size(); }
    size_t speculative_shot_count() const { return speculative_shots_.size(); }

    // Friendly bullets of either authority; a reconciled shot is never
    // counted alongside its confirmed copy
    size_t visible_friendly_bullets() const;

    entt::entity find_enemy(uint32_t id) const;

    const RunState& run_state() const { return run_state_; }
    const ecs::PilotInfo& local_pilot() const { return local_pilot_; }
    const Stats& stats() const { return stats_; }
    const sync::LatencyEstimator& latency() const { return latency_; }
    const sync::OptimisticPredictor& optimistic() const { return optimistic_; }

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

private:
    bool is_stale(const protocol::Snapshot& snapshot) const;
    void apply_snapshot(const protocol::Snapshot& snapshot, double received_ms);
    void apply_pilots(const protocol::Snapshot& snapshot);
    void apply_enemies(const protocol::Snapshot& snapshot);
    void apply_hostile_bullets(const protocol::Snapshot& snapshot, double received_ms);
    void apply_friendly_bullets(const protocol::Snapshot& snapshot, double received_ms);
    void expire_speculative_shots(double now_ms);
    void advance(const TickContext& ctx);

    std::optional<glm::vec2> position_of(entt::entity entity) const;

    SyncConfig config_;
    std::shared_ptr<net::Transport> transport_;
    entt::registry registry_;

    sync::EntityInterpolator enemy_interpolator_;
    sync::EntityInterpolator pilot_interpolator_;
    sync::BulletPredictor hostile_predictor_;
    sync::BulletPredictor friendly_predictor_;
    sync::LatencyEstimator latency_;
    sync::OptimisticPredictor optimistic_;

    std::unordered_map<uint32_t, entt::entity> enemies_;
    std::unordered_map<uint32_t, entt::entity> hostile_bullets_;
    std::unordered_map<uint32_t, entt::entity> friendly_bullets_;
    std::unordered_map<int32_t, entt::entity> speculative_shots_;
    entt::entity remote_pilot_ = entt::null;

    struct Pending {
        protocol::Snapshot snapshot;
        double received_ms = 0.0;
    };

    std::optional<Pending> pending_;
    std::optional<uint32_t> last_sequence_;
    double last_timestamp_ms_ = 0.0;

    std::optional<double> last_fire_ms_;
    std::optional<double> last_pose_ms_;

    RunState run_state_;
    ecs::PilotInfo local_pilot_;
    Stats stats_;
};

} // namespace quadsync::guest
