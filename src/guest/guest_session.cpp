#include "guest_session.hpp"
#include "protocol/protocol.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace quadsync::guest {

using namespace quadsync::protocol;

namespace {

constexpr uint32_t REMOTE_PILOT_ID = 1;

} // namespace

GuestSession::GuestSession(const SyncConfig& config)
    : config_(config)
    , enemy_interpolator_(config.enemy_interpolation())
    , pilot_interpolator_(config.pilot_interpolation())
    , hostile_predictor_(config.prediction())
    , friendly_predictor_(config.prediction())
    , latency_(config.latency())
    , optimistic_(config.optimistic()) {
}

void GuestSession::attach(std::shared_ptr<net::Transport> transport) {
    transport_ = std::move(transport);
    transport_->set_message_callback([this](MessageType type, std::span<const uint8_t> payload) {
        handle_message(type, payload);
    });
    std::cout << "[GuestSession] Attached to host" << std::endl;
}

void GuestSession::detach() {
    if (!transport_) {
        return;
    }
    transport_->set_message_callback(nullptr);
    transport_.reset();
    std::cout << "[GuestSession] Detached from host" << std::endl;
}

void GuestSession::handle_message(MessageType type, std::span<const uint8_t> payload) {
    if (type != MessageType::Snapshot) {
        std::cout << "[GuestSession] Unexpected message: " << to_string(type) << std::endl;
        return;
    }

    Snapshot snapshot;
    try {
        snapshot.deserialize(payload);
    } catch (const std::out_of_range& e) {
        ++stats_.malformed_dropped;
        std::cerr << "[GuestSession] Malformed snapshot: " << e.what() << std::endl;
        return;
    }
    stage_snapshot(std::move(snapshot), wall_clock_ms());
}

void GuestSession::stage_snapshot(Snapshot snapshot, double received_ms) {
    if (pending_) {
        if (config_.guest().reject_stale_snapshots && snapshot.sequence <= pending_->snapshot.sequence) {
            ++stats_.stale_dropped;
            return;
        }
        ++stats_.snapshots_superseded;
    }
    pending_ = Pending{std::move(snapshot), received_ms};
}

void GuestSession::update(const TickContext& ctx) {
    if (pending_) {
        Pending pending = std::move(*pending_);
        pending_.reset();

        if (is_stale(pending.snapshot)) {
            ++stats_.stale_dropped;
        } else {
            apply_snapshot(pending.snapshot, pending.received_ms);
        }
    }

    expire_speculative_shots(ctx.now_ms);
    advance(ctx);
}

bool GuestSession::is_stale(const Snapshot& snapshot) const {
    if (!config_.guest().reject_stale_snapshots || !last_sequence_) {
        return false;
    }
    return snapshot.sequence <= *last_sequence_ || snapshot.timestamp_ms < last_timestamp_ms_;
}

void GuestSession::apply_snapshot(const Snapshot& snapshot, double received_ms) {
    last_sequence_ = snapshot.sequence;
    last_timestamp_ms_ = snapshot.timestamp_ms;

    latency_.estimate_from_timestamp(snapshot.timestamp_ms, received_ms);
    hostile_predictor_.set_latency_budget_ms(latency_.average_ms());
    friendly_predictor_.set_latency_budget_ms(latency_.average_ms());

    apply_pilots(snapshot);
    apply_enemies(snapshot);
    apply_hostile_bullets(snapshot, received_ms);
    apply_friendly_bullets(snapshot, received_ms);

    run_state_.wave = snapshot.wave;
    run_state_.score = snapshot.score;
    run_state_.intermission_active = snapshot.intermission_active;
    run_state_.countdown = snapshot.countdown;
    run_state_.pending_wave = snapshot.pending_wave;

    ++stats_.snapshots_applied;
}

void GuestSession::apply_pilots(const Snapshot& snapshot) {
    // p1 is flown by the host; p2 is us as the host sees us
    const auto& remote = snapshot.players.p1;
    if (remote_pilot_ == entt::null) {
        remote_pilot_ = registry_.create();
        registry_.emplace<ecs::Transform>(remote_pilot_, remote.x, remote.y, remote.rotation);
        registry_.emplace<ecs::PilotInfo>(remote_pilot_);
        registry_.emplace<ecs::RemotePilotTag>(remote_pilot_);
    }
    auto& info = registry_.get<ecs::PilotInfo>(remote_pilot_);
    info.health = remote.health;
    info.active = remote.active;
    pilot_interpolator_.update_target(REMOTE_PILOT_ID, remote.x, remote.y, remote.rotation);

    local_pilot_.health = snapshot.players.p2.health;
    local_pilot_.active = snapshot.players.p2.active;
}

void GuestSession::apply_enemies(const Snapshot& snapshot) {
    std::unordered_set<uint32_t> received;

    for (const auto& record : snapshot.enemies) {
        // An inactive record is as good as an absent one
        if (!record.active) {
            continue;
        }
        received.insert(record.id);

        auto it = enemies_.find(record.id);
        if (it == enemies_.end()) {
            auto entity = registry_.create();
            registry_.emplace<ecs::SyncId>(entity, record.id);
            registry_.emplace<ecs::Transform>(entity, record.x, record.y, 0.0f);
            registry_.emplace<ecs::EnemyInfo>(entity, record.kind, record.health);
            registry_.emplace<ecs::Ownership>(entity, sync::Authority::Confirmed);
            registry_.emplace<ecs::EnemyTag>(entity);
            enemies_.emplace(record.id, entity);
            ++stats_.enemies_spawned;
        } else {
            auto& info = registry_.get<ecs::EnemyInfo>(it->second);
            info.kind = record.kind;
            info.health = record.health;
        }
        enemy_interpolator_.update_target(record.id, record.x, record.y);
    }

    for (auto it = enemies_.begin(); it != enemies_.end();) {
        if (received.count(it->first) == 0) {
            registry_.destroy(it->second);
            enemy_interpolator_.remove(it->first);
            ++stats_.enemies_removed;
            it = enemies_.erase(it);
        } else {
            ++it;
        }
    }
}

void GuestSession::apply_hostile_bullets(const Snapshot& snapshot, double received_ms) {
    std::unordered_set<uint32_t> received;

    for (const auto& record : snapshot.bullets) {
        received.insert(record.id);
        hostile_predictor_.update(record.id, record.x, record.y, record.vx, record.vy, received_ms);

        auto it = hostile_bullets_.find(record.id);
        if (it == hostile_bullets_.end()) {
            auto entity = registry_.create();
            registry_.emplace<ecs::SyncId>(entity, record.id);
            registry_.emplace<ecs::Transform>(entity, record.x, record.y, std::atan2(record.vy, record.vx));
            registry_.emplace<ecs::Velocity>(entity, record.vx, record.vy);
            registry_.emplace<ecs::Ownership>(entity, sync::Authority::Confirmed);
            registry_.emplace<ecs::HostileBulletTag>(entity);
            hostile_bullets_.emplace(record.id, entity);
        } else {
            auto& velocity = registry_.get<ecs::Velocity>(it->second);
            velocity.x = record.vx;
            velocity.y = record.vy;
        }
    }

    for (auto it = hostile_bullets_.begin(); it != hostile_bullets_.end();) {
        if (received.count(it->first) == 0) {
            registry_.destroy(it->second);
            hostile_predictor_.remove(it->first);
            it = hostile_bullets_.erase(it);
        } else {
            ++it;
        }
    }
}

void GuestSession::apply_friendly_bullets(const Snapshot& snapshot, double received_ms) {
    std::unordered_set<uint32_t> received;
    std::vector<sync::ConfirmedShot> fresh;

    for (const auto& record : snapshot.player_bullets) {
        received.insert(record.id);
        friendly_predictor_.update(record.id, record.x, record.y, record.vx, record.vy, received_ms);

        if (friendly_bullets_.count(record.id) == 0) {
            fresh.push_back({record.id, glm::vec2(record.x, record.y), glm::vec2(record.vx, record.vy)});
        }
    }

    // Retire the local copies first, in the same pass that creates the
    // confirmed entities, so no frame shows both
    for (const auto& match : optimistic_.reconcile(fresh, received_ms)) {
        auto it = speculative_shots_.find(match.shot.id);
        if (it != speculative_shots_.end()) {
            registry_.destroy(it->second);
            speculative_shots_.erase(it);
        }
        ++stats_.shots_reconciled;
    }

    for (const auto& record : snapshot.player_bullets) {
        auto it = friendly_bullets_.find(record.id);
        if (it == friendly_bullets_.end()) {
            auto entity = registry_.create();
            registry_.emplace<ecs::SyncId>(entity, record.id);
            registry_.emplace<ecs::Transform>(entity, record.x, record.y, record.rotation);
            registry_.emplace<ecs::Velocity>(entity, record.vx, record.vy);
            registry_.emplace<ecs::Ownership>(entity, sync::Authority::Confirmed);
            registry_.emplace<ecs::FriendlyBulletTag>(entity);
            friendly_bullets_.emplace(record.id, entity);
        } else {
            auto& velocity = registry_.get<ecs::Velocity>(it->second);
            velocity.x = record.vx;
            velocity.y = record.vy;
            registry_.get<ecs::Transform>(it->second).rotation = record.rotation;
        }
    }

    for (auto it = friendly_bullets_.begin(); it != friendly_bullets_.end();) {
        if (received.count(it->first) == 0) {
            registry_.destroy(it->second);
            friendly_predictor_.remove(it->first);
            it = friendly_bullets_.erase(it);
        } else {
            ++it;
        }
    }
}

void GuestSession::expire_speculative_shots(double now_ms) {
    for (const auto& shot : optimistic_.expire(now_ms)) {
        auto it = speculative_shots_.find(shot.id);
        if (it != speculative_shots_.end()) {
            registry_.destroy(it->second);
            speculative_shots_.erase(it);
        }
        ++stats_.shots_expired;
    }
}

void GuestSession::advance(const TickContext& ctx) {
    for (const auto& [id, entity] : enemies_) {
        if (auto pose = enemy_interpolator_.get_position(id, ctx.dt)) {
            auto& transform = registry_.get<ecs::Transform>(entity);
            transform.x = pose->position.x;
            transform.y = pose->position.y;
        }
    }

    if (remote_pilot_ != entt::null) {
        if (auto pose = pilot_interpolator_.get_position(REMOTE_PILOT_ID, ctx.dt)) {
            auto& transform = registry_.get<ecs::Transform>(remote_pilot_);
            transform.x = pose->position.x;
            transform.y = pose->position.y;
            transform.rotation = pose->rotation.value_or(transform.rotation);
        }
    }

    for (const auto& [id, entity] : hostile_bullets_) {
        if (auto pos = hostile_predictor_.get_position(id, ctx.now_ms)) {
            auto& transform = registry_.get<ecs::Transform>(entity);
            transform.x = pos->x;
            transform.y = pos->y;
        }
    }

    for (const auto& [id, entity] : friendly_bullets_) {
        if (auto pos = friendly_predictor_.get_position(id, ctx.now_ms)) {
            auto& transform = registry_.get<ecs::Transform>(entity);
            transform.x = pos->x;
            transform.y = pos->y;
        }
    }

    for (const auto& [id, entity] : speculative_shots_) {
        if (auto pos = optimistic_.position(id, ctx.now_ms)) {
            auto& transform = registry_.get<ecs::Transform>(entity);
            transform.x = pos->x;
            transform.y = pos->y;
        }
    }
}

bool GuestSession::fire(float x, float y, float dir_x, float dir_y, double now_ms) {
    if (last_fire_ms_ && now_ms - *last_fire_ms_ < config_.guest().fire_cooldown_ms) {
        return false;
    }

    glm::vec2 dir(dir_x, dir_y);
    float len = glm::length(dir);
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(len) || len <= 0.0f) {
        return false;
    }
    dir /= len;
    last_fire_ms_ = now_ms;

    // Ask the host for the real bullet first, then echo it locally
    if (transport_) {
        FireRequest request;
        request.x = x;
        request.y = y;
        request.dir_x = dir.x;
        request.dir_y = dir.y;
        request.timestamp_ms = now_ms;
        transport_->send_message(MessageType::FireRequest, request);
    }

    auto shot = optimistic_.spawn(x, y, dir.x, dir.y, config_.world().player_bullet_speed, now_ms);

    auto entity = registry_.create();
    registry_.emplace<ecs::ShotId>(entity, shot.id);
    registry_.emplace<ecs::Transform>(entity, x, y, shot.rotation);
    registry_.emplace<ecs::Velocity>(entity, shot.velocity.x, shot.velocity.y);
    registry_.emplace<ecs::Ownership>(entity, shot.authority);
    registry_.emplace<ecs::FriendlyBulletTag>(entity);
    speculative_shots_.emplace(shot.id, entity);

    ++stats_.shots_fired;
    return true;
}

bool GuestSession::send_pose(float x, float y, float rotation, bool active, double now_ms) {
    if (last_pose_ms_ && now_ms - *last_pose_ms_ < config_.guest().pose_interval_ms) {
        return false;
    }
    if (!transport_ || !transport_->is_ready()) {
        return false;
    }

    PilotPoseMsg pose;
    pose.x = x;
    pose.y = y;
    pose.rotation = rotation;
    pose.active = active;
    pose.timestamp_ms = now_ms;

    last_pose_ms_ = now_ms;
    return transport_->send_message(MessageType::PilotPose, pose);
}

void GuestSession::stop() {
    registry_.clear();
    enemies_.clear();
    hostile_bullets_.clear();
    friendly_bullets_.clear();
    speculative_shots_.clear();
    remote_pilot_ = entt::null;

    enemy_interpolator_.clear();
    pilot_interpolator_.clear();
    hostile_predictor_.clear();
    friendly_predictor_.clear();
    latency_.reset();
    optimistic_.clear();

    pending_.reset();
    last_sequence_.reset();
    last_timestamp_ms_ = 0.0;
    last_fire_ms_.reset();
    last_pose_ms_.reset();
    run_state_ = RunState{};
    local_pilot_ = ecs::PilotInfo{};

    std::cout << "[GuestSession] Stopped, all tracking state cleared" << std::endl;
}

std::optional<glm::vec2> GuestSession::enemy_position(uint32_t id) const {
    auto it = enemies_.find(id);
    return it != enemies_.end() ? position_of(it->second) : std::nullopt;
}

std::optional<glm::vec2> GuestSession::hostile_bullet_position(uint32_t id) const {
    auto it = hostile_bullets_.find(id);
    return it != hostile_bullets_.end() ? position_of(it->second) : std::nullopt;
}

std::optional<glm::vec2> GuestSession::friendly_bullet_position(uint32_t id) const {
    auto it = friendly_bullets_.find(id);
    return it != friendly_bullets_.end() ? position_of(it->second) : std::nullopt;
}

std::optional<glm::vec2> GuestSession::speculative_shot_position(int32_t id) const {
    auto it = speculative_shots_.find(id);
    return it != speculative_shots_.end() ? position_of(it->second) : std::nullopt;
}

std::optional<glm::vec2> GuestSession::remote_pilot_position() const {
    return position_of(remote_pilot_);
}

size_t GuestSession::visible_friendly_bullets() const {
    return friendly_bullets_.size() + speculative_shots_.size();
}

entt::entity GuestSession::find_enemy(uint32_t id) const {
    auto it = enemies_.find(id);
    return it != enemies_.end() ? it->second : entt::null;
}

std::optional<glm::vec2> GuestSession::position_of(entt::entity entity) const {
    if (entity == entt::null || !registry_.valid(entity)) {
        return std::nullopt;
    }
    const auto& transform = registry_.get<ecs::Transform>(entity);
    return glm::vec2(transform.x, transform.y);
}

} // namespace quadsync::guest
