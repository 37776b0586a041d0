#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace quadsync {

struct InterpolationConfig {
    float lerp_factor = 0.15f;       // Blend per 1/60 s, in (0, 1]
    float snap_threshold = 100.0f;   // World units; at or above this we jump
};

struct PredictionConfig {
    // 0 disables the cap. When set, the latency estimate is added on top.
    double max_extrapolation_ms = 0.0;
};

struct LatencyConfig {
    size_t window = 20;
    double max_sample_ms = 1000.0;
    double default_average_ms = 50.0;
    double default_jitter_ms = 10.0;
    double min_delay_ms = 50.0;
};

struct BroadcastConfig {
    double base_interval_ms = 16.0;
    double max_interval_ms = 100.0;
    double per_entity_ms = 2.0;
    size_t entity_threshold = 20;
};

struct OptimisticConfig {
    double expiry_ms = 300.0;
    float match_radius = 64.0f;
    float match_min_alignment = 0.9f;  // Cosine between optimistic and confirmed heading
};

struct GuestConfig {
    double fire_cooldown_ms = 200.0;
    double pose_interval_ms = 16.0;
    bool reject_stale_snapshots = true;
};

struct NetworkConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 7777;
    size_t max_pending_writes = 8;
    double frame_interval_ms = 16.0;
};

struct WorldConfig {
    float width = 1280.0f;
    float height = 720.0f;
    float bounds_margin = 64.0f;       // Bullets beyond the arena by this much are culled
    float bullet_lifetime_s = 2.0f;
    float player_bullet_speed = 600.0f;
};

class SyncConfig {
public:
    // Loads data/sync.json style files. Missing keys keep their defaults;
    // returns false (and leaves defaults in place) if the file can't be read.
    bool load(const std::string& path);
    bool parse(const std::string& text);

    // Enemies and the remote pilot share the snap threshold but smooth at
    // their own rates
    const InterpolationConfig& enemy_interpolation() const { return enemy_interpolation_; }
    const InterpolationConfig& pilot_interpolation() const { return pilot_interpolation_; }
    const PredictionConfig& prediction() const { return prediction_; }
    const LatencyConfig& latency() const { return latency_; }
    const BroadcastConfig& broadcast() const { return broadcast_; }
    const OptimisticConfig& optimistic() const { return optimistic_; }
    const GuestConfig& guest() const { return guest_; }
    const NetworkConfig& network() const { return network_; }
    const WorldConfig& world() const { return world_; }

private:
    void apply(const nlohmann::json& j);

    InterpolationConfig enemy_interpolation_{0.2f, 100.0f};
    InterpolationConfig pilot_interpolation_{0.25f, 100.0f};
    PredictionConfig prediction_;
    LatencyConfig latency_;
    BroadcastConfig broadcast_;
    OptimisticConfig optimistic_;
    GuestConfig guest_;
    NetworkConfig network_;
    WorldConfig world_;
};

} // namespace quadsync
