#include "sync_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace quadsync {

bool SyncConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[SyncConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        apply(json::parse(f));
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[SyncConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool SyncConfig::parse(const std::string& text) {
    try {
        apply(json::parse(text));
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[SyncConfig] Error parsing config: " << e.what() << std::endl;
        return false;
    }
}

void SyncConfig::apply(const json& j) {
    // Parse into copies; a type error halfway through leaves the config unchanged
    auto enemy_interpolation = enemy_interpolation_;
    auto pilot_interpolation = pilot_interpolation_;
    auto prediction = prediction_;
    auto latency = latency_;
    auto broadcast = broadcast_;
    auto optimistic = optimistic_;
    auto guest = guest_;
    auto network = network_;
    auto world = world_;

    if (j.contains("interpolation")) {
        const auto& s = j.at("interpolation");
        enemy_interpolation.lerp_factor = s.value("enemy_lerp_factor", enemy_interpolation.lerp_factor);
        pilot_interpolation.lerp_factor = s.value("pilot_lerp_factor", pilot_interpolation.lerp_factor);
        float snap = s.value("snap_threshold", enemy_interpolation.snap_threshold);
        enemy_interpolation.snap_threshold = snap;
        pilot_interpolation.snap_threshold = snap;
    }

    if (j.contains("prediction")) {
        const auto& s = j.at("prediction");
        prediction.max_extrapolation_ms = s.value("max_extrapolation_ms", prediction.max_extrapolation_ms);
    }

    if (j.contains("latency")) {
        const auto& s = j.at("latency");
        latency.window = s.value("window", latency.window);
        latency.max_sample_ms = s.value("max_sample_ms", latency.max_sample_ms);
        latency.default_average_ms = s.value("default_average_ms", latency.default_average_ms);
        latency.default_jitter_ms = s.value("default_jitter_ms", latency.default_jitter_ms);
        latency.min_delay_ms = s.value("min_delay_ms", latency.min_delay_ms);
    }

    if (j.contains("broadcast")) {
        const auto& s = j.at("broadcast");
        broadcast.base_interval_ms = s.value("base_interval_ms", broadcast.base_interval_ms);
        broadcast.max_interval_ms = s.value("max_interval_ms", broadcast.max_interval_ms);
        broadcast.per_entity_ms = s.value("per_entity_ms", broadcast.per_entity_ms);
        broadcast.entity_threshold = s.value("entity_threshold", broadcast.entity_threshold);
    }

    if (j.contains("optimistic")) {
        const auto& s = j.at("optimistic");
        optimistic.expiry_ms = s.value("expiry_ms", optimistic.expiry_ms);
        optimistic.match_radius = s.value("match_radius", optimistic.match_radius);
        optimistic.match_min_alignment = s.value("match_min_alignment", optimistic.match_min_alignment);
    }

    if (j.contains("guest")) {
        const auto& s = j.at("guest");
        guest.fire_cooldown_ms = s.value("fire_cooldown_ms", guest.fire_cooldown_ms);
        guest.pose_interval_ms = s.value("pose_interval_ms", guest.pose_interval_ms);
        guest.reject_stale_snapshots = s.value("reject_stale_snapshots", guest.reject_stale_snapshots);
    }

    if (j.contains("network")) {
        const auto& s = j.at("network");
        network.host = s.value("host", network.host);
        network.port = s.value("port", network.port);
        network.max_pending_writes = s.value("max_pending_writes", network.max_pending_writes);
        network.frame_interval_ms = s.value("frame_interval_ms", network.frame_interval_ms);
    }

    if (j.contains("world")) {
        const auto& s = j.at("world");
        world.width = s.value("width", world.width);
        world.height = s.value("height", world.height);
        world.bounds_margin = s.value("bounds_margin", world.bounds_margin);
        world.bullet_lifetime_s = s.value("bullet_lifetime_s", world.bullet_lifetime_s);
        world.player_bullet_speed = s.value("player_bullet_speed", world.player_bullet_speed);
    }

    // Smoothing needs a factor in (0, 1] and a non-empty latency window
    for (auto* interpolation : {&enemy_interpolation, &pilot_interpolation}) {
        interpolation->lerp_factor = std::clamp(interpolation->lerp_factor, 0.001f, 1.0f);
        interpolation->snap_threshold = std::max(interpolation->snap_threshold, 0.0f);
    }
    latency.window = std::max<size_t>(latency.window, 1);
    broadcast.max_interval_ms = std::max(broadcast.max_interval_ms, broadcast.base_interval_ms);
    network.max_pending_writes = std::max<size_t>(network.max_pending_writes, 1);
    network.frame_interval_ms = std::max(network.frame_interval_ms, 1.0);

    enemy_interpolation_ = enemy_interpolation;
    pilot_interpolation_ = pilot_interpolation;
    prediction_ = prediction;
    latency_ = latency;
    broadcast_ = broadcast;
    optimistic_ = optimistic;
    guest_ = guest;
    network_ = network;
    world_ = world;
}

} // namespace quadsync
