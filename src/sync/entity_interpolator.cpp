#include "entity_interpolator.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace quadsync::sync {

namespace {

// Move one component towards its target, clamped so float rounding can't overshoot
float approach(float current, float target, float alpha) {
    if (alpha >= 1.0f) {
        return target;
    }
    float next = current + (target - current) * alpha;
    return std::clamp(next, std::min(current, target), std::max(current, target));
}

} // namespace

float smoothing_alpha(float factor, float elapsed_seconds) {
    if (elapsed_seconds <= 0.0f || factor <= 0.0f) {
        return 0.0f;
    }
    if (factor >= 1.0f) {
        return 1.0f;
    }
    // factor is tuned per 60 Hz frame
    float alpha = 1.0f - std::pow(1.0f - factor, elapsed_seconds * 60.0f);
    return std::clamp(alpha, 0.0f, 1.0f);
}

float lerp_angle(float from, float to, float t) {
    float diff = std::remainder(to - from, glm::two_pi<float>());
    return from + diff * t;
}

EntityInterpolator::EntityInterpolator(const InterpolationConfig& config)
    : lerp_factor_(config.lerp_factor)
    , snap_threshold_(config.snap_threshold) {
}

void EntityInterpolator::update_target(uint32_t id, float x, float y, std::optional<float> rotation) {
    glm::vec2 target(x, y);

    auto it = tracks_.find(id);
    if (it == tracks_.end()) {
        Track track;
        track.current = target;
        track.target = target;
        track.previous_target = target;
        track.current_rotation = rotation;
        track.target_rotation = rotation;
        tracks_.emplace(id, track);
        return;
    }

    auto& track = it->second;
    track.previous_target = track.target;
    track.target = target;
    if (rotation) {
        track.target_rotation = rotation;
    }
    track.since_update = 0.0f;

    // Spawns, teleports and big corrections jump instead of sliding across the map
    if (glm::length(target - track.current) >= snap_threshold_) {
        track.snap_pending = true;
    }
}

std::optional<InterpolatedPose> EntityInterpolator::get_position(uint32_t id, float elapsed_seconds) {
    auto it = tracks_.find(id);
    if (it == tracks_.end()) {
        return std::nullopt;
    }

    auto& track = it->second;
    elapsed_seconds = std::max(elapsed_seconds, 0.0f);
    track.since_update += elapsed_seconds;

    if (track.snap_pending || glm::length(track.target - track.current) >= snap_threshold_) {
        track.current = track.target;
        track.current_rotation = track.target_rotation;
        track.snap_pending = false;
    } else {
        float alpha = smoothing_alpha(lerp_factor_, elapsed_seconds);
        track.current.x = approach(track.current.x, track.target.x, alpha);
        track.current.y = approach(track.current.y, track.target.y, alpha);

        if (track.target_rotation) {
            float from = track.current_rotation.value_or(*track.target_rotation);
            track.current_rotation = alpha >= 1.0f
                ? *track.target_rotation
                : lerp_angle(from, *track.target_rotation, alpha);
        }
    }

    return InterpolatedPose{track.current, track.current_rotation};
}

std::optional<InterpolatedPose> EntityInterpolator::peek(uint32_t id) const {
    auto it = tracks_.find(id);
    if (it == tracks_.end()) {
        return std::nullopt;
    }
    return InterpolatedPose{it->second.current, it->second.current_rotation};
}

void EntityInterpolator::remove(uint32_t id) {
    tracks_.erase(id);
}

void EntityInterpolator::clear() {
    tracks_.clear();
}

} // namespace quadsync::sync
