#pragma once

#include "sync/sync_config.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace quadsync::sync {

// Fraction of the remaining distance to cover after `elapsed_seconds`, given a
// blend factor expressed per 1/60 s. Frame-rate independent; always in [0, 1].
float smoothing_alpha(float factor, float elapsed_seconds);

// Shortest-arc blend between two angles in radians
float lerp_angle(float from, float to, float t);

struct InterpolatedPose {
    glm::vec2 position{0.0f};
    std::optional<float> rotation;
};

// Smooths step-function position updates of slow, long-lived entities (enemies,
// the remote pilot) into continuous motion. Every read moves the rendered pose
// a fixed fraction of the way towards the newest target, so it converges without
// overshooting. A target at or beyond the snap threshold is taken immediately.
class EntityInterpolator {
public:
    explicit EntityInterpolator(const InterpolationConfig& config = {});

    // Record an authoritative sample. Does not move anything by itself; a first
    // sample for an unknown id places the entity at the target.
    void update_target(uint32_t id, float x, float y, std::optional<float> rotation = std::nullopt);

    // Advance the rendered pose by `elapsed_seconds` and return it.
    // std::nullopt if the id is not tracked.
    std::optional<InterpolatedPose> get_position(uint32_t id, float elapsed_seconds);

    // Current rendered pose without advancing it
    std::optional<InterpolatedPose> peek(uint32_t id) const;

    void remove(uint32_t id);
    void clear();

    bool contains(uint32_t id) const { return tracks_.find(id) != tracks_.end(); }
    size_t size() const { return tracks_.size(); }


private:
    struct Track {
        glm::vec2 current{0.0f};
        glm::vec2 target{0.0f};
        glm::vec2 previous_target{0.0f};
        std::optional<float> current_rotation;
        std::optional<float> target_rotation;
        float since_update = 0.0f;  // Seconds advanced since the last target arrived
        bool snap_pending = false;
    };

    float lerp_factor_;
    float snap_threshold_;
    std::unordered_map<uint32_t, Track> tracks_;
};

} // namespace quadsync::sync
