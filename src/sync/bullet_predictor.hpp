#pragma once

#include "sync/sync_config.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace quadsync::sync {

// Dead reckoning for projectiles. Each sample overwrites the previous one and
// reads return last_position + last_velocity * (now - sample_time), never a
// smoothed value.
class BulletPredictor {
public:
    explicit BulletPredictor(const PredictionConfig& config = {});

    void update(uint32_t id, float x, float y, float vx, float vy, double now_ms);

    // std::nullopt if the id is not tracked
    std::optional<glm::vec2> get_position(uint32_t id, double now_ms) const;

    // Velocity from the last sample
    std::optional<glm::vec2> get_velocity(uint32_t id) const;

    void remove(uint32_t id);
    void clear();

    bool contains(uint32_t id) const { return samples_.find(id) != samples_.end(); }
    size_t size() const { return samples_.size(); }
    std::vector<uint32_t> ids() const;

    // Extra extrapolation allowed on top of max_extrapolation_ms, normally the
    // current latency estimate. Ignored while the cap is disabled.
    void set_latency_budget_ms(double ms) { latency_budget_ms_ = ms > 0.0 ? ms : 0.0; }

private:
    struct Sample {
        glm::vec2 position{0.0f};
        glm::vec2 velocity{0.0f};
        double time_ms = 0.0;
    };

    double max_extrapolation_ms_;
    double latency_budget_ms_ = 0.0;
    std::unordered_map<uint32_t, Sample> samples_;
};

} // namespace quadsync::sync
