#include "bullet_predictor.hpp"
#include <algorithm>

namespace quadsync::sync {

BulletPredictor::BulletPredictor(const PredictionConfig& config)
    : max_extrapolation_ms_(config.max_extrapolation_ms) {
}

void BulletPredictor::update(uint32_t id, float x, float y, float vx, float vy, double now_ms) {
    auto& sample = samples_[id];
    sample.position = glm::vec2(x, y);
    sample.velocity = glm::vec2(vx, vy);
    sample.time_ms = now_ms;
}

std::optional<glm::vec2> BulletPredictor::get_position(uint32_t id, double now_ms) const {
    auto it = samples_.find(id);
    if (it == samples_.end()) {
        return std::nullopt;
    }

    const auto& sample = it->second;
    double elapsed_ms = now_ms - sample.time_ms;
    if (max_extrapolation_ms_ > 0.0) {
        elapsed_ms = std::min(elapsed_ms, max_extrapolation_ms_ + latency_budget_ms_);
    }

    float elapsed_s = static_cast<float>(elapsed_ms / 1000.0);
    return sample.position + sample.velocity * elapsed_s;
}

std::optional<glm::vec2> BulletPredictor::get_velocity(uint32_t id) const {
    auto it = samples_.find(id);
    if (it == samples_.end()) {
        return std::nullopt;
    }
    return it->second.velocity;
}

void BulletPredictor::remove(uint32_t id) {
    samples_.erase(id);
}

void BulletPredictor::clear() {
    samples_.clear();
}

std::vector<uint32_t> BulletPredictor::ids() const {
    std::vector<uint32_t> result;
    result.reserve(samples_.size());
    for (const auto& [id, sample] : samples_) {
        result.push_back(id);
    }
    return result;
}

} // namespace quadsync::sync
