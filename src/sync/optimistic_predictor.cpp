#include "optimistic_predictor.hpp"
#include <algorithm>
#include <cmath>

namespace quadsync::sync {

namespace {

glm::vec2 dead_reckon(const OptimisticShot& shot, double now_ms) {
    float elapsed_s = static_cast<float>((now_ms - shot.spawn_time_ms) / 1000.0);
    return shot.origin + shot.velocity * elapsed_s;
}

// Distance from `point` to the stretch of the shot's path flown by now_ms.
// The confirmed copy starts later on the same path, so anywhere along it
// counts regardless of how old the sample is.
float distance_to_path(const OptimisticShot& shot, glm::vec2 point, double now_ms) {
    float speed = glm::length(shot.velocity);
    if (speed <= 0.0f) {
        return glm::length(point - shot.origin);
    }
    glm::vec2 dir = shot.velocity / speed;
    float flown = speed * static_cast<float>(std::max(0.0, now_ms - shot.spawn_time_ms) / 1000.0);
    float along = std::clamp(glm::dot(point - shot.origin, dir), 0.0f, flown);
    return glm::length(point - (shot.origin + dir * along));
}

bool headings_agree(glm::vec2 a, glm::vec2 b, float min_alignment) {
    float la = glm::length(a);
    float lb = glm::length(b);
    if (la <= 0.0f || lb <= 0.0f) {
        // A stationary confirmed bullet can't contradict the guess
        return true;
    }
    return glm::dot(a / la, b / lb) >= min_alignment;
}

} // namespace

OptimisticPredictor::OptimisticPredictor(const OptimisticConfig& config)
    : config_(config) {
}

OptimisticShot OptimisticPredictor::spawn(float x, float y, float dir_x, float dir_y,
                                          float speed, double now_ms) {
    glm::vec2 dir(dir_x, dir_y);
    float len = glm::length(dir);
    if (!std::isfinite(len) || len <= 0.0f) {
        dir = glm::vec2(1.0f, 0.0f);
    } else {
        dir /= len;
    }

    OptimisticShot shot;
    shot.id = next_id_--;
    shot.origin = glm::vec2(x, y);
    shot.velocity = dir * speed;
    shot.rotation = std::atan2(dir.y, dir.x);
    shot.spawn_time_ms = now_ms;
    live_.push_back(shot);
    return shot;
}

std::optional<glm::vec2> OptimisticPredictor::position(int32_t id, double now_ms) const {
    const auto* shot = find(id);
    if (!shot) {
        return std::nullopt;
    }
    return dead_reckon(*shot, now_ms);
}

const OptimisticShot* OptimisticPredictor::find(int32_t id) const {
    auto it = std::find_if(live_.begin(), live_.end(),
                           [id](const OptimisticShot& s) { return s.id == id; });
    return it != live_.end() ? &*it : nullptr;
}

std::vector<Reconciliation> OptimisticPredictor::reconcile(const std::vector<ConfirmedShot>& fresh,
                                                           double now_ms) {
    std::vector<Reconciliation> result;

    for (const auto& confirmed : fresh) {
        auto it = std::find_if(live_.begin(), live_.end(), [&](const OptimisticShot& shot) {
            return distance_to_path(shot, confirmed.position, now_ms) <= config_.match_radius &&
                   headings_agree(shot.velocity, confirmed.velocity, config_.match_min_alignment);
        });
        if (it == live_.end()) {
            continue;
        }

        it->state = ShotState::Reconciled;
        result.push_back({*it, confirmed.id});
        live_.erase(it);
    }

    return result;
}

std::vector<OptimisticShot> OptimisticPredictor::expire(double now_ms) {
    std::vector<OptimisticShot> expired;

    for (auto it = live_.begin(); it != live_.end();) {
        if (now_ms - it->spawn_time_ms > config_.expiry_ms) {
            it->state = ShotState::Expired;
            expired.push_back(*it);
            it = live_.erase(it);
        } else {
            ++it;
        }
    }

    return expired;
}

void OptimisticPredictor::clear() {
    live_.clear();
    next_id_ = -1;
}

} // namespace quadsync::sync
