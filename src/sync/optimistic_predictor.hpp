#pragma once

#include "sync/sync_config.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace quadsync::sync {

// Who owns an entity's state. Speculative shots are guest-side guesses;
// everything that came from a snapshot is Confirmed.
enum class Authority : uint8_t {
    Speculative,
    Confirmed
};

enum class ShotState : uint8_t {
    Spawned,
    Reconciled,
    Expired
};

struct OptimisticShot {
    int32_t id = 0;  // Negative, never reused within a session
    Authority authority = Authority::Speculative;
    ShotState state = ShotState::Spawned;
    glm::vec2 origin{0.0f};
    glm::vec2 velocity{0.0f};
    float rotation = 0.0f;
    double spawn_time_ms = 0.0;
};

// A friendly bullet seen for the first time in a snapshot
struct ConfirmedShot {
    uint32_t id = 0;
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
};

struct Reconciliation {
    OptimisticShot shot;  // Retired copy, state Reconciled
    uint32_t confirmed_id = 0;
};

// Local echo for guest fire input. Shots live here until the host's copy shows
// up (Reconciled) or the expiry window passes (Expired); both retire the shot.
class OptimisticPredictor {
public:
    explicit OptimisticPredictor(const OptimisticConfig& config = {});

    // A zero or non-finite direction falls back to +x
    OptimisticShot spawn(float x, float y, float dir_x, float dir_y, float speed, double now_ms);

    std::optional<glm::vec2> position(int32_t id, double now_ms) const;
    const OptimisticShot* find(int32_t id) const;

    // Match each newly confirmed bullet against the oldest live shot whose
    // heading agrees and whose path so far passes within match_radius of it.
    // Matched shots are retired.
    std::vector<Reconciliation> reconcile(const std::vector<ConfirmedShot>& fresh, double now_ms);

    // Retire every live shot older than expiry_ms; returns the retired copies
    std::vector<OptimisticShot> expire(double now_ms);

    const std::vector<OptimisticShot>& live() const { return live_; }
    size_t live_count() const { return live_.size(); }

    void clear();

private:
    OptimisticConfig config_;
    std::vector<OptimisticShot> live_;  // Oldest first
    int32_t next_id_ = -1;
};

} // namespace quadsync::sync
