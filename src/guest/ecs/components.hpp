#pragma once

#include "sync/optimistic_predictor.hpp"
#include <cstdint>
#include <string>

namespace quadsync::guest::ecs {

// Rendered state, rewritten every frame from the interpolators and predictors
struct Transform {
    float x = 0.0f;
    float y = 0.0f;
    float rotation = 0.0f;
};

struct Velocity {
    float x = 0.0f;
    float y = 0.0f;
};

// Host-assigned id within the entity's collection
struct SyncId {
    uint32_t id = 0;
};

// Local id of a speculative shot
struct ShotId {
    int32_t id = 0;
};

struct Ownership {
    sync::Authority authority = sync::Authority::Confirmed;
};

struct EnemyInfo {
    std::string kind;
    float health = 0.0f;
};

struct PilotInfo {
    float health = 100.0f;
    bool active = false;
};

// ============================================================================
// Tag Components
// ============================================================================

struct EnemyTag {};
struct HostileBulletTag {};
struct FriendlyBulletTag {};
struct RemotePilotTag {};

} // namespace quadsync::guest::ecs
