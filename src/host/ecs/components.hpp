#pragma once

#include <cstdint>
#include <string>

namespace quadsync::host::ecs {

// ============================================================================
// Core Components
// ============================================================================

// Arena coordinates: x right, y down, origin at the top-left corner
struct Transform {
    float x = 0.0f;
    float y = 0.0f;
    float rotation = 0.0f;  // Radians
};

struct Velocity {
    float x = 0.0f;
    float y = 0.0f;
};

struct Health {
    float current = 100.0f;
    float max = 100.0f;

    bool is_alive() const { return current > 0.0f; }
};

// Per-collection id, the join key on the guest side
struct NetworkId {
    uint32_t id = 0;
};

enum class Shooter : uint8_t {
    Host,
    Guest
};

struct Projectile {
    float age = 0.0f;
    float lifetime = 2.0f;
    Shooter shooter = Shooter::Host;
};

struct EnemyInfo {
    std::string kind = "drifter";
};

enum class PilotSlot : uint8_t {
    P1,  // Host pilot
    P2   // Guest pilot
};

struct Pilot {
    PilotSlot slot = PilotSlot::P1;
    bool active = false;
};

// ============================================================================
// Tag Components
// ============================================================================

struct EnemyTag {};
struct HostileBulletTag {};
struct PlayerBulletTag {};

} // namespace quadsync::host::ecs
