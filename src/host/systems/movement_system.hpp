#pragma once

#include "sync/sync_config.hpp"
#include <entt/entt.hpp>

namespace quadsync::host::systems {

// Integrates velocities. Enemies stay inside the arena.
void update_movement(entt::registry& registry, float dt, const WorldConfig& config);

// Ages projectiles and destroys the ones past their lifetime or outside the
// arena. Returns how many were removed.
size_t update_projectiles(entt::registry& registry, float dt, const WorldConfig& config);

} // namespace quadsync::host::systems
