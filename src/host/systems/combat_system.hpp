#pragma once

#include <cstdint>

namespace quadsync::host {
class World;
}

namespace quadsync::host::systems {

// Friendly bullets that touch an enemy deal `damage` and are consumed.
// Returns the number of enemies killed this step.
uint32_t update_combat(World& world, float hit_radius, float damage);

// Hostile bullets that touch an active pilot deal `damage` and are consumed.
// A pilot brought to zero is restored to full health. Returns the hit count.
uint32_t update_pilot_hits(World& world, float hit_radius, float damage);

} // namespace quadsync::host::systems
