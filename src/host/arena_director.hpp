#pragma once

#include "host/world.hpp"
#include "sync/tick_context.hpp"
#include <random>

namespace quadsync::host {

// Gameplay driving the host World: waves of enemies, enemy fire, the host
// pilot's autopilot and scoring.
class ArenaDirector {
public:
    struct Tuning {
        float pilot_orbit_radius = 180.0f;
        float pilot_orbit_speed = 0.8f;      // Radians per second
        double pilot_fire_interval_ms = 250.0;
        double enemy_fire_interval_ms = 1200.0;
        float enemy_bullet_speed = 220.0f;
        float enemy_speed = 60.0f;
        float enemy_health = 50.0f;
        float bullet_damage = 25.0f;
        float enemy_bullet_damage = 10.0f;
        float hit_radius = 20.0f;
        float intermission_s = 3.0f;
        int32_t points_per_kill = 100;
    };

    ArenaDirector(World& world, uint32_t seed);
    ArenaDirector(World& world, uint32_t seed, const Tuning& tuning);

    void start();
    void update(const TickContext& ctx);

private:
    void spawn_wave(int32_t wave);
    void fly_host_pilot(const TickContext& ctx);
    void enemy_fire(const TickContext& ctx);

    World& world_;
    Tuning tuning_;
    std::mt19937 rng_;
    float orbit_angle_ = 0.0f;
    double last_pilot_fire_ms_ = 0.0;
    double last_enemy_fire_ms_ = 0.0;
};

} // namespace quadsync::host
