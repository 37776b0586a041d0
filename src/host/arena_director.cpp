#include "arena_director.hpp"
#include "host/systems/combat_system.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <vector>

namespace quadsync::host {

ArenaDirector::ArenaDirector(World& world, uint32_t seed)
    : ArenaDirector(world, seed, Tuning{}) {
}

ArenaDirector::ArenaDirector(World& world, uint32_t seed, const Tuning& tuning)
    : world_(world)
    , tuning_(tuning)
    , rng_(seed) {
}

void ArenaDirector::start() {
    world_.set_wave(1);
    spawn_wave(1);
}

void ArenaDirector::update(const TickContext& ctx) {
    fly_host_pilot(ctx);
    enemy_fire(ctx);

    uint32_t kills = systems::update_combat(world_, tuning_.hit_radius, tuning_.bullet_damage);
    if (kills > 0) {
        world_.add_score(static_cast<int32_t>(kills) * tuning_.points_per_kill);
    }
    systems::update_pilot_hits(world_, tuning_.hit_radius, tuning_.enemy_bullet_damage);

    const auto& run = world_.run_state();
    if (run.intermission_active) {
        float remaining = run.countdown.value_or(0.0f) - ctx.dt;
        if (remaining <= 0.0f) {
            int32_t next_wave = run.pending_wave.value_or(run.wave + 1);
            world_.end_intermission();
            spawn_wave(next_wave);
        } else {
            world_.set_countdown(remaining);
        }
    } else if (world_.enemy_count() == 0) {
        std::cout << "[Arena] Wave " << run.wave << " cleared, score " << run.score << std::endl;
        world_.begin_intermission(tuning_.intermission_s, run.wave + 1);
    }
}

void ArenaDirector::spawn_wave(int32_t wave) {
    const auto& cfg = world_.config();
    std::uniform_real_distribution<float> dist_x(cfg.width * 0.5f, cfg.width - 40.0f);
    std::uniform_real_distribution<float> dist_y(40.0f, cfg.height - 40.0f);
    std::uniform_real_distribution<float> dist_angle(0.0f, glm::two_pi<float>());

    int32_t count = 2 + wave * 3;
    for (int32_t i = 0; i < count; ++i) {
        float angle = dist_angle(rng_);
        glm::vec2 velocity(std::cos(angle) * tuning_.enemy_speed, std::sin(angle) * tuning_.enemy_speed);
        const char* kind = (i % 3 == 2) ? "lancer" : "drifter";
        world_.spawn_enemy(dist_x(rng_), dist_y(rng_), tuning_.enemy_health, kind, velocity);
    }
    std::cout << "[Arena] Wave " << wave << ": " << count << " enemies" << std::endl;
}

void ArenaDirector::fly_host_pilot(const TickContext& ctx) {
    const auto& cfg = world_.config();
    orbit_angle_ += tuning_.pilot_orbit_speed * ctx.dt;
    if (orbit_angle_ > glm::two_pi<float>()) {
        orbit_angle_ -= glm::two_pi<float>();
    }

    float cx = cfg.width * 0.3f;
    float cy = cfg.height * 0.5f;
    float x = cx + std::cos(orbit_angle_) * tuning_.pilot_orbit_radius;
    float y = cy + std::sin(orbit_angle_) * tuning_.pilot_orbit_radius;

    // Aim at the closest enemy, otherwise straight ahead
    glm::vec2 aim(1.0f, 0.0f);
    float best = -1.0f;
    auto view = world_.registry().view<ecs::EnemyTag, ecs::Transform>();
    for (auto entity : view) {
        const auto& t = view.get<ecs::Transform>(entity);
        glm::vec2 to_enemy(t.x - x, t.y - y);
        float d = glm::length(to_enemy);
        if (d > 0.0f && (best < 0.0f || d < best)) {
            best = d;
            aim = to_enemy / d;
        }
    }

    world_.set_pilot(ecs::PilotSlot::P1, x, y, std::atan2(aim.y, aim.x));

    if (ctx.now_ms - last_pilot_fire_ms_ >= tuning_.pilot_fire_interval_ms && best > 0.0f) {
        last_pilot_fire_ms_ = ctx.now_ms;
        world_.spawn_player_bullet(glm::vec2(x, y), aim, ecs::Shooter::Host);
    }
}

void ArenaDirector::enemy_fire(const TickContext& ctx) {
    if (ctx.now_ms - last_enemy_fire_ms_ < tuning_.enemy_fire_interval_ms) {
        return;
    }
    last_enemy_fire_ms_ = ctx.now_ms;

    std::vector<glm::vec2> shooters;
    auto view = world_.registry().view<ecs::EnemyTag, ecs::Transform>();
    for (auto entity : view) {
        const auto& t = view.get<ecs::Transform>(entity);
        shooters.emplace_back(t.x, t.y);
    }
    if (shooters.empty()) {
        return;
    }

    std::uniform_int_distribution<size_t> pick(0, shooters.size() - 1);
    glm::vec2 from = shooters[pick(rng_)];

    // Target whichever active pilot is nearer
    glm::vec2 target(-1.0f);
    float best = -1.0f;
    for (auto slot : {ecs::PilotSlot::P1, ecs::PilotSlot::P2}) {
        auto pose = world_.pilot(slot);
        if (!pose.active) {
            continue;
        }
        float d = glm::length(glm::vec2(pose.x, pose.y) - from);
        if (best < 0.0f || d < best) {
            best = d;
            target = glm::vec2(pose.x, pose.y);
        }
    }
    if (best <= 0.0f) {
        return;
    }

    glm::vec2 dir = (target - from) / best;
    world_.spawn_hostile_bullet(from, dir * tuning_.enemy_bullet_speed);
}

} // namespace quadsync::host
