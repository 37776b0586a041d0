#pragma once

#include "serializable.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quadsync::protocol {

// Pilot pose as seen by the host. p1 is the host's ship, p2 the guest's.
struct PlayerPose : Serializable<PlayerPose> {
    float x = 0.0f;
    float y = 0.0f;
    float rotation = 0.0f;  // Radians
    float health = 100.0f;
    bool active = false;

    static constexpr size_t serialized_size() {
        return sizeof(float) * 4 + sizeof(uint8_t);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(x); w.write(y);
        w.write(rotation);
        w.write(health);
        w.write_bool(active);
    }

    void deserialize_impl(BufferReader& r) {
        x = r.read<float>(); y = r.read<float>();
        rotation = r.read<float>();
        health = r.read<float>();
        active = r.read_bool();
    }
};

struct EnemyRecord : Serializable<EnemyRecord> {
    uint32_t id = 0;
    float x = 0.0f;
    float y = 0.0f;
    float health = 100.0f;
    std::string kind = "drifter";  // Texture/archetype key, opaque to the sync layer
    bool active = true;

    size_t serialized_size() const {
        return sizeof(uint32_t) + sizeof(float) * 3 +
               sizeof(uint16_t) + kind.size() + sizeof(uint8_t);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(id);
        w.write(x); w.write(y);
        w.write(health);
        w.write_string(kind);
        w.write_bool(active);
    }

    void deserialize_impl(BufferReader& r) {
        id = r.read<uint32_t>();
        x = r.read<float>(); y = r.read<float>();
        health = r.read<float>();
        kind = r.read_string();
        active = r.read_bool();
    }
};

// Enemy projectile
struct HostileBulletRecord : Serializable<HostileBulletRecord> {
    uint32_t id = 0;
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;  // Units per second
    float vy = 0.0f;

    static constexpr size_t serialized_size() {
        return sizeof(uint32_t) + sizeof(float) * 4;
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(id);
        w.write(x); w.write(y);
        w.write(vx); w.write(vy);
    }

    void deserialize_impl(BufferReader& r) {
        id = r.read<uint32_t>();
        x = r.read<float>(); y = r.read<float>();
        vx = r.read<float>(); vy = r.read<float>();
    }
};

// Pilot projectile, either pilot's
struct FriendlyBulletRecord : Serializable<FriendlyBulletRecord> {
    uint32_t id = 0;
    float x = 0.0f;
    float y = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    float rotation = 0.0f;

    static constexpr size_t serialized_size() {
        return sizeof(uint32_t) + sizeof(float) * 5;
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(id);
        w.write(x); w.write(y);
        w.write(vx); w.write(vy);
        w.write(rotation);
    }

    void deserialize_impl(BufferReader& r) {
        id = r.read<uint32_t>();
        x = r.read<float>(); y = r.read<float>();
        vx = r.read<float>(); vy = r.read<float>();
        rotation = r.read<float>();
    }
};

struct Players {
    PlayerPose p1;
    PlayerPose p2;
};

// Host -> Guest: complete description of every networked entity at one instant.
// Ids are stable per collection; an id missing from a later snapshot means the
// entity is gone.
struct Snapshot : Serializable<Snapshot> {
    double timestamp_ms = 0.0;  // Host clock
    uint32_t sequence = 0;      // Assigned by the broadcaster, increases per send
    Players players;
    std::vector<EnemyRecord> enemies;
    std::vector<HostileBulletRecord> bullets;
    std::vector<FriendlyBulletRecord> player_bullets;
    int32_t wave = 0;
    int32_t score = 0;
    bool intermission_active = false;
    std::optional<float> countdown;
    std::optional<int32_t> pending_wave;

    size_t entity_count() const {
        return enemies.size() + bullets.size() + player_bullets.size();
    }

    size_t serialized_size() const {
        size_t size = sizeof(double) + sizeof(uint32_t) + PlayerPose::serialized_size() * 2;
        size += sizeof(uint16_t);
        for (const auto& e : enemies) size += e.serialized_size();
        size += sizeof(uint16_t) + bullets.size() * HostileBulletRecord::serialized_size();
        size += sizeof(uint16_t) + player_bullets.size() * FriendlyBulletRecord::serialized_size();
        size += sizeof(int32_t) * 2 + sizeof(uint8_t);
        size += sizeof(uint8_t) + (countdown ? sizeof(float) : 0);
        size += sizeof(uint8_t) + (pending_wave ? sizeof(int32_t) : 0);
        return size;
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(timestamp_ms);
        w.write(sequence);
        players.p1.serialize(w);
        players.p2.serialize(w);
        w.write_array(enemies);
        w.write_array(bullets);
        w.write_array(player_bullets);
        w.write(wave);
        w.write(score);
        w.write_bool(intermission_active);
        w.write_optional(countdown);
        w.write_optional(pending_wave);
    }

    void deserialize_impl(BufferReader& r) {
        timestamp_ms = r.read<double>();
        sequence = r.read<uint32_t>();
        players.p1.deserialize(r);
        players.p2.deserialize(r);
        enemies = r.read_array<EnemyRecord>();
        bullets = r.read_array<HostileBulletRecord>();
        player_bullets = r.read_array<FriendlyBulletRecord>();
        wave = r.read<int32_t>();
        score = r.read<int32_t>();
        intermission_active = r.read_bool();
        countdown = r.read_optional<float>();
        pending_wave = r.read_optional<int32_t>();
    }
};

} // namespace quadsync::protocol
