#include <gtest/gtest.h>
#include "protocol/protocol.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using namespace quadsync::protocol;

namespace {

Snapshot make_snapshot() {
    Snapshot snapshot;
    snapshot.timestamp_ms = 1234567.5;
    snapshot.sequence = 42;
    snapshot.players.p1 = {{}, 100.0f, 200.0f, 0.5f, 80.0f, true};
    snapshot.players.p2 = {{}, 900.0f, 300.0f, -1.25f, 100.0f, false};

    EnemyRecord enemy;
    enemy.id = 3;
    enemy.x = 100.0f;
    enemy.y = 100.0f;
    enemy.health = 50.0f;
    enemy.kind = "lancer";
    snapshot.enemies.push_back(enemy);

    HostileBulletRecord hostile;
    hostile.id = 7;
    hostile.x = 10.0f;
    hostile.y = 20.0f;
    hostile.vx = -220.0f;
    hostile.vy = 15.0f;
    snapshot.bullets.push_back(hostile);

    FriendlyBulletRecord friendly;
    friendly.id = 11;
    friendly.x = 300.0f;
    friendly.y = 310.0f;
    friendly.vx = 600.0f;
    friendly.vy = 0.0f;
    friendly.rotation = 0.0f;
    snapshot.player_bullets.push_back(friendly);

    snapshot.wave = 4;
    snapshot.score = 2500;
    snapshot.intermission_active = true;
    snapshot.countdown = 2.5f;
    snapshot.pending_wave = 5;
    return snapshot;
}

} // namespace

TEST(snapshot_codec_test, full_snapshot_survives_the_wire) {
    auto out = make_snapshot();
    auto bytes = out.to_bytes();
    ASSERT_EQ(bytes.size(), out.serialized_size());

    Snapshot in;
    in.deserialize(bytes);

    ASSERT_DOUBLE_EQ(in.timestamp_ms, 1234567.5);
    ASSERT_EQ(in.sequence, 42u);
    ASSERT_FLOAT_EQ(in.players.p1.x, 100.0f);
    ASSERT_FLOAT_EQ(in.players.p1.health, 80.0f);
    ASSERT_TRUE(in.players.p1.active);
    ASSERT_FLOAT_EQ(in.players.p2.rotation, -1.25f);
    ASSERT_FALSE(in.players.p2.active);

    ASSERT_EQ(in.enemies.size(), 1u);
    ASSERT_EQ(in.enemies[0].id, 3u);
    ASSERT_EQ(in.enemies[0].kind, "lancer");
    ASSERT_FLOAT_EQ(in.enemies[0].health, 50.0f);
    ASSERT_TRUE(in.enemies[0].active);

    ASSERT_EQ(in.bullets.size(), 1u);
    ASSERT_FLOAT_EQ(in.bullets[0].vx, -220.0f);
    ASSERT_EQ(in.player_bullets.size(), 1u);
    ASSERT_EQ(in.player_bullets[0].id, 11u);

    ASSERT_EQ(in.wave, 4);
    ASSERT_EQ(in.score, 2500);
    ASSERT_TRUE(in.intermission_active);
    ASSERT_TRUE(in.countdown.has_value());
    ASSERT_FLOAT_EQ(*in.countdown, 2.5f);
    ASSERT_EQ(in.pending_wave, 5);
    ASSERT_EQ(in.entity_count(), 3u);
}

TEST(snapshot_codec_test, absent_optionals_stay_absent) {
    Snapshot out;
    out.wave = 1;
    auto bytes = out.to_bytes();

    Snapshot in;
    in.countdown = 9.0f;
    in.pending_wave = 9;
    in.deserialize(bytes);

    ASSERT_FALSE(in.countdown.has_value());
    ASSERT_FALSE(in.pending_wave.has_value());
    ASSERT_TRUE(in.enemies.empty());
}

TEST(snapshot_codec_test, truncated_snapshot_throws) {
    auto bytes = make_snapshot().to_bytes();

    for (size_t cut : {size_t{0}, size_t{5}, bytes.size() / 2, bytes.size() - 1}) {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + cut);
        Snapshot in;
        ASSERT_THROW(in.deserialize(truncated), std::out_of_range) << "cut at " << cut;
    }
}

TEST(snapshot_codec_test, oversized_kind_is_rejected_on_write) {
    auto snapshot = make_snapshot();
    snapshot.enemies[0].kind = std::string(70000, 'x');
    ASSERT_THROW(snapshot.to_bytes(), std::length_error);
}

TEST(fire_request_codec_test, fire_request_layout) {
    FireRequest out;
    out.x = 640.0f;
    out.y = 360.0f;
    out.dir_x = 0.0f;
    out.dir_y = -1.0f;
    out.timestamp_ms = 99.0;

    auto bytes = out.to_bytes();
    ASSERT_EQ(bytes.size(), FireRequest::serialized_size());
    ASSERT_EQ(bytes.size(), 24u);

    FireRequest in;
    in.deserialize(bytes);
    ASSERT_FLOAT_EQ(in.x, 640.0f);
    ASSERT_FLOAT_EQ(in.dir_y, -1.0f);
    ASSERT_DOUBLE_EQ(in.timestamp_ms, 99.0);

    std::vector<uint8_t> short_bytes(bytes.begin(), bytes.begin() + 20);
    ASSERT_THROW(in.deserialize(short_bytes), std::out_of_range);
}

TEST(packet_test, header_prefixes_payload) {
    PilotPoseMsg pose;
    pose.x = 1.0f;
    auto payload = pose.to_bytes();
    auto packet = build_packet(MessageType::PilotPose, payload);

    ASSERT_EQ(packet.size(), PacketHeader::serialized_size() + payload.size());

    PacketHeader header;
    header.deserialize(std::span<const uint8_t>(packet.data(), PacketHeader::serialized_size()));
    ASSERT_EQ(header.type, MessageType::PilotPose);
    ASSERT_EQ(header.payload_size, payload.size());

    PilotPoseMsg in;
    in.deserialize(std::span<const uint8_t>(packet).subspan(PacketHeader::serialized_size()));
    ASSERT_FLOAT_EQ(in.x, 1.0f);
    ASSERT_TRUE(in.active);
}
