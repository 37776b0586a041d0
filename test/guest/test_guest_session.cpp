#include <gtest/gtest.h>
#include "guest/guest_session.hpp"
#include "protocol/protocol.hpp"
#include "support/loopback_transport.hpp"
#include <cstdint>
#include <string>
#include <vector>

using namespace quadsync;
using namespace quadsync::guest;
using namespace quadsync::protocol;
using quadsync::test::LoopbackTransport;

namespace {

Snapshot make_snapshot(uint32_t sequence, double timestamp_ms) {
    Snapshot snapshot;
    snapshot.sequence = sequence;
    snapshot.timestamp_ms = timestamp_ms;
    snapshot.players.p1 = {{}, 200.0f, 300.0f, 0.0f, 100.0f, true};
    snapshot.players.p2 = {{}, 900.0f, 300.0f, 0.0f, 75.0f, true};
    snapshot.wave = 1;
    return snapshot;
}

EnemyRecord make_enemy(uint32_t id, float x, float y, float health = 50.0f) {
    EnemyRecord record;
    record.id = id;
    record.x = x;
    record.y = y;
    record.health = health;
    record.kind = "drifter";
    return record;
}

} // namespace

TEST(guest_session_test, enemy_smooths_then_snaps) {
    SyncConfig config;
    GuestSession session(config);

    auto s1 = make_snapshot(1, 0.0);
    s1.enemies.push_back(make_enemy(3, 100.0f, 100.0f));
    session.stage_snapshot(s1, 0.0);
    session.update(TickContext{0.0, 0.016f});
    ASSERT_FLOAT_EQ(session.enemy_position(3)->x, 100.0f);

    auto s2 = make_snapshot(2, 100.0);
    s2.enemies.push_back(make_enemy(3, 140.0f, 100.0f));
    session.stage_snapshot(s2, 100.0);
    session.update(TickContext{100.0, 0.1f});
    session.update(TickContext{150.0, 0.05f});

    float x = session.enemy_position(3)->x;
    ASSERT_GT(x, 100.0f);
    ASSERT_LT(x, 140.0f);

    auto s3 = make_snapshot(3, 200.0);
    s3.enemies.push_back(make_enemy(3, 900.0f, 100.0f));
    session.stage_snapshot(s3, 200.0);
    session.update(TickContext{200.0, 0.05f});
    session.update(TickContext{210.0, 0.01f});

    ASSERT_EQ(session.enemy_position(3)->x, 900.0f);
    ASSERT_EQ(session.enemy_position(3)->y, 100.0f);
    ASSERT_EQ(session.stats().enemies_spawned, 1u);
}

TEST(guest_session_test, new_id_in_old_spot_is_delete_then_spawn) {
    SyncConfig config;
    GuestSession session(config);

    auto s1 = make_snapshot(1, 0.0);
    s1.enemies.push_back(make_enemy(3, 100.0f, 100.0f));
    session.stage_snapshot(s1, 0.0);
    session.update(TickContext{0.0, 0.016f});

    auto s2 = make_snapshot(2, 16.0);
    s2.enemies.push_back(make_enemy(4, 100.0f, 100.0f));
    session.stage_snapshot(s2, 16.0);
    session.update(TickContext{16.0, 0.016f});

    ASSERT_FALSE(session.has_enemy(3));
    ASSERT_TRUE(session.has_enemy(4));
    ASSERT_EQ(session.enemy_count(), 1u);
    ASSERT_EQ(session.stats().enemies_removed, 1u);
    ASSERT_EQ(session.stats().enemies_spawned, 2u);
}

TEST(guest_session_test, absent_and_inactive_enemies_are_removed) {
    SyncConfig config;
    GuestSession session(config);

    auto s1 = make_snapshot(1, 0.0);
    s1.enemies.push_back(make_enemy(1, 10.0f, 10.0f));
    s1.enemies.push_back(make_enemy(2, 20.0f, 10.0f));
    s1.enemies.push_back(make_enemy(3, 30.0f, 10.0f));
    session.stage_snapshot(s1, 0.0);
    session.update(TickContext{0.0, 0.016f});
    ASSERT_EQ(session.enemy_count(), 3u);

    auto s2 = make_snapshot(2, 16.0);
    s2.enemies.push_back(make_enemy(1, 10.0f, 10.0f, 20.0f));
    auto dead = make_enemy(3, 30.0f, 10.0f, 0.0f);
    dead.active = false;
    s2.enemies.push_back(dead);
    session.stage_snapshot(s2, 16.0);
    session.update(TickContext{16.0, 0.016f});

    ASSERT_EQ(session.enemy_count(), 1u);
    ASSERT_TRUE(session.has_enemy(1));
    ASSERT_FLOAT_EQ(session.registry().get<ecs::EnemyInfo>(session.find_enemy(1)).health, 20.0f);
    ASSERT_EQ(session.find_enemy(2), entt::null);
}

TEST(guest_session_test, one_snapshot_per_frame_latest_wins) {
    SyncConfig config;
    GuestSession session(config);

    auto s1 = make_snapshot(1, 0.0);
    s1.wave = 1;
    auto s2 = make_snapshot(2, 16.0);
    s2.wave = 2;
    session.stage_snapshot(s1, 20.0);
    session.stage_snapshot(s2, 20.0);
    ASSERT_TRUE(session.has_pending_snapshot());

    session.update(TickContext{20.0, 0.016f});
    ASSERT_FALSE(session.has_pending_snapshot());
    ASSERT_EQ(session.run_state().wave, 2);
    ASSERT_EQ(session.stats().snapshots_applied, 1u);
    ASSERT_EQ(session.stats().snapshots_superseded, 1u);

    // Nothing new arrived; the next frame applies nothing
    session.update(TickContext{36.0, 0.016f});
    ASSERT_EQ(session.stats().snapshots_applied, 1u);
}

TEST(guest_session_test, stale_snapshots_are_dropped) {
    SyncConfig config;
    GuestSession session(config);

    auto current = make_snapshot(5, 500.0);
    current.wave = 5;
    session.stage_snapshot(current, 500.0);
    session.update(TickContext{500.0, 0.016f});

    auto older = make_snapshot(4, 400.0);
    older.wave = 4;
    session.stage_snapshot(older, 516.0);
    session.update(TickContext{516.0, 0.016f});
    ASSERT_EQ(session.run_state().wave, 5);
    ASSERT_EQ(session.stats().stale_dropped, 1u);

    // Newer sequence but an older host clock
    auto rewound = make_snapshot(6, 450.0);
    rewound.wave = 6;
    session.stage_snapshot(rewound, 532.0);
    session.update(TickContext{532.0, 0.016f});
    ASSERT_EQ(session.run_state().wave, 5);
    ASSERT_EQ(session.stats().stale_dropped, 2u);

    // An older one arriving after a newer one in the same frame
    session.stage_snapshot(make_snapshot(8, 600.0), 600.0);
    session.stage_snapshot(make_snapshot(7, 590.0), 600.0);
    ASSERT_EQ(session.stats().stale_dropped, 3u);
    session.update(TickContext{600.0, 0.016f});
    ASSERT_EQ(session.stats().snapshots_applied, 2u);
}

TEST(guest_session_test, malformed_payload_is_counted) {
    SyncConfig config;
    GuestSession session(config);
    auto [host_end, guest_end] = LoopbackTransport::make_pair();
    session.attach(guest_end);

    guest_end->inject(MessageType::Snapshot, {1, 2, 3});
    ASSERT_EQ(session.stats().malformed_dropped, 1u);
    ASSERT_FALSE(session.has_pending_snapshot());

    auto bytes = make_snapshot(1, 0.0).to_bytes();
    ASSERT_TRUE(host_end->send(MessageType::Snapshot, bytes));
    guest_end->pump();
    ASSERT_TRUE(session.has_pending_snapshot());
}

TEST(guest_session_test, pilots_and_run_state) {
    SyncConfig config;
    GuestSession session(config);

    auto snapshot = make_snapshot(1, 0.0);
    snapshot.score = 1200;
    snapshot.intermission_active = true;
    snapshot.countdown = 3.0f;
    snapshot.pending_wave = 2;
    session.stage_snapshot(snapshot, 0.0);
    session.update(TickContext{0.0, 0.016f});

    auto remote = session.remote_pilot_position();
    ASSERT_TRUE(remote.has_value());
    ASSERT_FLOAT_EQ(remote->x, 200.0f);
    ASSERT_FLOAT_EQ(remote->y, 300.0f);

    ASSERT_FLOAT_EQ(session.local_pilot().health, 75.0f);
    ASSERT_TRUE(session.local_pilot().active);

    ASSERT_EQ(session.run_state().score, 1200);
    ASSERT_TRUE(session.run_state().intermission_active);
    ASSERT_FLOAT_EQ(*session.run_state().countdown, 3.0f);
    ASSERT_EQ(*session.run_state().pending_wave, 2);
}

TEST(guest_session_test, hostile_bullets_dead_reckon_between_snapshots) {
    SyncConfig config;
    GuestSession session(config);

    auto s1 = make_snapshot(1, 1000.0);
    HostileBulletRecord bullet;
    bullet.id = 7;
    bullet.x = 0.0f;
    bullet.y = 50.0f;
    bullet.vx = 100.0f;
    bullet.vy = 0.0f;
    s1.bullets.push_back(bullet);
    session.stage_snapshot(s1, 1000.0);
    session.update(TickContext{1000.0, 0.016f});
    ASSERT_FLOAT_EQ(session.hostile_bullet_position(7)->x, 0.0f);

    session.update(TickContext{1500.0, 0.5f});
    ASSERT_FLOAT_EQ(session.hostile_bullet_position(7)->x, 50.0f);
    ASSERT_FLOAT_EQ(session.hostile_bullet_position(7)->y, 50.0f);

    session.stage_snapshot(make_snapshot(2, 1516.0), 1516.0);
    session.update(TickContext{1516.0, 0.016f});
    ASSERT_FALSE(session.hostile_bullet_position(7).has_value());
    ASSERT_EQ(session.hostile_bullet_count(), 0u);
}

TEST(guest_session_test, fire_is_echoed_then_reconciled) {
    SyncConfig config;
    GuestSession session(config);
    auto [host_end, guest_end] = LoopbackTransport::make_pair();
    session.attach(guest_end);

    ASSERT_TRUE(session.fire(100.0f, 100.0f, 1.0f, 0.0f, 1000.0));
    ASSERT_EQ(host_end->inbox().size(), 1u);
    ASSERT_EQ(host_end->inbox().front().type, MessageType::FireRequest);

    FireRequest request;
    request.deserialize(host_end->inbox().front().payload);
    ASSERT_FLOAT_EQ(request.x, 100.0f);
    ASSERT_FLOAT_EQ(request.dir_x, 1.0f);

    ASSERT_EQ(session.speculative_shot_count(), 1u);
    ASSERT_EQ(session.visible_friendly_bullets(), 1u);
    const auto& shot = session.optimistic().live().front();
    ASSERT_LT(shot.id, 0);
    ASSERT_EQ(shot.authority, sync::Authority::Speculative);

    session.update(TickContext{1016.0, 0.016f});
    ASSERT_EQ(session.visible_friendly_bullets(), 1u);

    // The host's copy shows up where the local echo has flown to
    auto snapshot = make_snapshot(1, 1050.0);
    FriendlyBulletRecord confirmed;
    confirmed.id = 1;
    confirmed.x = 130.0f;
    confirmed.y = 100.0f;
    confirmed.vx = config.world().player_bullet_speed;
    confirmed.vy = 0.0f;
    snapshot.player_bullets.push_back(confirmed);
    session.stage_snapshot(snapshot, 1050.0);
    session.update(TickContext{1050.0, 0.034f});

    ASSERT_EQ(session.speculative_shot_count(), 0u);
    ASSERT_EQ(session.friendly_bullet_count(), 1u);
    ASSERT_EQ(session.visible_friendly_bullets(), 1u);
    ASSERT_EQ(session.stats().shots_reconciled, 1u);
    ASSERT_EQ(session.stats().shots_expired, 0u);
    ASSERT_FLOAT_EQ(session.friendly_bullet_position(1)->x, 130.0f);

    // Long past the expiry window, nothing comes back
    session.update(TickContext{2000.0, 0.016f});
    ASSERT_EQ(session.stats().shots_expired, 0u);
}

TEST(guest_session_test, fire_reconciles_over_a_slow_link) {
    SyncConfig config;
    GuestSession session(config);

    // 60 ms each way: the host spawns its copy at 1060 and reports it at 1076,
    // and that snapshot lands here at 1136
    ASSERT_TRUE(session.fire(100.0f, 100.0f, 1.0f, 0.0f, 1000.0));
    session.update(TickContext{1016.0, 0.016f});
    session.update(TickContext{1132.0, 0.116f});
    ASSERT_EQ(session.visible_friendly_bullets(), 1u);

    auto snapshot = make_snapshot(1, 1076.0);
    FriendlyBulletRecord confirmed;
    confirmed.id = 1;
    confirmed.x = 109.6f;
    confirmed.y = 100.0f;
    confirmed.vx = config.world().player_bullet_speed;
    confirmed.vy = 0.0f;
    snapshot.player_bullets.push_back(confirmed);
    session.stage_snapshot(snapshot, 1136.0);
    session.update(TickContext{1140.0, 0.008f});

    ASSERT_EQ(session.visible_friendly_bullets(), 1u);
    ASSERT_EQ(session.speculative_shot_count(), 0u);
    ASSERT_EQ(session.stats().shots_reconciled, 1u);
}

TEST(guest_session_test, samples_use_receive_time) {
    SyncConfig config;
    GuestSession session(config);

    auto snapshot = make_snapshot(1, 1000.0);
    HostileBulletRecord bullet;
    bullet.id = 4;
    bullet.x = 0.0f;
    bullet.y = 0.0f;
    bullet.vx = 100.0f;
    bullet.vy = 0.0f;
    snapshot.bullets.push_back(bullet);

    // Arrived 40 ms after it was sent, applied a frame later
    session.stage_snapshot(snapshot, 1040.0);
    session.update(TickContext{1056.0, 0.016f});

    ASSERT_EQ(session.latency().sample_count(), 1u);
    ASSERT_DOUBLE_EQ(session.latency().average_ms(), 40.0);
    // Dead reckoning counts from arrival, not from the frame that applied it
    ASSERT_FLOAT_EQ(session.hostile_bullet_position(4)->x, 1.6f);
}

TEST(guest_session_test, unconfirmed_shot_expires_after_window) {
    SyncConfig config;
    GuestSession session(config);

    ASSERT_TRUE(session.fire(100.0f, 100.0f, 0.0f, -1.0f, 0.0));
    auto id = session.optimistic().live().front().id;

    session.update(TickContext{300.0, 0.016f});
    ASSERT_EQ(session.speculative_shot_count(), 1u);
    ASSERT_FLOAT_EQ(session.speculative_shot_position(id)->y, 100.0f - 0.3f * config.world().player_bullet_speed);

    session.update(TickContext{301.0, 0.001f});
    ASSERT_EQ(session.speculative_shot_count(), 0u);
    ASSERT_FALSE(session.speculative_shot_position(id).has_value());
    ASSERT_EQ(session.stats().shots_expired, 1u);
}

TEST(guest_session_test, fire_cooldown_and_bad_direction) {
    SyncConfig config;
    GuestSession session(config);

    ASSERT_FALSE(session.fire(0.0f, 0.0f, 0.0f, 0.0f, 0.0));
    ASSERT_TRUE(session.fire(0.0f, 0.0f, 1.0f, 0.0f, 0.0));
    ASSERT_FALSE(session.fire(0.0f, 0.0f, 1.0f, 0.0f, 100.0));
    ASSERT_TRUE(session.fire(0.0f, 0.0f, 1.0f, 0.0f, 200.0));
    ASSERT_EQ(session.stats().shots_fired, 2u);

    // Ids keep counting down
    ASSERT_EQ(session.optimistic().live()[0].id, -1);
    ASSERT_EQ(session.optimistic().live()[1].id, -2);
}

TEST(guest_session_test, pose_is_throttled) {
    SyncConfig config;
    GuestSession session(config);
    ASSERT_FALSE(session.send_pose(1.0f, 2.0f, 0.0f, true, 0.0));

    auto [host_end, guest_end] = LoopbackTransport::make_pair();
    session.attach(guest_end);

    ASSERT_TRUE(session.send_pose(1.0f, 2.0f, 0.0f, true, 0.0));
    ASSERT_FALSE(session.send_pose(1.0f, 2.0f, 0.0f, true, 10.0));
    ASSERT_TRUE(session.send_pose(1.0f, 2.0f, 0.0f, true, 16.0));
    ASSERT_EQ(host_end->inbox().size(), 2u);
    ASSERT_EQ(host_end->inbox().back().type, MessageType::PilotPose);
}

TEST(guest_session_test, stop_clears_everything) {
    SyncConfig config;
    GuestSession session(config);

    auto snapshot = make_snapshot(9, 0.0);
    snapshot.enemies.push_back(make_enemy(1, 10.0f, 10.0f));
    HostileBulletRecord bullet;
    bullet.id = 2;
    snapshot.bullets.push_back(bullet);
    snapshot.wave = 3;
    session.stage_snapshot(snapshot, 0.0);
    session.update(TickContext{0.0, 0.016f});
    session.fire(0.0f, 0.0f, 1.0f, 0.0f, 0.0);
    session.stage_snapshot(make_snapshot(10, 16.0), 16.0);

    session.stop();

    ASSERT_EQ(session.enemy_count(), 0u);
    ASSERT_EQ(session.hostile_bullet_count(), 0u);
    ASSERT_EQ(session.speculative_shot_count(), 0u);
    ASSERT_EQ(session.optimistic().live_count(), 0u);
    ASSERT_FALSE(session.has_pending_snapshot());
    ASSERT_FALSE(session.remote_pilot_position().has_value());
    ASSERT_EQ(session.run_state().wave, 0);
    ASSERT_EQ(session.latency().sample_count(), 0u);

    // A fresh host starts its sequence over and must be accepted
    session.stage_snapshot(make_snapshot(1, 0.0), 0.0);
    session.update(TickContext{0.0, 0.016f});
    ASSERT_EQ(session.run_state().wave, 1);
}
