#include <gtest/gtest.h>
#include "sync/sync_config.hpp"
#include <string>

using namespace quadsync;

TEST(sync_config_test, defaults) {
    SyncConfig config;
    ASSERT_FLOAT_EQ(config.enemy_interpolation().lerp_factor, 0.2f);
    ASSERT_FLOAT_EQ(config.pilot_interpolation().lerp_factor, 0.25f);
    ASSERT_FLOAT_EQ(config.enemy_interpolation().snap_threshold, 100.0f);
    ASSERT_FLOAT_EQ(config.pilot_interpolation().snap_threshold, 100.0f);
    ASSERT_DOUBLE_EQ(config.prediction().max_extrapolation_ms, 0.0);
    ASSERT_EQ(config.latency().window, 20u);
    ASSERT_DOUBLE_EQ(config.broadcast().base_interval_ms, 16.0);
    ASSERT_DOUBLE_EQ(config.optimistic().expiry_ms, 300.0);
    ASSERT_TRUE(config.guest().reject_stale_snapshots);
    ASSERT_EQ(config.network().port, 7777);
}

TEST(sync_config_test, partial_document_keeps_other_defaults) {
    SyncConfig config;
    ASSERT_TRUE(config.parse(R"({
        "interpolation": { "snap_threshold": 150.0 },
        "prediction": { "max_extrapolation_ms": 200 },
        "network": { "port": 9000 }
    })"));

    ASSERT_FLOAT_EQ(config.enemy_interpolation().snap_threshold, 150.0f);
    ASSERT_FLOAT_EQ(config.pilot_interpolation().snap_threshold, 150.0f);
    ASSERT_FLOAT_EQ(config.enemy_interpolation().lerp_factor, 0.2f);
    ASSERT_DOUBLE_EQ(config.prediction().max_extrapolation_ms, 200.0);
    ASSERT_EQ(config.network().port, 9000);
    ASSERT_EQ(config.network().host, "127.0.0.1");
    ASSERT_DOUBLE_EQ(config.latency().min_delay_ms, 50.0);
}

TEST(sync_config_test, smoothing_rates_are_independent) {
    SyncConfig config;
    ASSERT_TRUE(config.parse(R"({ "interpolation": { "pilot_lerp_factor": 0.5 } })"));
    ASSERT_FLOAT_EQ(config.pilot_interpolation().lerp_factor, 0.5f);
    ASSERT_FLOAT_EQ(config.enemy_interpolation().lerp_factor, 0.2f);
}

TEST(sync_config_test, bad_json_leaves_config_untouched) {
    SyncConfig config;
    ASSERT_FALSE(config.parse("{ not json"));
    ASSERT_FLOAT_EQ(config.enemy_interpolation().snap_threshold, 100.0f);

    // Wrong type in a later section must not half-apply the earlier ones
    ASSERT_FALSE(config.parse(R"({
        "interpolation": { "snap_threshold": 5.0 },
        "network": { "port": "not a port" }
    })"));
    ASSERT_FLOAT_EQ(config.enemy_interpolation().snap_threshold, 100.0f);
    ASSERT_EQ(config.network().port, 7777);
}

TEST(sync_config_test, out_of_range_values_are_clamped) {
    SyncConfig config;
    ASSERT_TRUE(config.parse(R"({
        "interpolation": { "enemy_lerp_factor": 3.0, "pilot_lerp_factor": -1.0, "snap_threshold": -10.0 },
        "latency": { "window": 0 },
        "broadcast": { "base_interval_ms": 40.0, "max_interval_ms": 10.0 },
        "network": { "max_pending_writes": 0, "frame_interval_ms": 0.0 }
    })"));

    ASSERT_FLOAT_EQ(config.enemy_interpolation().lerp_factor, 1.0f);
    ASSERT_FLOAT_EQ(config.pilot_interpolation().lerp_factor, 0.001f);
    ASSERT_FLOAT_EQ(config.enemy_interpolation().snap_threshold, 0.0f);
    ASSERT_EQ(config.latency().window, 1u);
    ASSERT_DOUBLE_EQ(config.broadcast().max_interval_ms, 40.0);
    ASSERT_EQ(config.network().max_pending_writes, 1u);
    ASSERT_DOUBLE_EQ(config.network().frame_interval_ms, 1.0);
}

TEST(sync_config_test, missing_file_fails) {
    SyncConfig config;
    ASSERT_FALSE(config.load("/nonexistent/quadsync/sync.json"));
    ASSERT_DOUBLE_EQ(config.optimistic().expiry_ms, 300.0);
}
