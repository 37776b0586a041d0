#pragma once

#include "host/world.hpp"
#include "net/transport.hpp"
#include "sync/delta_broadcaster.hpp"
#include "sync/entity_interpolator.hpp"
#include "sync/sync_config.hpp"
#include "sync/tick_context.hpp"
#include <cstdint>
#include <memory>
#include <span>

namespace quadsync::host {

// Host end of the link: folds guest messages into the World and paces
// snapshots back out.
class HostSession {
public:
    struct Stats {
        uint64_t fire_requests_applied = 0;
        uint64_t fire_requests_rejected = 0;
        uint64_t poses_received = 0;
        uint64_t malformed_dropped = 0;
    };

    HostSession(World& world, const SyncConfig& config);

    // Start talking to a newly connected guest
    void attach(std::shared_ptr<net::Transport> transport);
    // Guest gone: its pilot goes inactive, snapshots stop
    void detach();

    void handle_message(protocol::MessageType type, std::span<const uint8_t> payload);

    // Per frame, after the simulation step
    void update(const TickContext& ctx);

    bool has_guest() const { return transport_ != nullptr; }
    const Stats& stats() const { return stats_; }
    const sync::DeltaBroadcaster& broadcaster() const { return broadcaster_; }

private:
    void on_fire_request(std::span<const uint8_t> payload);
    void on_pilot_pose(std::span<const uint8_t> payload);

    World& world_;
    std::shared_ptr<net::Transport> transport_;
    sync::DeltaBroadcaster broadcaster_;
    sync::EntityInterpolator guest_pilot_;
    Stats stats_;
};

} // namespace quadsync::host
