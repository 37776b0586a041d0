#pragma once

#include "net/transport.hpp"
#include "protocol/snapshot.hpp"
#include "sync/sync_config.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace quadsync::sync {

// Host-side snapshot pacing. Called every simulation tick; sends at most one
// full snapshot per interval, and stretches the interval as the entity count
// grows. Nothing is queued or retried; a snapshot that can't be encoded or
// sent is counted as failed and dropped.
class DeltaBroadcaster {
public:
    using CaptureFn = std::function<protocol::Snapshot(double now_ms)>;

    struct Stats {
        uint64_t sent = 0;
        uint64_t throttled = 0;
        uint64_t not_ready = 0;
        uint64_t failed = 0;
        uint32_t last_sequence = 0;
    };

    explicit DeltaBroadcaster(const BroadcastConfig& config = {});

    void set_transport(std::shared_ptr<net::Transport> transport) { transport_ = std::move(transport); }

    // Effective send interval for a given load
    double interval_for(size_t entity_count) const;

    // Returns true if a snapshot went out. `capture` is only invoked when one
    // is actually due.
    bool tick(double now_ms, size_t entity_count, const CaptureFn& capture);

    // Forget pacing state, e.g. when a new guest connects
    void reset();

    const Stats& stats() const { return stats_; }

private:
    BroadcastConfig config_;
    std::shared_ptr<net::Transport> transport_;
    std::optional<double> last_send_ms_;
    uint32_t next_sequence_ = 1;
    Stats stats_;
};

} // namespace quadsync::sync
