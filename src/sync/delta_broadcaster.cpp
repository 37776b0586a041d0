#include "delta_broadcaster.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace quadsync::sync {

using namespace quadsync::protocol;

DeltaBroadcaster::DeltaBroadcaster(const BroadcastConfig& config)
    : config_(config) {
}

double DeltaBroadcaster::interval_for(size_t entity_count) const {
    if (entity_count <= config_.entity_threshold) {
        return config_.base_interval_ms;
    }
    double extra = static_cast<double>(entity_count - config_.entity_threshold) * config_.per_entity_ms;
    return std::min(config_.base_interval_ms + extra, config_.max_interval_ms);
}

bool DeltaBroadcaster::tick(double now_ms, size_t entity_count, const CaptureFn& capture) {
    if (!transport_ || !transport_->is_ready()) {
        ++stats_.not_ready;
        return false;
    }

    if (last_send_ms_ && now_ms - *last_send_ms_ < interval_for(entity_count)) {
        ++stats_.throttled;
        return false;
    }

    Snapshot snapshot = capture(now_ms);
    snapshot.timestamp_ms = now_ms;
    snapshot.sequence = next_sequence_++;
    last_send_ms_ = now_ms;

    std::vector<uint8_t> payload;
    try {
        payload = snapshot.to_bytes();
    } catch (const std::length_error& e) {
        ++stats_.failed;
        std::cerr << "[DeltaBroadcaster] Snapshot " << snapshot.sequence << " not encodable: " << e.what() << std::endl;
        return false;
    }

    if (!transport_->send(MessageType::Snapshot, payload)) {
        ++stats_.failed;
        return false;
    }

    ++stats_.sent;
    stats_.last_sequence = snapshot.sequence;
    return true;
}

void DeltaBroadcaster::reset() {
    last_send_ms_.reset();
}

} // namespace quadsync::sync
