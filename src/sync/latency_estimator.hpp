#pragma once

#include "sync/sync_config.hpp"
#include <deque>
#include <optional>

namespace quadsync::sync {

// Windowed moving average of host -> guest delay, derived from the host
// timestamp embedded in each snapshot.
class LatencyEstimator {
public:
    explicit LatencyEstimator(const LatencyConfig& config = {});

    // Folds |local - host| into the window. Returns the accepted raw sample, or
    // std::nullopt when it was rejected as clock-skew garbage.
    std::optional<double> estimate_from_timestamp(double host_timestamp_ms, double local_timestamp_ms);

    // Returns false for negative, non-finite or oversized samples
    bool add_sample(double latency_ms);

    double average_ms() const;
    double jitter_ms() const;

    // Extrapolation delay covering most of the jitter band
    double recommended_delay_ms() const;

    size_t sample_count() const { return samples_.size(); }
    void reset();

private:
    LatencyConfig config_;
    std::deque<double> samples_;
    double sum_ = 0.0;
};

} // namespace quadsync::sync
