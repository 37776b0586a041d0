#include "latency_estimator.hpp"
#include <algorithm>
#include <cmath>

namespace quadsync::sync {

LatencyEstimator::LatencyEstimator(const LatencyConfig& config)
    : config_(config) {
    config_.window = std::max<size_t>(config_.window, 1);
}

std::optional<double> LatencyEstimator::estimate_from_timestamp(double host_timestamp_ms,
                                                                double local_timestamp_ms) {
    double sample = std::abs(local_timestamp_ms - host_timestamp_ms);
    if (!add_sample(sample)) {
        return std::nullopt;
    }
    return sample;
}

bool LatencyEstimator::add_sample(double latency_ms) {
    if (!std::isfinite(latency_ms) || latency_ms < 0.0 || latency_ms >= config_.max_sample_ms) {
        return false;
    }

    samples_.push_back(latency_ms);
    sum_ += latency_ms;
    while (samples_.size() > config_.window) {
        sum_ -= samples_.front();
        samples_.pop_front();
    }
    return true;
}

double LatencyEstimator::average_ms() const {
    if (samples_.empty()) {
        return config_.default_average_ms;
    }
    return sum_ / static_cast<double>(samples_.size());
}

double LatencyEstimator::jitter_ms() const {
    if (samples_.empty()) {
        return config_.default_jitter_ms;
    }

    double mean = average_ms();
    double sq = 0.0;
    for (double s : samples_) {
        sq += (s - mean) * (s - mean);
    }
    return std::sqrt(sq / static_cast<double>(samples_.size()));
}

double LatencyEstimator::recommended_delay_ms() const {
    return std::max(config_.min_delay_ms, average_ms() + 2.0 * jitter_ms());
}

void LatencyEstimator::reset() {
    samples_.clear();
    sum_ = 0.0;
}

} // namespace quadsync::sync
