#include "core/monitor/LatencyTracker.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace nettune::core {

LatencyTracker::LatencyTracker(size_t historyCapacity, LatencyThresholds thresholds)
    : history_(historyCapacity) {
    setThresholds(thresholds);
}

void LatencyTracker::record(const ProbeResult& result) {
    current_ = result;
    history_.push(result);
    ++sampleCount_;
}

void LatencyTracker::reset() {
    current_.reset();
    history_.clear();
    sampleCount_ = 0;
}

LatencyBand LatencyTracker::currentBand() const {
    if (!current_) {
        return LatencyBand::Unknown;
    }
    return classify(*current_, thresholds_);
}

std::vector<LatencyBand> LatencyTracker::bandsOldestFirst() const {
    std::vector<LatencyBand> bands;
    bands.reserve(history_.size());
    for (const auto& result : history_) {
        bands.push_back(classify(result, thresholds_));
    }
    return bands;
}

LatencySummary LatencyTracker::summary() const {
    LatencySummary summary;
    summary.samples = static_cast<int>(history_.size());

    double minLatency = std::numeric_limits<double>::max();
    double maxLatency = 0.0;
    double total = 0.0;
    int successes = 0;

    for (const auto& result : history_) {
        if (!result.success) {
            ++summary.failures;
            continue;
        }
        double latency = result.latencyMs();
        minLatency = std::min(minLatency, latency);
        maxLatency = std::max(maxLatency, latency);
        total += latency;
        ++successes;
    }

    if (successes > 0) {
        summary.minLatencyMs = minLatency;
        summary.maxLatencyMs = maxLatency;
        summary.avgLatencyMs = total / successes;
    }

    return summary;
}

void LatencyTracker::setThresholds(const LatencyThresholds& thresholds) {
    if (!thresholds.isValid()) {
        throw std::invalid_argument("Latency thresholds must satisfy 0 < warning < bad");
    }
    thresholds_ = thresholds;
}

} // namespace nettune::core
