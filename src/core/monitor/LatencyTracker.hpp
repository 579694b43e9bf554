/**
 * @file LatencyTracker.hpp
 * @brief UI-side state of a latency monitoring session.
 *
 * Holds the current sample and the rolling history of a probe session. Owned
 * by the consumer thread only; the probe worker never reads it back.
 */

#pragma once

#include "core/types/LatencyBand.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/RollingHistory.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace nettune::core {

/**
 * @brief Aggregated view of the samples currently in the history.
 */
struct LatencySummary {
    int samples{0};            ///< Number of entries in the history
    int failures{0};           ///< Failed probes among them
    double minLatencyMs{0.0};  ///< Minimum successful latency
    double maxLatencyMs{0.0};  ///< Maximum successful latency
    double avgLatencyMs{0.0};  ///< Mean successful latency

    /**
     * @brief Percentage of failed probes (0-100).
     */
    [[nodiscard]] double failureRate() const {
        return samples > 0 ? (static_cast<double>(failures) / samples) * 100.0 : 0.0;
    }
};

/**
 * @brief Tracks the current sample and a bounded history of probe results.
 */
class LatencyTracker {
public:
    /**
     * @brief Constructs an empty tracker.
     * @param historyCapacity Number of results kept in the history.
     * @param thresholds Band boundaries used for classification.
     * @throws std::invalid_argument on zero capacity or invalid thresholds.
     */
    explicit LatencyTracker(size_t historyCapacity, LatencyThresholds thresholds = {});

    /**
     * @brief Records a new result as the current value and appends it to the history.
     */
    void record(const ProbeResult& result);

    /**
     * @brief Forgets the current value and the whole history.
     */
    void reset();

    [[nodiscard]] const std::optional<ProbeResult>& current() const { return current_; }
    [[nodiscard]] LatencyBand currentBand() const;

    [[nodiscard]] const RollingHistory<ProbeResult>& history() const { return history_; }

    /**
     * @brief Band of every history entry, oldest first.
     */
    [[nodiscard]] std::vector<LatencyBand> bandsOldestFirst() const;

    [[nodiscard]] LatencySummary summary() const;

    /**
     * @brief Total results recorded since the last reset.
     */
    [[nodiscard]] uint64_t sampleCount() const { return sampleCount_; }

    [[nodiscard]] const LatencyThresholds& thresholds() const { return thresholds_; }
    void setThresholds(const LatencyThresholds& thresholds);

private:
    RollingHistory<ProbeResult> history_;
    std::optional<ProbeResult> current_;
    LatencyThresholds thresholds_;
    uint64_t sampleCount_{0};
};

} // namespace nettune::core
