/**
 * @file LatencyBand.hpp
 * @brief Color-band classification of latency samples.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <string>

namespace nettune::core {

/**
 * @brief Display band a latency sample falls into.
 */
enum class LatencyBand : int {
    Unknown = 0, ///< No sample, or the probe failed
    Good = 1,    ///< Below the warning threshold
    Warning = 2, ///< Between the warning and bad thresholds
    Bad = 3      ///< At or above the bad threshold
};

/**
 * @brief Latency thresholds in milliseconds.
 *
 * A sample is Good below warningMs, Warning in [warningMs, badMs) and Bad
 * from badMs upwards.
 */
struct LatencyThresholds {
    int warningMs{100}; ///< First latency (ms) classified as Warning
    int badMs{200};     ///< First latency (ms) classified as Bad

    /**
     * @brief Checks that 0 < warningMs < badMs.
     */
    [[nodiscard]] bool isValid() const { return warningMs > 0 && badMs > warningMs; }

    bool operator==(const LatencyThresholds& other) const = default;
};

/**
 * @brief Classifies a latency value.
 * @param latencyMs Latency in milliseconds.
 * @param thresholds Band boundaries.
 * @return Good, Warning or Bad; Unknown for negative or non-finite input.
 */
LatencyBand classifyLatency(double latencyMs, const LatencyThresholds& thresholds = {});

/**
 * @brief Classifies a probe result. Failed probes are Unknown.
 */
LatencyBand classify(const ProbeResult& result, const LatencyThresholds& thresholds = {});

std::string latencyBandToString(LatencyBand band);
LatencyBand latencyBandFromString(const std::string& str);

} // namespace nettune::core
