/**
 * @file ProbeResult.hpp
 * @brief Result type of a single latency probe.
 *
 * This file defines the tagged result produced once per probe attempt and
 * the error tags used when a probe does not receive a reply.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace nettune::core {

/**
 * @brief Reason a probe attempt failed.
 */
enum class ProbeError : int {
    None = 0,           ///< The probe succeeded
    Timeout = 1,        ///< No matching reply before the deadline
    Unreachable = 2,    ///< Network or host reported unreachable
    SendFailed = 3,     ///< The echo request could not be sent
    InvalidAddress = 4, ///< The target is not a valid IPv4 address
    SocketError = 5     ///< Socket could not be created or configured
};

/**
 * @brief Result of a single probe attempt.
 *
 * A result is either a success carrying the measured round-trip time, or a
 * failure carrying an error tag. A successful 0 ms sample is a valid sample.
 */
struct ProbeResult {
    uint64_t sequence{0};    ///< Attempt number within the probe session
    std::chrono::system_clock::time_point timestamp; ///< When the probe was issued
    std::chrono::microseconds latency{0}; ///< Round-trip time, valid only on success
    bool success{false};     ///< Whether a matching reply was received
    ProbeError error{ProbeError::None}; ///< Failure reason, None on success
    std::optional<int> ttl;  ///< Time-to-live from the reply (if available)
    std::string errorMessage; ///< Human-readable failure reason

    /**
     * @brief Creates a successful result.
     * @param latency Measured round-trip time.
     * @param ttl Optional TTL from the reply.
     */
    static ProbeResult succeeded(std::chrono::microseconds latency,
                                 std::optional<int> ttl = std::nullopt);

    /**
     * @brief Creates a failed result.
     * @param error Failure tag, must not be ProbeError::None.
     * @param message Human-readable reason.
     */
    static ProbeResult failed(ProbeError error, std::string message);

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Converts an error tag to a short string ("Timeout", "Unreachable"...).
 */
std::string probeErrorToString(ProbeError error);

} // namespace nettune::core
