/**
 * @file IProbe.hpp
 * @brief Interface for a single blocking latency probe.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace nettune::core {

/**
 * @brief Performs one blocking latency measurement.
 *
 * Implementations never throw for network conditions; failures are reported
 * through a failed ProbeResult.
 */
class IProbe {
public:
    virtual ~IProbe() = default;

    /**
     * @brief Probes the target once.
     * @param address IPv4 address of the target.
     * @param timeout Maximum time to wait for a reply.
     * @return Successful result with the round-trip time, or a tagged failure.
     */
    virtual ProbeResult probe(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Creates a fresh probe for each monitoring session.
 */
using ProbeFactory = std::function<std::unique_ptr<IProbe>()>;

} // namespace nettune::core
