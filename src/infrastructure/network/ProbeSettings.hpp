#pragma once

#include <chrono>
#include <string>

namespace nettune::infra {

/**
 * @brief Target and timing of a probe session.
 */
struct ProbeSettings {
    std::string target{"8.8.8.8"};            ///< IPv4 address to probe
    std::chrono::milliseconds timeout{1000};  ///< Per-probe reply timeout
    std::chrono::milliseconds interval{1000}; ///< Pause after each probe
};

} // namespace nettune::infra
