#include "core/types/LatencyBand.hpp"

#include <cmath>

namespace nettune::core {

LatencyBand classifyLatency(double latencyMs, const LatencyThresholds& thresholds) {
    if (!std::isfinite(latencyMs) || latencyMs < 0.0) {
        return LatencyBand::Unknown;
    }

    if (latencyMs < thresholds.warningMs) {
        return LatencyBand::Good;
    }
    if (latencyMs < thresholds.badMs) {
        return LatencyBand::Warning;
    }
    return LatencyBand::Bad;
}

LatencyBand classify(const ProbeResult& result, const LatencyThresholds& thresholds) {
    if (!result.success) {
        return LatencyBand::Unknown;
    }
    return classifyLatency(result.latencyMs(), thresholds);
}

std::string latencyBandToString(LatencyBand band) {
    switch (band) {
    case LatencyBand::Unknown:
        return "Unknown";
    case LatencyBand::Good:
        return "Good";
    case LatencyBand::Warning:
        return "Warning";
    case LatencyBand::Bad:
        return "Bad";
    }
    return "Unknown";
}

LatencyBand latencyBandFromString(const std::string& str) {
    if (str == "Good")
        return LatencyBand::Good;
    if (str == "Warning")
        return LatencyBand::Warning;
    if (str == "Bad")
        return LatencyBand::Bad;
    return LatencyBand::Unknown;
}

} // namespace nettune::core
