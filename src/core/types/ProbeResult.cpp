#include "core/types/ProbeResult.hpp"

#include <stdexcept>

namespace nettune::core {

ProbeResult ProbeResult::succeeded(std::chrono::microseconds latency, std::optional<int> ttl) {
    ProbeResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.latency = latency < std::chrono::microseconds::zero() ? std::chrono::microseconds::zero()
                                                                  : latency;
    result.success = true;
    result.error = ProbeError::None;
    result.ttl = ttl;
    return result;
}

ProbeResult ProbeResult::failed(ProbeError error, std::string message) {
    if (error == ProbeError::None) {
        throw std::invalid_argument("A failed probe result needs an error tag");
    }

    ProbeResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.success = false;
    result.error = error;
    result.errorMessage = std::move(message);
    return result;
}

std::string probeErrorToString(ProbeError error) {
    switch (error) {
    case ProbeError::None:
        return "None";
    case ProbeError::Timeout:
        return "Timeout";
    case ProbeError::Unreachable:
        return "Unreachable";
    case ProbeError::SendFailed:
        return "SendFailed";
    case ProbeError::InvalidAddress:
        return "InvalidAddress";
    case ProbeError::SocketError:
        return "SocketError";
    }
    return "None";
}

} // namespace nettune::core
