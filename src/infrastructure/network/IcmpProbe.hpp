#pragma once

#include "core/services/IProbe.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace nettune::infra {

/**
 * @brief ICMP echo probe for IPv4 targets.
 *
 * Sends one echo request per probe() call and waits for the matching reply.
 * Elapsed time is measured from just before the request is sent to just after
 * the matching reply is read.
 *
 * @note On Linux a raw socket needs CAP_NET_RAW. Without it the probe falls
 *       back to an unprivileged datagram ICMP socket, which requires the
 *       caller's group to be inside net.ipv4.ping_group_range.
 */
class IcmpProbe : public core::IProbe {
public:
    /**
     * @brief What an incoming ICMP packet means for the pending request.
     */
    enum class ReplyKind {
        Unrelated,  ///< Not a reply to our request
        EchoReply,  ///< Matching echo reply
        Unreachable ///< Destination unreachable for our request
    };

    IcmpProbe();
    ~IcmpProbe() override = default;

    core::ProbeResult probe(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Internet checksum (RFC 1071) over a buffer.
     */
    static uint16_t checksum(const uint8_t* data, size_t length);

    /**
     * @brief Builds a 64-byte echo request with a valid checksum.
     */
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

    /**
     * @brief Classifies a received packet against the pending request.
     * @param data Received bytes.
     * @param length Number of received bytes.
     * @param includesIpHeader True for raw sockets, where the IPv4 header precedes ICMP.
     * @param identifier Expected identifier; ignored when includesIpHeader is false
     *        because the kernel rewrites it on datagram sockets.
     * @param sequence Expected sequence number.
     * @param ttl Receives the reply TTL when available.
     */
    static ReplyKind classifyReply(const uint8_t* data, size_t length, bool includesIpHeader,
                                   uint16_t identifier, uint16_t sequence,
                                   std::optional<int>& ttl);

private:
    uint16_t identifier_;
    std::atomic<uint16_t> sequenceNumber_{0};
};

} // namespace nettune::infra
