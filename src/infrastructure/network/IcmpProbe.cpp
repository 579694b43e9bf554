#include "infrastructure/network/IcmpProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace nettune::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_DEST_UNREACHABLE = 3;
constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr size_t ECHO_PACKET_SIZE = 64;

uint16_t readU16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

#ifdef __linux__
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

int openIcmpSocket(bool& rawSocket) {
    int fd = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (fd >= 0) {
        rawSocket = true;
        return fd;
    }
    rawSocket = false;
    return socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
}

core::ProbeResult sendFailure(int err) {
    if (err == ENETUNREACH || err == EHOSTUNREACH) {
        return core::ProbeResult::failed(core::ProbeError::Unreachable,
                                         std::string("Destination unreachable: ") +
                                             std::strerror(err));
    }
    return core::ProbeResult::failed(core::ProbeError::SendFailed,
                                     std::string("Failed to send ICMP packet: ") +
                                         std::strerror(err));
}
#endif

} // namespace

IcmpProbe::IcmpProbe() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("IcmpProbe initialized with identifier: {}", identifier_);
}

uint16_t IcmpProbe::checksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += readU16(data);
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpProbe::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(ECHO_PACKET_SIZE, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0; // Code
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    // Send time as payload
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[ICMP_HEADER_SIZE], &now, sizeof(now));

    uint16_t sum = checksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(sum >> 8);
    packet[3] = static_cast<uint8_t>(sum & 0xFF);

    return packet;
}

IcmpProbe::ReplyKind IcmpProbe::classifyReply(const uint8_t* data, size_t length,
                                              bool includesIpHeader, uint16_t identifier,
                                              uint16_t sequence, std::optional<int>& ttl) {
    size_t offset = 0;
    std::optional<int> replyTtl;

    if (includesIpHeader) {
        if (length < 20) {
            return ReplyKind::Unrelated;
        }
        offset = static_cast<size_t>((data[0] & 0x0F) * 4);
        replyTtl = data[8];
    }

    if (length < offset + ICMP_HEADER_SIZE) {
        return ReplyKind::Unrelated;
    }

    const uint8_t* icmp = data + offset;

    if (icmp[0] == ICMP_ECHO_REPLY) {
        bool idMatches = !includesIpHeader || readU16(icmp + 4) == identifier;
        if (idMatches && readU16(icmp + 6) == sequence) {
            ttl = replyTtl;
            return ReplyKind::EchoReply;
        }
        return ReplyKind::Unrelated;
    }

    if (icmp[0] == ICMP_DEST_UNREACHABLE) {
        // Payload: original IPv4 header followed by the first 8 bytes of our request
        size_t innerOffset = offset + ICMP_HEADER_SIZE;
        if (length < innerOffset + 20) {
            return ReplyKind::Unrelated;
        }
        size_t innerIpLen = static_cast<size_t>((data[innerOffset] & 0x0F) * 4);
        size_t innerIcmp = innerOffset + innerIpLen;
        if (length < innerIcmp + ICMP_HEADER_SIZE) {
            return ReplyKind::Unrelated;
        }
        const uint8_t* original = data + innerIcmp;
        bool idMatches = !includesIpHeader || readU16(original + 4) == identifier;
        if (original[0] == ICMP_ECHO_REQUEST && idMatches && readU16(original + 6) == sequence) {
            return ReplyKind::Unreachable;
        }
    }

    return ReplyKind::Unrelated;
}

core::ProbeResult IcmpProbe::probe(const std::string& address, std::chrono::milliseconds timeout) {
    auto issuedAt = std::chrono::system_clock::now();

#ifdef __linux__
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        auto result = core::ProbeResult::failed(core::ProbeError::InvalidAddress,
                                                "Invalid IPv4 address: " + address);
        result.timestamp = issuedAt;
        return result;
    }

    bool rawSocket = false;
    SocketHandle sock(openIcmpSocket(rawSocket));
    if (!sock.valid()) {
        auto result = core::ProbeResult::failed(
            core::ProbeError::SocketError,
            std::string("Failed to create ICMP socket (need CAP_NET_RAW or ping_group_range): ") +
                std::strerror(errno));
        result.timestamp = issuedAt;
        spdlog::warn("Probe to {} failed: {}", address, result.errorMessage);
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        auto result = sendFailure(errno);
        result.timestamp = issuedAt;
        return result;
    }

    auto deadline = sendTime + timeout;
    std::array<uint8_t, 1024> recvBuffer{};

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto result = core::ProbeResult::failed(
                core::ProbeError::SocketError, std::string("poll failed: ") + std::strerror(errno));
            result.timestamp = issuedAt;
            return result;
        }
        if (ready == 0) {
            break;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            if (errno == EHOSTUNREACH || errno == ENETUNREACH) {
                auto result = sendFailure(errno);
                result.timestamp = issuedAt;
                return result;
            }
            auto result = core::ProbeResult::failed(
                core::ProbeError::SocketError,
                std::string("Receive error: ") + std::strerror(errno));
            result.timestamp = issuedAt;
            return result;
        }

        std::optional<int> ttl;
        auto kind = classifyReply(recvBuffer.data(), static_cast<size_t>(received), rawSocket,
                                  identifier_, seq, ttl);

        if (kind == ReplyKind::EchoReply) {
            auto result = core::ProbeResult::succeeded(
                std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime), ttl);
            result.timestamp = issuedAt;
            spdlog::debug("Probe to {} successful: {:.2f}ms", address, result.latencyMs());
            return result;
        }

        if (kind == ReplyKind::Unreachable) {
            auto result = core::ProbeResult::failed(core::ProbeError::Unreachable,
                                                    "Destination unreachable: " + address);
            result.timestamp = issuedAt;
            return result;
        }
    }

    auto result = core::ProbeResult::failed(
        core::ProbeError::Timeout,
        "Request timed out after " + std::to_string(timeout.count()) + " ms");
    result.timestamp = issuedAt;
    return result;
#else
    auto result = core::ProbeResult::failed(core::ProbeError::SocketError,
                                            "ICMP probe not implemented for this platform");
    result.timestamp = issuedAt;
    return result;
#endif
}

} // namespace nettune::infra
