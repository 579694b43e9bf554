#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/IcmpProbe.hpp"

#include <vector>

using namespace nettune::core;
using namespace nettune::infra;

namespace {

// Minimal IPv4 header (IHL 5) with the given TTL
std::vector<uint8_t> ipHeader(uint8_t ttl) {
    std::vector<uint8_t> header(20, 0);
    header[0] = 0x45;
    header[8] = ttl;
    header[9] = 1; // ICMP
    return header;
}

std::vector<uint8_t> echoReply(uint16_t identifier, uint16_t sequence) {
    auto packet = IcmpProbe::buildEchoRequest(identifier, sequence);
    packet[0] = 0; // Echo reply
    return packet;
}

std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

} // namespace

TEST_CASE("ICMP checksum", "[IcmpProbe]") {
    SECTION("Known vector") {
        // Echo request, id 1, seq 1, no payload: 0x0800 + 0x0001 + 0x0001 -> ~0x0802
        uint8_t packet[] = {0x08, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01};
        REQUIRE(IcmpProbe::checksum(packet, sizeof(packet)) == 0xF7FD);
    }

    SECTION("Odd length pads the last byte") {
        uint8_t data[] = {0x01, 0x02, 0x03};
        // 0x0102 + 0x0300 = 0x0402 -> ~ = 0xFBFD
        REQUIRE(IcmpProbe::checksum(data, sizeof(data)) == 0xFBFD);
    }

    SECTION("Carry is folded back in") {
        uint8_t data[] = {0xFF, 0xFF, 0x00, 0x01};
        // 0xFFFF + 0x0001 = 0x10000 -> 0x0001 -> ~ = 0xFFFE
        REQUIRE(IcmpProbe::checksum(data, sizeof(data)) == 0xFFFE);
    }
}

TEST_CASE("ICMP echo request construction", "[IcmpProbe]") {
    auto packet = IcmpProbe::buildEchoRequest(0x1234, 0x0102);

    REQUIRE(packet.size() == 64);
    REQUIRE(packet[0] == 8);
    REQUIRE(packet[1] == 0);
    REQUIRE(packet[4] == 0x12);
    REQUIRE(packet[5] == 0x34);
    REQUIRE(packet[6] == 0x01);
    REQUIRE(packet[7] == 0x02);

    SECTION("Checksum over the whole packet verifies to zero") {
        REQUIRE(IcmpProbe::checksum(packet.data(), packet.size()) == 0);
    }
}

TEST_CASE("ICMP reply classification", "[IcmpProbe]") {
    const uint16_t id = 0xBEEF;
    const uint16_t seq = 7;
    std::optional<int> ttl;

    SECTION("Matching echo reply on a raw socket reports the TTL") {
        auto packet = concat(ipHeader(57), echoReply(id, seq));
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::EchoReply);
        REQUIRE(ttl == 57);
    }

    SECTION("Reply for another identifier is ignored on a raw socket") {
        auto packet = concat(ipHeader(57), echoReply(0x1111, seq));
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
    }

    SECTION("Reply for another sequence is ignored") {
        auto packet = concat(ipHeader(57), echoReply(id, seq + 1));
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
    }

    SECTION("Datagram sockets carry no IP header and a kernel-chosen identifier") {
        auto packet = echoReply(0x4242, seq);
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), false, id, seq, ttl) ==
                IcmpProbe::ReplyKind::EchoReply);
        REQUIRE_FALSE(ttl.has_value());
    }

    SECTION("Destination unreachable quoting our request") {
        std::vector<uint8_t> icmp(8, 0);
        icmp[0] = 3; // Destination unreachable
        icmp[1] = 1; // Host unreachable
        auto original = IcmpProbe::buildEchoRequest(id, seq);
        original.resize(8);
        auto packet = concat(concat(concat(ipHeader(64), icmp), ipHeader(64)), original);

        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unreachable);
    }

    SECTION("Destination unreachable for someone else's request") {
        std::vector<uint8_t> icmp(8, 0);
        icmp[0] = 3;
        auto original = IcmpProbe::buildEchoRequest(id, seq + 5);
        original.resize(8);
        auto packet = concat(concat(concat(ipHeader(64), icmp), ipHeader(64)), original);

        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
    }

    SECTION("Truncated packets are ignored") {
        auto packet = ipHeader(64);
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), true, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
        REQUIRE(IcmpProbe::classifyReply(packet.data(), 4, false, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
    }

    SECTION("Our own echo request looped back is not a reply") {
        auto packet = IcmpProbe::buildEchoRequest(id, seq);
        REQUIRE(IcmpProbe::classifyReply(packet.data(), packet.size(), false, id, seq, ttl) ==
                IcmpProbe::ReplyKind::Unrelated);
    }
}

TEST_CASE("IcmpProbe rejects invalid addresses without touching the network", "[IcmpProbe]") {
    IcmpProbe probe;

    for (const auto* address : {"not-an-address", "256.1.1.1", "", "1.2.3"}) {
        auto result = probe.probe(address, std::chrono::milliseconds(100));
        REQUIRE_FALSE(result.success);
#ifdef __linux__
        REQUIRE(result.error == ProbeError::InvalidAddress);
#else
        REQUIRE(result.error == ProbeError::SocketError);
#endif
        REQUIRE_FALSE(result.errorMessage.empty());
    }
}
