#include <catch2/catch_test_macros.hpp>

#include "core/types/LatencyBand.hpp"

#include <limits>

using namespace nettune::core;

namespace {

int severity(LatencyBand band) {
    switch (band) {
    case LatencyBand::Good:
        return 0;
    case LatencyBand::Warning:
        return 1;
    case LatencyBand::Bad:
        return 2;
    case LatencyBand::Unknown:
        break;
    }
    return -1;
}

} // namespace

TEST_CASE("Latency classification with default thresholds", "[LatencyBand]") {
    SECTION("Below warning is Good") {
        REQUIRE(classifyLatency(0.0) == LatencyBand::Good);
        REQUIRE(classifyLatency(50.0) == LatencyBand::Good);
        REQUIRE(classifyLatency(99.9) == LatencyBand::Good);
    }

    SECTION("Warning band is inclusive at the lower edge") {
        REQUIRE(classifyLatency(100.0) == LatencyBand::Warning);
        REQUIRE(classifyLatency(150.0) == LatencyBand::Warning);
        REQUIRE(classifyLatency(199.9) == LatencyBand::Warning);
    }

    SECTION("Bad from the bad threshold up") {
        REQUIRE(classifyLatency(200.0) == LatencyBand::Bad);
        REQUIRE(classifyLatency(220.0) == LatencyBand::Bad);
        REQUIRE(classifyLatency(5000.0) == LatencyBand::Bad);
    }

    SECTION("Non-finite and negative values are Unknown") {
        REQUIRE(classifyLatency(-1.0) == LatencyBand::Unknown);
        REQUIRE(classifyLatency(std::numeric_limits<double>::quiet_NaN()) == LatencyBand::Unknown);
        REQUIRE(classifyLatency(std::numeric_limits<double>::infinity()) == LatencyBand::Unknown);
    }
}

TEST_CASE("Latency classification with custom thresholds", "[LatencyBand]") {
    LatencyThresholds thresholds{50, 80};

    REQUIRE(classifyLatency(49.0, thresholds) == LatencyBand::Good);
    REQUIRE(classifyLatency(50.0, thresholds) == LatencyBand::Warning);
    REQUIRE(classifyLatency(80.0, thresholds) == LatencyBand::Bad);
}

TEST_CASE("Latency classification is monotonic", "[LatencyBand]") {
    auto sweep = [](const LatencyThresholds& thresholds) {
        int previous = severity(classifyLatency(0.0, thresholds));
        REQUIRE(previous == 0);

        // Quarter-millisecond steps from 0 to 1000 ms
        for (int step = 1; step <= 4000; ++step) {
            double latencyMs = step * 0.25;
            int current = severity(classifyLatency(latencyMs, thresholds));
            REQUIRE(current >= 0);
            REQUIRE(current >= previous);
            previous = current;
        }
        REQUIRE(previous == 2);
    };

    SECTION("Default thresholds") {
        sweep(LatencyThresholds{});
    }

    SECTION("Custom thresholds") {
        sweep(LatencyThresholds{30, 31});
        sweep(LatencyThresholds{1, 999});
    }
}

TEST_CASE("Probe result classification", "[LatencyBand]") {
    SECTION("Failed probes are Unknown regardless of latency") {
        auto result = ProbeResult::failed(ProbeError::Timeout, "timeout");
        REQUIRE(classify(result) == LatencyBand::Unknown);
    }

    SECTION("Successful probes use their latency") {
        REQUIRE(classify(ProbeResult::succeeded(std::chrono::milliseconds(20))) ==
                LatencyBand::Good);
        REQUIRE(classify(ProbeResult::succeeded(std::chrono::milliseconds(120))) ==
                LatencyBand::Warning);
        REQUIRE(classify(ProbeResult::succeeded(std::chrono::milliseconds(250))) ==
                LatencyBand::Bad);
    }

    SECTION("A zero-latency success is Good, not Unknown") {
        REQUIRE(classify(ProbeResult::succeeded(std::chrono::microseconds(0))) ==
                LatencyBand::Good);
    }
}

TEST_CASE("LatencyThresholds validation", "[LatencyBand]") {
    REQUIRE(LatencyThresholds{}.isValid());
    REQUIRE(LatencyThresholds{}.warningMs == 100);
    REQUIRE(LatencyThresholds{}.badMs == 200);
    REQUIRE_FALSE(LatencyThresholds{0, 200}.isValid());
    REQUIRE_FALSE(LatencyThresholds{200, 200}.isValid());
    REQUIRE_FALSE(LatencyThresholds{300, 200}.isValid());
}

TEST_CASE("LatencyBand string conversion", "[LatencyBand]") {
    REQUIRE(latencyBandToString(LatencyBand::Good) == "Good");
    REQUIRE(latencyBandToString(LatencyBand::Warning) == "Warning");
    REQUIRE(latencyBandToString(LatencyBand::Bad) == "Bad");
    REQUIRE(latencyBandToString(LatencyBand::Unknown) == "Unknown");

    REQUIRE(latencyBandFromString("Warning") == LatencyBand::Warning);
    REQUIRE(latencyBandFromString("garbage") == LatencyBand::Unknown);
}
