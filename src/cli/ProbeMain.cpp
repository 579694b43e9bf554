#include "core/concurrency/Channel.hpp"
#include "core/monitor/LatencyTracker.hpp"
#include "core/types/Ipv4Address.hpp"
#include "infrastructure/network/IcmpProbe.hpp"
#include "infrastructure/network/ProbeWorker.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

namespace {

std::atomic<bool> interrupted{false};

void onSignal(int /*signal*/) {
    interrupted = true;
}

void initializeLogging() {
    auto logger = spdlog::stderr_color_mt("nettune-probe");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

// Parses a positive integer option, or returns -1
long long positiveOption(const QCommandLineParser& parser, const QString& name) {
    bool ok = false;
    long long value = parser.value(name).toLongLong(&ok);
    return ok && value > 0 ? value : -1;
}

void printSample(const nettune::core::ProbeResult& result,
                 const nettune::core::LatencyTracker& tracker) {
    if (result.success) {
        std::cout << "Ping: " << static_cast<long long>(result.latencyMs() + 0.5) << " ms ["
                  << nettune::core::latencyBandToString(tracker.currentBand()) << "]"
                  << std::endl;
    } else {
        std::cout << "Ping failed: "
                  << (result.errorMessage.empty() ? nettune::core::probeErrorToString(result.error)
                                                  : result.errorMessage)
                  << std::endl;
    }
}

void printSummary(const nettune::core::LatencyTracker& tracker) {
    auto summary = tracker.summary();
    std::cout << "--- " << tracker.sampleCount() << " probes, last " << summary.samples
              << ": " << summary.failures << " failed";
    if (summary.samples > summary.failures) {
        std::cout << fmt::format(", min/avg/max = {:.1f}/{:.1f}/{:.1f} ms", summary.minLatencyMs,
                                 summary.avgLatencyMs, summary.maxLatencyMs);
    }
    std::cout << " ---" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("nettune-probe");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Measures ICMP round-trip latency to a host.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {{"t", "target"}, "IPv4 address to probe.", "address", "8.8.8.8"},
        {"timeout-ms", "Reply timeout per probe.", "ms", "1000"},
        {"interval-ms", "Pause between probes.", "ms", "1000"},
        {{"c", "count"}, "Number of probes, 0 for no limit.", "n", "0"},
        {"history", "Samples kept for the summary.", "n", "5"},
        {{"v", "verbose"}, "Log worker activity to stderr."},
    });
    parser.process(app);

    initializeLogging();
    if (parser.isSet("verbose")) {
        spdlog::set_level(spdlog::level::debug);
    }

    nettune::infra::ProbeSettings settings;
    settings.target = parser.value("target").toStdString();
    if (!nettune::core::isValidIpv4(settings.target)) {
        std::cerr << "Invalid target address: " << settings.target << std::endl;
        return 1;
    }

    auto timeoutMs = positiveOption(parser, "timeout-ms");
    auto intervalMs = positiveOption(parser, "interval-ms");
    auto history = positiveOption(parser, "history");
    bool countOk = false;
    auto count = parser.value("count").toLongLong(&countOk);
    if (timeoutMs < 0 || intervalMs < 0 || history < 0 || !countOk || count < 0) {
        std::cerr << "Timeout, interval and history must be positive; count must be >= 0"
                  << std::endl;
        return 1;
    }
    settings.timeout = std::chrono::milliseconds(timeoutMs);
    settings.interval = std::chrono::milliseconds(intervalMs);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        auto channel = std::make_shared<nettune::infra::ProbeWorker::ResultChannel>();
        nettune::infra::ProbeWorker worker(std::make_unique<nettune::infra::IcmpProbe>(), channel,
                                           settings);
        nettune::core::LatencyTracker tracker(static_cast<size_t>(history));

        std::cout << "Probing " << settings.target << " every " << intervalMs << " ms"
                  << std::endl;
        worker.start();

        uint64_t successes = 0;
        while (!interrupted && (count == 0 || tracker.sampleCount() < static_cast<uint64_t>(count))) {
            auto result = channel->receiveFor(std::chrono::milliseconds(200));
            if (!result) {
                continue;
            }
            tracker.record(*result);
            if (result->success) {
                ++successes;
            }
            printSample(*result, tracker);
        }

        channel->close();
        worker.stop();
        printSummary(tracker);

        return successes > 0 ? 0 : 2;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
