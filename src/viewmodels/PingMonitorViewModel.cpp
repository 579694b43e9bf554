#include "viewmodels/PingMonitorViewModel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace nettune::viewmodels {

PingMonitorViewModel::PingMonitorViewModel(core::ProbeFactory probeFactory,
                                           infra::ProbeSettings settings,
                                           size_t historyCapacity, size_t recentCapacity,
                                           core::LatencyThresholds thresholds, QObject* parent)
    : QObject(parent),
      probeFactory_(std::move(probeFactory)),
      settings_(std::move(settings)),
      historyCapacity_(historyCapacity),
      recentCapacity_(recentCapacity),
      tracker_(std::max(historyCapacity, recentCapacity), thresholds) {
    if (historyCapacity == 0 || recentCapacity == 0) {
        throw std::invalid_argument("History capacities must be positive");
    }
    if (!probeFactory_) {
        throw std::invalid_argument("PingMonitorViewModel needs a probe factory");
    }
}

PingMonitorViewModel::~PingMonitorViewModel() {
    if (channel_) {
        channel_->close();
    }
    worker_.reset();
}

bool PingMonitorViewModel::openSession() {
    if (worker_) {
        return true;
    }

    auto channel = std::make_shared<infra::ProbeWorker::ResultChannel>();
    try {
        worker_ = std::make_unique<infra::ProbeWorker>(probeFactory_(), channel, settings_);
    } catch (const std::exception& e) {
        spdlog::error("Cannot open ping session: {}", e.what());
        return false;
    }
    channel_ = std::move(channel);
    tracker_.reset();
    lastPollReceived_ = false;

    worker_->start();
    spdlog::info("Ping session opened for {}", settings_.target);
    emit sessionOpened();
    return true;
}

void PingMonitorViewModel::closeSession() {
    if (!worker_) {
        return;
    }

    channel_->close();
    worker_->stop();
    worker_.reset();
    channel_.reset();
    tracker_.reset();
    lastPollReceived_ = false;

    spdlog::info("Ping session closed");
    emit sessionClosed();
}

bool PingMonitorViewModel::poll() {
    lastPollReceived_ = false;
    if (!channel_) {
        return false;
    }

    auto result = channel_->tryReceive();
    if (!result) {
        return false;
    }

    tracker_.record(*result);
    lastPollReceived_ = true;
    emit sampleReceived(*result);
    return true;
}

std::chrono::milliseconds PingMonitorViewModel::nextPollDelay() const {
    if (!isSessionOpen()) {
        return kIdlePollDelay;
    }
    if (tracker_.sampleCount() == 0 || lastPollReceived_) {
        return kActivePollDelay;
    }
    return kIdlePollDelay;
}

std::vector<core::ProbeResult> PingMonitorViewModel::recentNewestFirst() const {
    auto samples = tracker_.history().newestFirst();
    if (samples.size() > recentCapacity_) {
        samples.resize(recentCapacity_);
    }
    return samples;
}

void PingMonitorViewModel::setThresholds(const core::LatencyThresholds& thresholds) {
    tracker_.setThresholds(thresholds);
}

} // namespace nettune::viewmodels
