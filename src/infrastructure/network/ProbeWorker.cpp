#include "infrastructure/network/ProbeWorker.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace nettune::infra {

ProbeWorker::ProbeWorker(std::unique_ptr<core::IProbe> probe,
                         std::shared_ptr<ResultChannel> channel, ProbeSettings settings)
    : probe_(std::move(probe)),
      channel_(std::move(channel)),
      settings_(std::move(settings)),
      worker_("probe " + settings_.target),
      timer_(worker_.context()) {
    if (!probe_ || !channel_) {
        throw std::invalid_argument("ProbeWorker needs a probe and a channel");
    }
    if (settings_.timeout.count() <= 0 || settings_.interval.count() <= 0) {
        throw std::invalid_argument("Probe timeout and interval must be positive");
    }
}

ProbeWorker::~ProbeWorker() {
    stop();
}

void ProbeWorker::start() {
    if (started_.exchange(true)) {
        return;
    }

    worker_.start();
    worker_.post([this]() { runOnce(); });

    spdlog::info("Probe worker started: target={} timeout={}ms interval={}ms", settings_.target,
                 settings_.timeout.count(), settings_.interval.count());
}

void ProbeWorker::stop() {
    if (!started_ || cancelled_.exchange(true)) {
        return;
    }

    worker_.stop();
    // The context is no longer running, so the timer can be touched from here
    timer_.cancel();
    markFinished();

    spdlog::info("Probe worker stopped after {} attempts ({} delivered)", attempts_.load(),
                 sent_.load());
}

bool ProbeWorker::isRunning() const {
    std::lock_guard lock(finishMutex_);
    return started_ && !finished_;
}

bool ProbeWorker::waitForExit(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(finishMutex_);
    return finishCv_.wait_for(lock, timeout, [this] { return finished_; });
}

void ProbeWorker::runOnce() {
    if (cancelled_) {
        markFinished();
        return;
    }

    ++attempts_;

    core::ProbeResult result;
    try {
        result = probe_->probe(settings_.target, settings_.timeout);
    } catch (const std::exception& e) {
        spdlog::error("Probe to {} threw: {}", settings_.target, e.what());
        result = core::ProbeResult::failed(core::ProbeError::SocketError, e.what());
    }
    result.sequence = sequence_++;

    if (!result.success) {
        spdlog::debug("Probe #{} to {} failed: {}", result.sequence, settings_.target,
                      result.errorMessage);
    }

    if (cancelled_) {
        markFinished();
        return;
    }

    ++sendAttempts_;
    if (!channel_->send(std::move(result))) {
        spdlog::info("Result channel closed, probe loop for {} exiting", settings_.target);
        markFinished();
        return;
    }
    ++sent_;

    scheduleNext();
}

void ProbeWorker::scheduleNext() {
    timer_.expires_after(settings_.interval);
    timer_.async_wait([this](const asio::error_code& ec) {
        if (ec || cancelled_) {
            markFinished();
            return;
        }
        runOnce();
    });
}

void ProbeWorker::markFinished() {
    {
        std::lock_guard lock(finishMutex_);
        finished_ = true;
    }
    finishCv_.notify_all();
}

} // namespace nettune::infra
