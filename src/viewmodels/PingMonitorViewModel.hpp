/**
 * @file PingMonitorViewModel.hpp
 * @brief ViewModel driving the live ping monitor window.
 *
 * Owns the probe session (worker thread plus result channel) and the UI-side
 * latency state. The view calls poll() from a timer on the UI thread and
 * schedules the next tick with nextPollDelay().
 */

#pragma once

#include "core/concurrency/Channel.hpp"
#include "core/monitor/LatencyTracker.hpp"
#include "core/services/IProbe.hpp"
#include "infrastructure/network/ProbeWorker.hpp"

#include <QObject>
#include <chrono>
#include <memory>
#include <vector>

namespace nettune::viewmodels {

/**
 * @brief ViewModel for the ping monitor.
 *
 * At most one probe session is active at a time. Results travel from the
 * worker thread over a channel and are consumed here without blocking, one
 * per poll. The tracker is owned by the UI thread; the worker never touches it.
 */
class PingMonitorViewModel : public QObject {
    Q_OBJECT

public:
    /// Redraw delay while samples are expected or just arrived.
    static constexpr std::chrono::milliseconds kActivePollDelay{16};
    /// Redraw delay when idle.
    static constexpr std::chrono::milliseconds kIdlePollDelay{1000};

    /**
     * @brief Constructs a PingMonitorViewModel without an open session.
     * @param probeFactory Creates the probe for each new session.
     * @param settings Target and timing of the probe loop.
     * @param historyCapacity Number of samples kept for the chart.
     * @param recentCapacity Number of samples shown in the recent list.
     * @param thresholds Latency band boundaries.
     * @param parent Optional parent QObject for Qt ownership.
     * @throws std::invalid_argument on a zero capacity or invalid thresholds.
     */
    PingMonitorViewModel(core::ProbeFactory probeFactory, infra::ProbeSettings settings,
                         size_t historyCapacity, size_t recentCapacity,
                         core::LatencyThresholds thresholds = {}, QObject* parent = nullptr);

    ~PingMonitorViewModel() override;

    /**
     * @brief Starts a probe session with a fresh channel and worker.
     *
     * Has no effect while a session is already open.
     * @return True if a session is open afterwards.
     */
    bool openSession();

    /**
     * @brief Ends the session and clears the latency history.
     */
    void closeSession();

    bool isSessionOpen() const { return worker_ != nullptr; }

    /**
     * @brief Consumes at most one pending result without blocking.
     * @return True if a result was recorded.
     */
    bool poll();

    /**
     * @brief Delay until the next poll() should run.
     */
    std::chrono::milliseconds nextPollDelay() const;

    const core::LatencyTracker& tracker() const { return tracker_; }

    /**
     * @brief The most recent samples, newest first, at most recentCapacity().
     */
    std::vector<core::ProbeResult> recentNewestFirst() const;

    /**
     * @brief Number of samples the chart shows.
     */
    size_t historyCapacity() const { return historyCapacity_; }
    size_t recentCapacity() const { return recentCapacity_; }
    const infra::ProbeSettings& settings() const { return settings_; }

    /**
     * @brief Changes the band boundaries and reclassifies the history.
     * @throws std::invalid_argument if the thresholds are invalid.
     */
    void setThresholds(const core::LatencyThresholds& thresholds);

signals:
    void sessionOpened();
    void sessionClosed();

    /**
     * @brief Emitted on the UI thread for every recorded result.
     * @param result The result just recorded.
     */
    void sampleReceived(const nettune::core::ProbeResult& result);

private:
    core::ProbeFactory probeFactory_;
    infra::ProbeSettings settings_;
    size_t historyCapacity_;
    size_t recentCapacity_;
    core::LatencyTracker tracker_;

    std::shared_ptr<infra::ProbeWorker::ResultChannel> channel_;
    std::unique_ptr<infra::ProbeWorker> worker_;
    bool lastPollReceived_{false};
};

} // namespace nettune::viewmodels
