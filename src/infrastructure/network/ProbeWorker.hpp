#pragma once

#include "core/concurrency/Channel.hpp"
#include "core/services/IProbe.hpp"
#include "infrastructure/concurrency/WorkerThread.hpp"
#include "infrastructure/network/ProbeSettings.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace nettune::infra {

/**
 * @brief Periodically probes a target on a dedicated thread.
 *
 * Each iteration performs one blocking probe, sends the result over the
 * channel and then waits a fixed interval, measured from the end of the
 * probe. The loop ends when stop() is called or when the receiving side
 * closes the channel; in the latter case the worker notices on its next send.
 *
 * Cancellation is checked before every probe and before every send, so after
 * stop() returns no further result is delivered. A worker runs one session:
 * once stopped it cannot be started again.
 */
class ProbeWorker {
public:
    using ResultChannel = core::Channel<core::ProbeResult>;

    /**
     * @brief Constructs a stopped worker.
     * @param probe Probe used for every attempt.
     * @param channel Channel results are delivered to.
     * @param settings Target, timeout and interval.
     * @throws std::invalid_argument on a null probe/channel or non-positive timings.
     */
    ProbeWorker(std::unique_ptr<core::IProbe> probe, std::shared_ptr<ResultChannel> channel,
                ProbeSettings settings);

    /**
     * @brief Destructor. Stops the loop and joins the thread.
     */
    ~ProbeWorker();

    ProbeWorker(const ProbeWorker&) = delete;
    ProbeWorker& operator=(const ProbeWorker&) = delete;

    /**
     * @brief Starts the probe loop. The first probe is issued immediately.
     *
     * Has no effect if the worker was already started.
     */
    void start();

    /**
     * @brief Cancels the loop and joins the thread.
     *
     * Blocks for at most one in-flight probe (bounded by the probe timeout).
     */
    void stop();

    /**
     * @brief True while the probe loop is active.
     */
    bool isRunning() const;

    /**
     * @brief Waits until the probe loop has ended.
     * @return True if the loop ended within the timeout.
     */
    bool waitForExit(std::chrono::milliseconds timeout) const;

    uint64_t attempts() const { return attempts_; }
    uint64_t sendAttempts() const { return sendAttempts_; }
    uint64_t sent() const { return sent_; }

    const ProbeSettings& settings() const { return settings_; }

private:
    void runOnce();
    void scheduleNext();
    void markFinished();

    std::unique_ptr<core::IProbe> probe_;
    std::shared_ptr<ResultChannel> channel_;
    ProbeSettings settings_;

    WorkerThread worker_;
    asio::steady_timer timer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> sendAttempts_{0};
    std::atomic<uint64_t> sent_{0};
    uint64_t sequence_{0};

    mutable std::mutex finishMutex_;
    mutable std::condition_variable finishCv_;
    bool finished_{false};
};

} // namespace nettune::infra
