#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>

namespace nettune::infra {

/**
 * @brief A single dedicated thread running its own Asio I/O context.
 *
 * Handlers posted to the worker run one at a time, in posting order, on the
 * worker thread. Timers created on context() fire on the same thread. A work
 * guard keeps the thread alive between handlers until stop() is called.
 *
 * @note Non-copyable. stop() must not be called from the worker thread itself.
 */
class WorkerThread {
public:
    /**
     * @brief Constructs a stopped worker.
     * @param name Name used in log messages.
     */
    explicit WorkerThread(std::string name);

    /**
     * @brief Destructor. Stops the context and joins the thread.
     */
    ~WorkerThread();

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    /**
     * @brief Spawns the thread. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the context and joins the thread.
     *
     * Handlers still queued are discarded. Has no effect if not running.
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief True when called from the worker thread.
     */
    bool isCurrentThread() const { return std::this_thread::get_id() == threadId_.load(); }

    asio::io_context& context() { return ioContext_; }

    /**
     * @brief Queues a handler for execution on the worker thread.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    const std::string& name() const { return name_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::thread thread_;
    std::atomic<std::thread::id> threadId_{};
    std::atomic<bool> running_{false};
};

} // namespace nettune::infra
