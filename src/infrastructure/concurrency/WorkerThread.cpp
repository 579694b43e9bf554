#include "infrastructure/concurrency/WorkerThread.hpp"

#include <spdlog/spdlog.h>

namespace nettune::infra {

WorkerThread::WorkerThread(std::string name) : name_(std::move(name)) {}

WorkerThread::~WorkerThread() {
    stop();
}

void WorkerThread::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    thread_ = std::thread([this]() {
        threadId_ = std::this_thread::get_id();
        spdlog::debug("Worker thread '{}' started", name_);
        try {
            ioContext_.run();
        } catch (const std::exception& e) {
            spdlog::error("Worker thread '{}' terminated by exception: {}", name_, e.what());
        }
        spdlog::debug("Worker thread '{}' stopped", name_);
    });
}

void WorkerThread::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    if (thread_.joinable()) {
        thread_.join();
    }
    threadId_ = std::thread::id{};

    ioContext_.restart();
}

} // namespace nettune::infra
