#include <catch2/catch_test_macros.hpp>

#include "infrastructure/concurrency/WorkerThread.hpp"

#include "support/Fakes.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace nettune::infra;
using nettune::test::waitUntil;

TEST_CASE("WorkerThread lifecycle", "[WorkerThread]") {
    WorkerThread worker("test");

    SECTION("Starts stopped") {
        REQUIRE_FALSE(worker.isRunning());
        REQUIRE(worker.name() == "test");
    }

    SECTION("Start and stop") {
        worker.start();
        REQUIRE(worker.isRunning());

        worker.stop();
        REQUIRE_FALSE(worker.isRunning());
    }

    SECTION("Start and stop are idempotent") {
        worker.start();
        REQUIRE_NOTHROW(worker.start());
        worker.stop();
        REQUIRE_NOTHROW(worker.stop());
    }
}

TEST_CASE("WorkerThread runs handlers in order on its own thread", "[WorkerThread]") {
    WorkerThread worker("ordered");
    worker.start();

    std::mutex mutex;
    std::vector<int> order;
    std::atomic<bool> onWorker{true};
    auto caller = std::this_thread::get_id();

    for (int i = 0; i < 10; ++i) {
        worker.post([&, i]() {
            if (std::this_thread::get_id() == caller || !worker.isCurrentThread()) {
                onWorker = false;
            }
            std::lock_guard lock(mutex);
            order.push_back(i);
        });
    }

    REQUIRE(waitUntil([&]() {
        std::lock_guard lock(mutex);
        return order.size() == 10;
    }));
    worker.stop();

    REQUIRE(onWorker);
    REQUIRE_FALSE(worker.isCurrentThread());
    for (int i = 0; i < 10; ++i) {
        REQUIRE(order[i] == i);
    }
}

TEST_CASE("WorkerThread survives a throwing handler", "[WorkerThread]") {
    WorkerThread worker("throwing");
    worker.start();

    worker.post([]() { throw std::runtime_error("boom"); });

    // The thread logs and exits its run loop; stopping must still join cleanly
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_NOTHROW(worker.stop());
}
