#include <catch2/catch_test_macros.hpp>
#include "utils/WorkerPool.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace YtMerge;

TEST_CASE("Pool runs every job", "[workerpool]") {
    std::atomic<int> done{0};
    WorkerPool pool(3);
    CHECK(pool.size() == 3);
    for (int i = 0; i < 50; ++i) {
        pool.submit([&done]() { ++done; });
    }
    pool.waitIdle();
    CHECK(done.load() == 50);
}

TEST_CASE("Pool never exceeds its thread count", "[workerpool]") {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 8; ++i) {
            pool.submit([&]() {
                int now = ++running;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                --running;
            });
        }
        pool.waitIdle();
    }
    CHECK(peak.load() <= 2);
    CHECK(peak.load() >= 1);
}

TEST_CASE("Destructor drains queued jobs", "[workerpool]") {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&done]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++done;
            });
        }
    }
    CHECK(done.load() == 5);
}

TEST_CASE("Zero threads still gives a working pool", "[workerpool]") {
    WorkerPool pool(0);
    CHECK(pool.size() == 1);
    bool ran = false;
    pool.submit([&ran]() { ran = true; });
    pool.waitIdle();
    CHECK(ran);
}
