// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/dispatcher.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace reel::core;
using namespace std::chrono_literals;

TEST_CASE("RunLoopDispatcher - runs due tasks in scheduling order", "[dispatcher]") {
    RunLoopDispatcher loop;
    std::vector<int> order;

    loop.schedule([&] { order.push_back(1); });
    loop.schedule([&] { order.push_back(2); });
    loop.schedule([&] { order.push_back(3); });

    CHECK(loop.pending() == 3);
    CHECK(loop.run_pending() == 3);
    CHECK(order == std::vector<int>{1, 2, 3});
    CHECK(loop.pending() == 0);
}

TEST_CASE("RunLoopDispatcher - delayed tasks wait until due", "[dispatcher]") {
    RunLoopDispatcher loop;
    bool ran = false;

    loop.schedule([&] { ran = true; }, 50ms);

    CHECK(loop.run_pending() == 0);
    CHECK_FALSE(ran);
    CHECK(loop.pending() == 1);

    CHECK(loop.run_until([&] { return ran; }, 2s));
}

TEST_CASE("RunLoopDispatcher - tasks scheduled by a task run on the next pass", "[dispatcher]") {
    RunLoopDispatcher loop;
    int inner_runs = 0;

    loop.schedule([&] {
        loop.schedule([&] { ++inner_runs; });
    });

    CHECK(loop.run_pending() == 1);
    CHECK(inner_runs == 0);
    CHECK(loop.run_pending() == 1);
    CHECK(inner_runs == 1);
}

TEST_CASE("RunLoopDispatcher - tasks from another thread", "[dispatcher]") {
    RunLoopDispatcher loop;
    int count = 0;

    std::thread producer([&] {
        for (int i = 0; i < 10; ++i) {
            loop.schedule([&] { ++count; });
        }
    });

    CHECK(loop.run_until([&] { return count == 10; }, 2s));
    producer.join();
}

TEST_CASE("RunLoopDispatcher - run_until times out", "[dispatcher]") {
    RunLoopDispatcher loop;
    auto start = std::chrono::steady_clock::now();

    CHECK_FALSE(loop.run_until([] { return false; }, 30ms));
    CHECK(std::chrono::steady_clock::now() - start >= 30ms);
}

TEST_CASE("RunLoopDispatcher - drain runs delayed tasks", "[dispatcher]") {
    RunLoopDispatcher loop;
    int count = 0;

    loop.schedule([&] { ++count; }, 10ms);
    loop.schedule([&] { ++count; }, 20ms);

    CHECK(loop.drain(2s));
    CHECK(count == 2);
}
