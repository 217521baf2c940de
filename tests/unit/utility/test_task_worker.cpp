// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#include "utility/cv_wrapper.hpp"
#include "utility/thread_pool_manager.hpp"
#include "utility/worker.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <functional>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("worker: base test case") {
    std::atomic<int> c{0};
    TaskManager<std::function<void()>> tm;

    tm.start();
    REQUIRE(tm.addTask([&c]() { c++; }));
    REQUIRE(tm.addTask([&c]() { c++; }));

    auto done = create_cv_wrapper<bool>();
    tm.addTask([done]() { done->release(true); });
    REQUIRE(done->wait_for(2000ms) == cv_wrapper::Status::Ok);
    REQUIRE(c.load() == 2);
}

TEST_CASE("worker: tasks run in submission order") {
    std::vector<int> order;
    TaskManager<std::function<void()>> tm;

    // queued before start, picked up once the thread runs
    for (int i = 0; i < 5; ++i) {
        tm.addTask([&order, i]() { order.push_back(i); });
    }
    REQUIRE(tm.pending() == 5);

    auto done = create_cv_wrapper<bool>();
    tm.addTask([done]() { done->release(true); });
    tm.start();
    REQUIRE(done->wait_for(2000ms) == cv_wrapper::Status::Ok);
    tm.stop();

    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("worker: stop drops pending tasks") {
    std::atomic<int> c{0};
    TaskManager<std::function<void()>> tm;
    tm.addTask([&c]() { c++; });
    tm.stop();
    REQUIRE(tm.pending() == 0);
    REQUIRE(c.load() == 0);
}

TEST_CASE("worker: bounded queue") {
    Tasks<std::function<void()>> tasks(2);
    REQUIRE(tasks.addTask([]() {}));
    REQUIRE(tasks.addTask([]() {}));
    REQUIRE_FALSE(tasks.addTask([]() {}));
    REQUIRE(tasks.size() == 2);
}

TEST_CASE("thread_pool_manager: runs posted jobs on every thread") {
    thread_pool_manager pool(3);
    REQUIRE(pool.size() == 3);
    REQUIRE(pool.status() == thread_pool_status::CREATED);

    std::atomic<int> c{0};
    pool.start();
    REQUIRE(pool.status() == thread_pool_status::RUNNING);
    for (int i = 0; i < 30; ++i) {
        pool.post([&c]() { c++; });
    }
    // stop lets queued jobs finish
    pool.stop();
    REQUIRE(c.load() == 30);
    REQUIRE(pool.status() == thread_pool_status::STOPPED);

    REQUIRE(thread_pool_manager(0).size() == 1);
}
