// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <concepts>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <thread>

template<typename Task>
requires std::invocable<Task&>
class Tasks {
public:
    explicit Tasks(std::size_t max_size = 1024)
        : max_size_{max_size} {}

    Tasks(const Tasks&) = delete;
    Tasks& operator=(const Tasks&) = delete;
    Tasks(Tasks&&) = delete;
    Tasks& operator=(Tasks&&) = delete;

    bool addTask(Task task) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (tasks_.size() >= max_size_) {
                return false;
            }
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<Task> waitAndPop(std::stop_token stop) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait(lk, stop, [&]() { return !tasks_.empty(); })) {
            return std::nullopt;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop();
        return task;
    }

    void reset() {
        std::lock_guard<std::mutex> lk(m_);
        while (!tasks_.empty()) {
            tasks_.pop();
        }
    }

    size_t size() const noexcept {
        std::lock_guard<std::mutex> lk_(m_);
        return tasks_.size();
    }

private:
    std::size_t max_size_;
    mutable std::mutex m_;
    std::condition_variable_any cv_;
    std::queue<Task> tasks_;
};

// Single background thread running queued tasks in submission order.
template<typename Task>
class TaskManager {
public:
    void start() {
        if (worker_.joinable()) {
            return;
        }
        worker_ = std::jthread([this](std::stop_token stop) { process(stop); });
    }

    // Pending tasks are dropped.
    void stop() {
        if (worker_.joinable()) {
            worker_.request_stop();
            worker_.join();
        }
        tasks_.reset();
    }

    bool addTask(Task task) { return tasks_.addTask(std::move(task)); }

    size_t pending() const noexcept { return tasks_.size(); }

    ~TaskManager() { stop(); }

private:
    void process(std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (auto task_opt = tasks_.waitAndPop(stop); task_opt) {
                (*task_opt)();
            }
        }
    }

    Tasks<Task> tasks_;
    std::jthread worker_;
};
