// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace cv_wrapper {
    constexpr std::chrono::milliseconds DEFAULT_TIMEOUT(90000);

    enum class Status : uint8_t
    {
        Ok,
        Timeout,
        Interrupted,
        Error,
        Unknown
    };

    // One-shot result slot: a producer releases it once, consumers block until then.
    // Waits take a stop_token so a cancelled consumer stops waiting without a result.
    template<typename T>
    class cv_wrapper_t {
    public:
        cv_wrapper_t() = default;

        Status wait(std::stop_token stop = {}) {
            std::unique_lock<std::mutex> lock(m_);
            if (!cv_.wait(lock, stop, [this]() { return ready_; })) {
                return Status::Interrupted;
            }
            return status_;
        }

        Status wait_for(std::chrono::milliseconds timeout, std::stop_token stop = {}) {
            std::unique_lock<std::mutex> lock(m_);
            if (!cv_.wait_for(lock, stop, timeout, [this]() { return ready_; })) {
                return stop.stop_requested() ? Status::Interrupted : Status::Timeout;
            }
            return status_;
        }

        // first release wins, later calls are ignored
        bool release(T value) {
            {
                std::unique_lock<std::mutex> lock(m_);
                if (ready_) {
                    return false;
                }
                result_ = std::move(value);
                ready_ = true;
                status_ = Status::Ok;
            }
            cv_.notify_all();
            return true;
        }

        bool release_on_error(std::string error_msg) {
            {
                std::unique_lock<std::mutex> lock(m_);
                if (ready_) {
                    return false;
                }
                error_ = std::move(error_msg);
                ready_ = true;
                status_ = Status::Error;
            }
            cv_.notify_all();
            return true;
        }

        bool ready() const noexcept {
            std::unique_lock<std::mutex> lock(m_);
            return ready_;
        }

        Status status() const noexcept {
            std::unique_lock<std::mutex> lock(m_);
            return status_;
        }

        std::optional<T> result() const {
            std::unique_lock<std::mutex> lock(m_);
            return result_;
        }

        std::string error_message() const {
            std::unique_lock<std::mutex> lock(m_);
            return error_.value_or("");
        }

    private:
        Status status_{Status::Unknown};
        std::optional<T> result_;
        std::optional<std::string> error_;
        bool ready_{false};
        mutable std::mutex m_;
        std::condition_variable_any cv_;
    };
} // namespace cv_wrapper

template<typename T>
inline std::shared_ptr<cv_wrapper::cv_wrapper_t<T>> create_cv_wrapper() {
    return std::make_shared<cv_wrapper::cv_wrapper_t<T>>();
}
template<typename T>
using shared_data = std::shared_ptr<cv_wrapper::cv_wrapper_t<T>>;
