// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "mock_config.hpp"

#include "chunk/errors.hpp"
#include "connectors/http_client/http_client.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace http_client {

    // Serves registered bodies by URL, 404 for anything else.
    class MockHttpClient : public IHttpClient {
    public:
        explicit MockHttpClient(mock_config config = {})
            : config_(std::move(config)) {}

        void addBody(const std::string& url, std::string body) {
            std::lock_guard<std::mutex> lock(mutex_);
            bodies_[url] = std::move(body);
        }

        // runs inside every execute() before the response is produced
        void onExecute(std::function<void()> hook) { hook_ = std::move(hook); }

        HttpResponse execute(const HttpRequest& request) override {
            auto call = ++calls_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }
            if (hook_) {
                hook_();
            }
            if (config_.wait_time.count() > 0) {
                std::this_thread::sleep_for(config_.wait_time);
            }
            if (config_.can_throw) {
                throw chunks::TransportError(config_.error_message.empty() ? "MockHttpClient: connection refused"
                                                                           : config_.error_message);
            }

            HttpResponse response;
            if (call <= config_.fail_first) {
                response.status = config_.error_status;
                response.reason = "Mock failure";
                return response;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = bodies_.find(request.url); it != bodies_.end()) {
                response.status = 200;
                response.reason = "OK";
                response.body = it->second;
            } else {
                response.status = 404;
                response.reason = "Not Found";
            }
            return response;
        }

        int calls() const noexcept { return calls_.load(); }

        std::vector<HttpRequest> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        mock_config config_;
        std::atomic<int> calls_{0};
        mutable std::mutex mutex_;
        std::map<std::string, std::string> bodies_;
        std::vector<HttpRequest> requests_;
        std::function<void()> hook_;
    };

} // namespace http_client
