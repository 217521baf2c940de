// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace chunks {

    // Switches meant for tests only.
    struct DownloadTestConfig {
        // links never expire
        bool fakeBackend = false;
        // first N download() calls of a chunk fail with an injected connection reset
        int injectedFailures = 0;
    };

    struct DownloadConfig {
        int maxRetries = 5;
        std::chrono::milliseconds retryDelay{1500};
        std::chrono::seconds linkExpiryBuffer{60};
        std::chrono::milliseconds linkWaitTimeout{90000};
        DownloadTestConfig test{};
    };

    // Correlation ids attached to every log line a download produces.
    struct DownloadContext {
        std::string connectionId;
        std::string statementId;
        uint64_t chunkIndex = 0;
    };

    inline std::ostream& operator<<(std::ostream& os, const DownloadConfig& config) {
        os << "Max retries: " << config.maxRetries << std::endl;
        os << "Retry delay: " << config.retryDelay.count() << "ms" << std::endl;
        os << "Link expiry buffer: " << config.linkExpiryBuffer.count() << "s" << std::endl;
        os << "Link wait timeout: " << config.linkWaitTimeout.count() << "ms" << std::endl;
        os << "Fake backend: " << config.test.fakeBackend << std::endl;
        os << "Injected failures: " << config.test.injectedFailures << std::endl;
        return os;
    }

} // namespace chunks
