// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>

namespace http_client {

    struct HttpClientConfig {
        std::chrono::milliseconds timeout{60000};
        // transient failures only: resolve/connect/read errors, 429, 502, 503, 504
        int maxRetries = 3;
        std::chrono::milliseconds retryDelay{500};
        bool verifyPeer = true;
        std::string userAgent = "chunkstax/1.0";
    };

    struct Url {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;

        bool secure() const noexcept { return scheme == "https"; }
    };

    struct HttpRequest {
        std::string url;
        std::map<std::string, std::string> headers;
    };

    struct HttpResponse {
        unsigned status = 0;
        std::string reason;
        std::map<std::string, std::string> headers;
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    inline std::ostream& operator<<(std::ostream& os, const HttpClientConfig& config) {
        os << "Timeout: " << config.timeout.count() << "ms" << std::endl;
        os << "Max retries: " << config.maxRetries << std::endl;
        os << "Retry delay: " << config.retryDelay.count() << "ms" << std::endl;
        os << "Verify peer: " << config.verifyPeer << std::endl;
        os << "User agent: " << config.userAgent << std::endl;
        return os;
    }

} // namespace http_client
