// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "http_config.hpp"

#include "utility/logger.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace http_client {

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace asio = boost::asio;
    namespace ssl = asio::ssl;
    using tcp = asio::ip::tcp;

    // Splits "scheme://host[:port]/target". Throws chunks::TransportError on anything else.
    Url parseUrl(std::string_view url);

    bool isTransientStatus(unsigned status) noexcept;

    class IHttpClient {
    public:
        virtual ~IHttpClient() = default;
        // Blocking GET. Transient failures are retried inside; the final response is returned
        // whatever its status. Throws chunks::TransportError when no response could be obtained.
        virtual HttpResponse execute(const HttpRequest& request) = 0;
    };

    class BeastHttpClient : public IHttpClient {
    public:
        explicit BeastHttpClient(HttpClientConfig config = {});

        HttpResponse execute(const HttpRequest& request) override;

        const HttpClientConfig& config() const noexcept { return config_; }

    private:
        // Every step runs asynchronously under config_.timeout, a silent peer cannot block the caller.
        HttpResponse executeOnce(const Url& url, const HttpRequest& request);

        tcp::resolver::results_type resolve(asio::io_context& ioc, const Url& url);

        template<typename Stream>
        HttpResponse roundTrip(asio::io_context& ioc, Stream& stream, const Url& url, const HttpRequest& request);

        HttpClientConfig config_;
        ssl::context ssl_ctx_;
        log_t log_;
    };

} // namespace http_client
