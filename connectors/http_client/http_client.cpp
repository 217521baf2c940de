// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "http_client.hpp"

#include "chunk/errors.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <regex>
#include <thread>

namespace http_client {

    Url parseUrl(std::string_view url) {
        static const std::regex pattern(R"(^(https?)://([^/:?#]+)(?::(\d+))?([^#]*)?.*$)", std::regex::icase);

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_match(url.begin(), url.end(), match, pattern)) {
            throw chunks::TransportError("Invalid download URL: " + std::string(url));
        }

        Url result;
        result.scheme = match[1].str();
        for (auto& c : result.scheme) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        result.host = match[2].str();
        result.port = match[3].matched ? match[3].str() : (result.secure() ? "443" : "80");
        result.target = match[4].matched ? match[4].str() : "";
        if (result.target.empty()) {
            result.target = "/";
        } else if (result.target.front() == '?') {
            result.target.insert(result.target.begin(), '/');
        }
        return result;
    }

    bool isTransientStatus(unsigned status) noexcept {
        return status == 429 || status == 502 || status == 503 || status == 504;
    }

    BeastHttpClient::BeastHttpClient(HttpClientConfig config)
        : config_{std::move(config)}
        , ssl_ctx_{ssl::context::tls_client}
        , log_{get_logger(logger_tag::HTTP_CLIENT)} {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(config_.verifyPeer ? ssl::verify_peer : ssl::verify_none);
    }

    HttpResponse BeastHttpClient::execute(const HttpRequest& request) {
        auto url = parseUrl(request.url);

        int attempt = 0;
        while (true) {
            ++attempt;
            try {
                auto response = executeOnce(url, request);
                if (!isTransientStatus(response.status) || attempt > config_.maxRetries) {
                    return response;
                }
                log_->warn("GET {}{} returned {}, retry {} of {}",
                           url.host,
                           url.target.substr(0, url.target.find('?')),
                           response.status,
                           attempt,
                           config_.maxRetries);
            } catch (const boost::system::system_error& e) {
                if (attempt > config_.maxRetries) {
                    throw chunks::TransportError("GET " + url.host + " failed after " + std::to_string(attempt) +
                                                 " attempts: " + e.what());
                }
                log_->warn("GET {} failed: {}, retry {} of {}", url.host, e.what(), attempt, config_.maxRetries);
            }
            std::this_thread::sleep_for(config_.retryDelay);
        }
    }

    namespace {
        // Starts one async operation and runs the io_context until its handler fired.
        // Stream operations are bounded by the stream's expiry, which fails them with beast::error::timeout.
        template<typename Initiate>
        void run_step(asio::io_context& ioc, const char* step, Initiate&& initiate) {
            beast::error_code result;
            initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
            ioc.restart();
            ioc.run();
            if (result) {
                throw boost::system::system_error(result, step);
            }
        }
    } // namespace

    HttpResponse BeastHttpClient::executeOnce(const Url& url, const HttpRequest& request) {
        asio::io_context ioc;
        auto endpoints = resolve(ioc, url);

        if (!url.secure()) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(config_.timeout);
            run_step(ioc, "connect", [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
            auto response = roundTrip(ioc, stream, url, request);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            throw boost::system::system_error(ec, "SNI");
        }
        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(config_.timeout);
        run_step(ioc, "connect", [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });
        lowest.expires_after(config_.timeout);
        run_step(ioc, "handshake", [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        auto response = roundTrip(ioc, stream, url, request);

        // stream_truncated is common here, servers close without close_notify
        lowest.expires_after(config_.timeout);
        try {
            run_step(ioc, "shutdown", [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        } catch (const boost::system::system_error& e) {
            log_->trace("TLS shutdown with {}: {}", url.host, e.code().message());
        }
        return response;
    }

    tcp::resolver::results_type BeastHttpClient::resolve(asio::io_context& ioc, const Url& url) {
        tcp::resolver resolver(ioc);
        tcp::resolver::results_type endpoints;
        beast::error_code result;
        bool done = false;
        resolver.async_resolve(url.host, url.port, [&](beast::error_code ec, tcp::resolver::results_type found) {
            result = ec;
            endpoints = std::move(found);
            done = true;
        });
        ioc.run_for(config_.timeout);
        if (!done) {
            // the aborted handler still has to run before the resolver goes away
            resolver.cancel();
            ioc.restart();
            ioc.run();
            result = asio::error::timed_out;
        }
        if (result) {
            throw boost::system::system_error(result, "resolve");
        }
        return endpoints;
    }

    template<typename Stream>
    HttpResponse
    BeastHttpClient::roundTrip(asio::io_context& ioc, Stream& stream, const Url& url, const HttpRequest& request) {
        http::request<http::empty_body> req{http::verb::get, url.target, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::user_agent, config_.userAgent);
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(config_.timeout);
        run_step(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        lowest.expires_after(config_.timeout);
        run_step(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); });
        lowest.expires_never();

        auto& res = parser.get();
        HttpResponse response;
        response.status = res.result_int();
        response.reason = std::string(res.reason());
        for (const auto& field : res) {
            response.headers.emplace(std::string(field.name_string()), std::string(field.value()));
        }
        response.body = std::move(res.body());
        return response;
    }

} // namespace http_client
