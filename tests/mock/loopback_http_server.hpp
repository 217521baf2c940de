// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace http_client {

    // Plain HTTP server on 127.0.0.1 answering GETs from canned responses, one connection at a time.
    class LoopbackHttpServer {
    public:
        struct Reply {
            unsigned status = 200;
            std::string body;
        };

        LoopbackHttpServer()
            : acceptor_{ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0}} {
            thread_ = std::thread([this] { serve(); });
        }

        ~LoopbackHttpServer() {
            stopped_ = true;
            boost::system::error_code ec;
            // wake the blocking accept
            boost::asio::ip::tcp::socket poke(ioc_);
            poke.connect(acceptor_.local_endpoint(), ec);
            thread_.join();
        }

        // Replies are served in order; the last one repeats.
        void route(const std::string& target, std::vector<Reply> replies) {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[target] = std::deque<Reply>(replies.begin(), replies.end());
        }

        std::string url(const std::string& target) const {
            return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + target;
        }

        size_t hits() const { return hits_.load(); }

        std::map<std::string, std::string> lastHeaders() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return lastHeaders_;
        }

    private:
        Reply next(const std::string& target) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = routes_.find(target);
            if (it == routes_.end() || it->second.empty()) {
                return Reply{404, "not found"};
            }
            auto reply = it->second.front();
            if (it->second.size() > 1) {
                it->second.pop_front();
            }
            return reply;
        }

        void serve() {
            namespace http = boost::beast::http;
            while (!stopped_) {
                boost::system::error_code ec;
                boost::asio::ip::tcp::socket socket(ioc_);
                acceptor_.accept(socket, ec);
                if (ec || stopped_) {
                    continue;
                }

                boost::beast::flat_buffer buffer;
                http::request<http::empty_body> request;
                http::read(socket, buffer, request, ec);
                if (ec) {
                    continue;
                }
                ++hits_;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    lastHeaders_.clear();
                    for (const auto& field : request) {
                        lastHeaders_.emplace(std::string(field.name_string()), std::string(field.value()));
                    }
                }

                auto reply = next(std::string(request.target()));
                http::response<http::string_body> response{static_cast<http::status>(reply.status), request.version()};
                response.set(http::field::content_type, "application/octet-stream");
                response.keep_alive(false);
                response.body() = std::move(reply.body);
                response.prepare_payload();
                http::write(socket, response, ec);
                socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            }
        }

        boost::asio::io_context ioc_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::thread thread_;
        std::atomic<bool> stopped_{false};
        std::atomic<size_t> hits_{0};
        mutable std::mutex mutex_;
        std::map<std::string, std::deque<Reply>> routes_;
        std::map<std::string, std::string> lastHeaders_;
    };

} // namespace http_client
