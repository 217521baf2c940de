// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk/chunk_link_service.hpp"

#include "mock/mock_link_resolver.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>

using namespace chunks;
using namespace std::chrono_literals;

namespace {
    // Returns `batch` links starting at the requested index, up to `total` chunks.
    LinkFetcher batched_fetcher(std::atomic<int>& calls, uint64_t batch, uint64_t total) {
        return [&calls, batch, total](uint64_t start) {
            ++calls;
            std::vector<ChunkLink> links;
            for (auto i = start; i < std::min(start + batch, total); ++i) {
                auto link = make_test_link("http://h/" + std::to_string(i));
                link.chunkIndex = i;
                links.push_back(std::move(link));
            }
            return links;
        };
    }
} // namespace

TEST_CASE("chunk_link_service: one fetch serves a batch") {
    std::atomic<int> calls{0};
    ChunkLinkService service("stmt-links", batched_fetcher(calls, 3, 10));

    auto first = service.resolveLink(0);
    REQUIRE(first->wait_for(2000ms) == cv_wrapper::Status::Ok);
    REQUIRE(first->result()->url == "http://h/0");

    // 1 and 2 came with the first batch
    auto second = service.resolveLink(1);
    auto third = service.resolveLink(2);
    REQUIRE(second->ready());
    REQUIRE(third->ready());
    REQUIRE(third->result()->url == "http://h/2");
    REQUIRE(calls.load() == 1);

    auto fourth = service.resolveLink(3);
    REQUIRE(fourth->wait_for(2000ms) == cv_wrapper::Status::Ok);
    REQUIRE(fourth->result()->url == "http://h/3");
    REQUIRE(calls.load() == 2);
}

TEST_CASE("chunk_link_service: links without index follow the start") {
    ChunkLinkService service("stmt-links", [](uint64_t start) {
        return std::vector<ChunkLink>{make_test_link("http://h/" + std::to_string(start)),
                                      make_test_link("http://h/" + std::to_string(start + 1))};
    });

    auto link = service.resolveLink(5);
    REQUIRE(link->wait_for(2000ms) == cv_wrapper::Status::Ok);
    REQUIRE(link->result()->url == "http://h/5");

    auto next = service.resolveLink(6);
    REQUIRE(next->ready());
    REQUIRE(next->result()->url == "http://h/6");
}

TEST_CASE("chunk_link_service: fetch errors reach the waiters") {
    ChunkLinkService service("stmt-links", [](uint64_t) -> std::vector<ChunkLink> {
        throw std::runtime_error("statement expired");
    });

    auto link = service.resolveLink(0);
    REQUIRE(link->wait_for(2000ms) == cv_wrapper::Status::Error);
    REQUIRE_THAT(link->error_message(), Catch::Contains("statement expired"));
    REQUIRE(service.pendingRequests() == 0);
}

TEST_CASE("chunk_link_service: batch missing the requested chunk") {
    ChunkLinkService service("stmt-links", [](uint64_t) { return std::vector<ChunkLink>{}; });

    auto link = service.resolveLink(2);
    REQUIRE(link->wait_for(2000ms) == cv_wrapper::Status::Error);
    REQUIRE_THAT(link->error_message(), Catch::Contains("No link returned for chunk index 2"));
}

TEST_CASE("chunk_link_service: shutdown fails waiters and later requests") {
    std::atomic<bool> entered{false};
    cv_wrapper::cv_wrapper_t<bool> gate;
    ChunkLinkService service("stmt-links", [&](uint64_t) {
        entered = true;
        gate.wait_for(2000ms);
        return std::vector<ChunkLink>{};
    });

    auto link = service.resolveLink(0);
    gate.release(true);
    service.shutdown();

    REQUIRE(link->wait_for(2000ms) == cv_wrapper::Status::Error);
    auto late = service.resolveLink(1);
    REQUIRE(late->ready());
    REQUIRE(late->status() == cv_wrapper::Status::Error);
}
