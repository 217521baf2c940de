// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk/chunk_provider.hpp"
#include "chunk/errors.hpp"

#include "mock/arrow_stream_builder.hpp"
#include "mock/mock_http_client.hpp"
#include "mock/mock_link_resolver.hpp"
#include "mock/mock_telemetry.hpp"

#include "utility/timer.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <thread>

using namespace chunks;
using namespace std::chrono_literals;

namespace {
    std::string url(uint64_t index) { return "http://storage.local/stmt/chunk-" + std::to_string(index); }

    std::vector<ChunkInfo> manifest(uint64_t count, uint64_t rowsPerChunk, bool withLinks = true) {
        std::vector<ChunkInfo> infos;
        for (uint64_t i = 0; i < count; ++i) {
            ChunkInfo info{.index = i, .rowCount = rowsPerChunk, .rowOffset = i * rowsPerChunk};
            if (withLinks) {
                info.link = make_test_link(url(i));
            }
            infos.push_back(std::move(info));
        }
        return infos;
    }

    ChunkProviderConfig provider_config(size_t poolSize) {
        ChunkProviderConfig config;
        config.poolSize = poolSize;
        config.download.retryDelay = 10ms;
        config.download.linkWaitTimeout = 2000ms;
        config.connectionId = "conn-provider";
        return config;
    }

    // Records the highest number of requests served at the same time.
    class ConcurrencyHttpClient : public http_client::IHttpClient {
    public:
        explicit ConcurrencyHttpClient(http_client::IHttpClient& inner)
            : inner_(inner) {}

        http_client::HttpResponse execute(const http_client::HttpRequest& request) override {
            auto now = ++inFlight_;
            auto peak = peak_.load();
            while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
            }
            std::this_thread::sleep_for(20ms);
            auto response = inner_.execute(request);
            --inFlight_;
            return response;
        }

        int peak() const noexcept { return peak_.load(); }

    private:
        http_client::IHttpClient& inner_;
        std::atomic<int> inFlight_{0};
        std::atomic<int> peak_{0};
    };
} // namespace

TEST_CASE("chunk_provider: iterates every chunk in order") {
    http_client::MockHttpClient client;
    for (uint64_t i = 0; i < 6; ++i) {
        client.addBody(url(i), test_data::stream({test_data::batch(10, static_cast<int64_t>(i) * 10)}));
    }
    MockLinkResolver resolver;
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-provider", manifest(6, 10), client, resolver, telemetry, provider_config(2));
    REQUIRE(provider.chunkCount() == 6);
    REQUIRE(provider.rowCount() == 60);
    REQUIRE(provider.allowedChunksInMemory() == 2);

    std::vector<uint64_t> seen;
    while (provider.next()) {
        REQUIRE(provider.chunksInMemory() <= provider.allowedChunksInMemory());
        auto& chunk = provider.getChunk();
        REQUIRE(chunk.status() == ChunkStatus::DOWNLOAD_SUCCEEDED);
        REQUIRE(chunk.recordBatch(0)->num_rows() == 10);
        seen.push_back(chunk.chunkIndex());
    }
    REQUIRE(seen == std::vector<uint64_t>{0, 1, 2, 3, 4, 5});
    REQUIRE_FALSE(provider.hasNextChunk());
    REQUIRE(client.calls() == 6);
    REQUIRE(telemetry.iterated() == seen);
    REQUIRE(telemetry.downloads().size() == 6);

    provider.close();
    REQUIRE(provider.closed());
    REQUIRE(provider.chunksInMemory() == 0);
}

TEST_CASE("chunk_provider: downloads stay within the memory window") {
    http_client::MockHttpClient inner;
    for (uint64_t i = 0; i < 8; ++i) {
        inner.addBody(url(i), test_data::streamWithRowCounts({5}));
    }
    ConcurrencyHttpClient client(inner);
    MockLinkResolver resolver;
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-window", manifest(8, 5), client, resolver, telemetry, provider_config(3));
    REQUIRE(provider.allowedChunksInMemory() == 3);

    size_t consumed = 0;
    while (provider.next()) {
        provider.getChunk();
        REQUIRE(provider.chunksInMemory() <= 3);
        ++consumed;
    }
    REQUIRE(consumed == 8);
    REQUIRE(client.peak() <= 3);
}

TEST_CASE("chunk_provider: window is capped by the chunk count") {
    http_client::MockHttpClient client;
    client.addBody(url(0), test_data::streamWithRowCounts({1}));
    MockLinkResolver resolver;
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-single", manifest(1, 1), client, resolver, telemetry, provider_config(8));
    REQUIRE(provider.allowedChunksInMemory() == 1);
    REQUIRE(provider.next());
    REQUIRE(provider.getChunk().recordBatchCount() == 1);
    REQUIRE_FALSE(provider.next());
}

TEST_CASE("chunk_provider: empty result") {
    http_client::MockHttpClient client;
    MockLinkResolver resolver;
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-empty", {}, client, resolver, telemetry, provider_config(4));
    REQUIRE(provider.chunkCount() == 0);
    REQUIRE(provider.allowedChunksInMemory() == 0);
    REQUIRE_FALSE(provider.hasNextChunk());
    REQUIRE_FALSE(provider.next());
    REQUIRE_THROWS_AS(provider.getChunk(), std::logic_error);
}

TEST_CASE("chunk_provider: missing links are resolved") {
    http_client::MockHttpClient client;
    MockLinkResolver resolver;
    for (uint64_t i = 0; i < 3; ++i) {
        client.addBody(url(i), test_data::streamWithRowCounts({4}));
        resolver.addLink(i, make_test_link(url(i)));
    }
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-links", manifest(3, 4, false), client, resolver, telemetry, provider_config(2));
    size_t rows = 0;
    while (provider.next()) {
        rows += provider.getChunk().recordBatch(0)->num_rows();
    }
    REQUIRE(rows == 12);
    REQUIRE(resolver.calls() == 3);
}

TEST_CASE("chunk_provider: failed chunk surfaces its error") {
    http_client::MockHttpClient client;
    client.addBody(url(0), test_data::streamWithRowCounts({2}));
    // chunk 1 is never served
    MockLinkResolver resolver;
    resolver.addLink(1, make_test_link(url(1)));
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-fail", manifest(2, 2), client, resolver, telemetry, provider_config(2));

    REQUIRE(provider.next());
    REQUIRE_NOTHROW(provider.getChunk());
    REQUIRE(provider.next());
    try {
        provider.getChunk();
        FAIL("getChunk should throw");
    } catch (const ChunkError& e) {
        REQUIRE(e.kind() == ErrorKind::ExhaustedRetries);
        REQUIRE_THAT(e.what(), Catch::StartsWith("Failed to download chunk after multiple attempts"));
    }

    auto downloads = telemetry.downloads();
    auto failed = std::count_if(downloads.begin(), downloads.end(), [](const auto& event) { return !event.success; });
    REQUIRE(failed == 1);
    // failed chunks are not reported as iterated
    REQUIRE_FALSE(provider.next());
    REQUIRE(telemetry.iterated() == std::vector<uint64_t>{0});
}

TEST_CASE("chunk_provider: close interrupts a waiting consumer") {
    http_client::MockHttpClient client;
    MockLinkResolver resolver(mock_config{.never_answer = true});
    telemetry::MockTelemetrySink telemetry;

    ChunkProvider provider("stmt-close", manifest(2, 3, false), client, resolver, telemetry, provider_config(2));
    REQUIRE(provider.next());

    auto closer = std::jthread([&provider]() {
        std::this_thread::sleep_for(200ms);
        provider.close();
    });

    Timer timer;
    REQUIRE_THROWS_AS(provider.getChunk(), DownloadInterruptedError);
    REQUIRE(timer.elapsed_ms() < 5000);
    closer.join();

    REQUIRE(provider.closed());
    REQUIRE(client.calls() == 0);
    provider.close();
}

TEST_CASE("chunk_provider: manifest validation") {
    http_client::MockHttpClient client;
    MockLinkResolver resolver;
    telemetry::MockTelemetrySink telemetry;

    auto duplicate = manifest(2, 1);
    duplicate[1].index = 0;
    REQUIRE_THROWS_AS(ChunkProvider("stmt-bad", duplicate, client, resolver, telemetry, provider_config(2)),
                      std::invalid_argument);

    auto gap = manifest(2, 1);
    gap[1].index = 5;
    REQUIRE_THROWS_AS(ChunkProvider("stmt-bad", gap, client, resolver, telemetry, provider_config(2)),
                      std::invalid_argument);
}
