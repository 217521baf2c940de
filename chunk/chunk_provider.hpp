// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "chunk.hpp"
#include "chunk_download_task.hpp"
#include "link_resolver.hpp"

#include "connectors/http_client/http_client.hpp"
#include "decoder/compression.hpp"
#include "telemetry/telemetry_sink.hpp"
#include "utility/cv_wrapper.hpp"
#include "utility/logger.hpp"
#include "utility/thread_pool_manager.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace chunks {

    struct ChunkProviderConfig {
        size_t poolSize = 4;
        DownloadConfig download{};
        decoder::CompressionCodec codec = decoder::CompressionCodec::NONE;
        std::string connectionId;
    };

    /// Owns the chunks of one statement result and schedules their downloads.
    ///
    /// At most min(poolSize, chunkCount) chunks are held in memory; moving past a chunk
    /// releases it and schedules the next download. Chunk indices must run from 0 without gaps.
    /// The consumer side (next, getChunk, close) is meant for a single thread.
    class ChunkProvider final : public IDownloadCallback {
    public:
        ChunkProvider(std::string statementId,
                      const std::vector<ChunkInfo>& chunks,
                      http_client::IHttpClient& client,
                      ILinkResolver& resolver,
                      telemetry::ITelemetrySink& telemetry,
                      ChunkProviderConfig config = {});

        ~ChunkProvider() override;

        ChunkProvider(const ChunkProvider&) = delete;
        ChunkProvider& operator=(const ChunkProvider&) = delete;

        bool hasNextChunk() const noexcept;

        // Releases the current chunk and moves to the next one. False when there is none.
        bool next();

        // Blocks until the current chunk's download finished. Throws ChunkError carrying the
        // chunk's error message when it failed, std::logic_error before the first next().
        Chunk& getChunk();

        // Stops downloads, fails outstanding link requests and releases every chunk. Idempotent.
        void close();

        void downloadProcessed(uint64_t chunkIndex) override;
        decoder::CompressionCodec compressionCodec() const override { return config_.codec; }

        uint64_t chunkCount() const noexcept { return chunkCount_; }
        uint64_t rowCount() const noexcept { return rowCount_; }
        size_t chunksInMemory() const noexcept { return chunksInMemory_.load(); }
        size_t allowedChunksInMemory() const noexcept { return allowedChunksInMemory_; }
        bool closed() const noexcept { return closed_.load(); }

    private:
        void downloadNextChunks();

        void releaseCurrentChunk();

        const std::string statementId_;
        const ChunkProviderConfig config_;
        http_client::IHttpClient& client_;
        ILinkResolver& resolver_;
        telemetry::ITelemetrySink& telemetry_;

        std::map<uint64_t, std::unique_ptr<Chunk>> chunks_;
        std::map<uint64_t, shared_data<bool>> processed_;
        uint64_t chunkCount_ = 0;
        uint64_t rowCount_ = 0;

        int64_t currentChunkIndex_ = -1;
        uint64_t nextChunkToDownload_ = 0;
        std::atomic<size_t> chunksInMemory_{0};
        size_t allowedChunksInMemory_ = 0;
        std::atomic<bool> closed_{false};

        std::stop_source stop_;
        thread_pool_manager pool_;
        log_t log_;
    };

} // namespace chunks
