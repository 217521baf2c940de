// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "chunk_link.hpp"
#include "chunk_row_iterator.hpp"
#include "chunk_status.hpp"
#include "download_config.hpp"

#include "connectors/http_client/http_client.hpp"
#include "decoder/arrow_stream_decoder.hpp"
#include "decoder/chunk_arena.hpp"
#include "decoder/compression.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace chunks {

    /// One partition of a statement result and the Arrow data decoded from it.
    ///
    /// Status only moves along the ChunkStatus graph. Decoded batches live in the chunk's own
    /// arena and stay until release(), the only path that gives the arena's memory back.
    /// Batches handed out by recordBatch() must not outlive the chunk.
    class Chunk {
    public:
        // PENDING placeholder without a link.
        Chunk(uint64_t index, uint64_t rowCount, uint64_t rowOffset, std::string statementId, DownloadConfig config = {});

        // URL_FETCHED when the metadata already carries a link, PENDING otherwise.
        Chunk(const ChunkInfo& info, std::string statementId, DownloadConfig config = {});

        Chunk(const Chunk&) = delete;
        Chunk& operator=(const Chunk&) = delete;

        ~Chunk();

        // Chunk of a result the server returned inline. Ends up DOWNLOAD_SUCCEEDED, or
        // DOWNLOAD_FAILED with the error message recorded; never throws on bad payloads.
        static std::unique_ptr<Chunk> fromInlineData(uint64_t index,
                                                     uint64_t rowCount,
                                                     uint64_t rowOffset,
                                                     std::string statementId,
                                                     std::string_view payload,
                                                     decoder::CompressionCodec codec = decoder::CompressionCodec::NONE);

        // Throws DownloadInterruptedError once the chunk is released.
        void setLink(ChunkLink link);

        bool isLinkInvalid() const;

        // Fetches, decompresses and decodes the chunk. On failure the chunk is DOWNLOAD_FAILED,
        // errorMessage() is set and LinkError, TransportError or DecodeError is thrown.
        // A chunk released while downloading keeps no data and throws DownloadInterruptedError.
        void download(http_client::IHttpClient& client, decoder::CompressionCodec codec, std::stop_token stop = {});

        // No-op when already in `status`. Throws IllegalTransitionError otherwise if not an edge.
        void setStatus(ChunkStatus status);

        // Records `message` and moves to DOWNLOAD_FAILED unless the chunk is there already
        // or was released.
        void markFailed(std::string message);

        // DOWNLOAD_FAILED then DOWNLOAD_RETRY as one step. False if the chunk was released.
        bool scheduleRetry();

        // False if the chunk was released before. Safe to call from several threads.
        bool release();

        ChunkRowIterator iterator() const { return ChunkRowIterator(*this); }

        uint64_t chunkIndex() const noexcept { return index_; }
        uint64_t rowCount() const noexcept { return rowCount_; }
        uint64_t rowOffset() const noexcept { return rowOffset_; }
        const std::string& statementId() const noexcept { return statementId_; }

        ChunkStatus status() const;
        std::string chunkUrl() const;
        std::optional<ChunkLink> link() const;
        std::optional<std::string> errorMessage() const;

        // 0 until data was decoded and after release
        size_t recordBatchCount() const;
        std::shared_ptr<arrow::RecordBatch> recordBatch(size_t index) const;
        decoder::ColumnMetadata columnMetadata() const;
        std::shared_ptr<arrow::Schema> schema() const;

        // last decode stopped on cancellation and kept no batches
        bool interrupted() const;

        const decoder::ChunkArena& arena() const noexcept { return *arena_; }

    private:
        decoder::ArrowData parse(std::string_view payload, decoder::CompressionCodec codec, std::stop_token stop);

        template<typename Error>
        [[noreturn]] void fail(const Error& cause);

        [[noreturn]] void abandon(std::string_view step) const;

        void logArenaStats(std::string_view event) const;

        void setStatusLocked(ChunkStatus status);

        const uint64_t index_;
        const uint64_t rowCount_;
        const uint64_t rowOffset_;
        const std::string statementId_;
        const DownloadConfig config_;

        mutable std::mutex mutex_;
        ChunkStatus status_;
        std::optional<ChunkLink> link_;
        std::optional<std::string> errorMessage_;
        int downloadCalls_ = 0;
        bool dataInitialized_ = false;
        bool interrupted_ = false;

        // declared before the batches so every buffer is gone before the arena
        std::unique_ptr<decoder::ChunkArena> arena_;
        decoder::RecordBatchList batches_;
        decoder::ColumnMetadata metadata_;
        std::shared_ptr<arrow::Schema> schema_;

        log_t log_;
    };

} // namespace chunks
