// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk.hpp"
#include "errors.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cstring>
#include <type_traits>

namespace chunks {

    Chunk::Chunk(uint64_t index, uint64_t rowCount, uint64_t rowOffset, std::string statementId, DownloadConfig config)
        : index_{index}
        , rowCount_{rowCount}
        , rowOffset_{rowOffset}
        , statementId_{std::move(statementId)}
        , config_{config}
        , status_{ChunkStatus::PENDING}
        , arena_{std::make_unique<decoder::ChunkArena>()}
        , log_{get_logger(logger_tag::CHUNK)} {}

    Chunk::Chunk(const ChunkInfo& info, std::string statementId, DownloadConfig config)
        : Chunk(info.index, info.rowCount, info.rowOffset, std::move(statementId), config) {
        if (info.link) {
            link_ = info.link;
            status_ = ChunkStatus::URL_FETCHED;
        }
    }

    Chunk::~Chunk() {
        batches_.clear();
        if (auto leaked = arena_->close(); leaked > 0) {
            log_->warn("Chunk index {} and statement {} destroyed with {} bytes still allocated",
                       index_,
                       statementId_,
                       leaked);
        }
    }

    std::unique_ptr<Chunk> Chunk::fromInlineData(uint64_t index,
                                                 uint64_t rowCount,
                                                 uint64_t rowOffset,
                                                 std::string statementId,
                                                 std::string_view payload,
                                                 decoder::CompressionCodec codec) {
        auto chunk = std::make_unique<Chunk>(index, rowCount, rowOffset, std::move(statementId));
        try {
            auto data = chunk->parse(payload, codec, {});
            std::lock_guard<std::mutex> lock(chunk->mutex_);
            chunk->batches_ = std::move(data.batches);
            chunk->metadata_ = std::move(data.metadata);
            chunk->schema_ = std::move(data.schema);
            chunk->dataInitialized_ = true;
            // inline data skips URL_FETCHED
            chunk->status_ = ChunkStatus::DOWNLOAD_SUCCEEDED;
        } catch (const ChunkError& e) {
            std::lock_guard<std::mutex> lock(chunk->mutex_);
            chunk->errorMessage_ =
                fmt::format("Data parsing failed for chunk index [{}] and statement [{}]. Exception [{}: {}]",
                            chunk->index_,
                            chunk->statementId_,
                            to_string(e.kind()),
                            e.what());
            chunk->log_->error(*chunk->errorMessage_);
            chunk->status_ = ChunkStatus::DOWNLOAD_FAILED;
        }
        return chunk;
    }

    void Chunk::setLink(ChunkLink link) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ != ChunkStatus::CHUNK_RELEASED) {
                link_ = std::move(link);
                setStatusLocked(ChunkStatus::URL_FETCHED);
                return;
            }
        }
        abandon("link refresh");
    }

    bool Chunk::isLinkInvalid() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!link_ || status_ == ChunkStatus::PENDING) {
            return true;
        }
        return !config_.test.fakeBackend && link_->isExpired(config_.linkExpiryBuffer);
    }

    void Chunk::download(http_client::IHttpClient& client, decoder::CompressionCodec codec, std::stop_token stop) {
        std::optional<ChunkLink> link;
        bool inject = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ == ChunkStatus::CHUNK_RELEASED) {
                abandon("download start");
            }
            link = link_;
            inject = downloadCalls_++ < config_.test.injectedFailures;
        }

        if (inject) {
            fail(TransportError("Injected connection reset"));
        }
        if (!link) {
            fail(LinkError("No download link"));
        }
        if (link->headers.empty()) {
            log_->debug("No encryption headers present for chunk index {} and statement {}", index_, statementId_);
        }

        http_client::HttpResponse response;
        try {
            response = client.execute(http_client::HttpRequest{link->url, link->headers});
        } catch (const TransportError& e) {
            fail(e);
        } catch (const std::exception& e) {
            fail(TransportError(e.what()));
        }
        if (!response.ok()) {
            fail(TransportError(fmt::format("HTTP request failed with status {} {}", response.status, response.reason),
                                response.status));
        }

        decoder::ArrowData data;
        try {
            data = parse(response.body, codec, stop);
        } catch (const DecodeError& e) {
            fail(e);
        }
        response.body.clear();
        response.body.shrink_to_fit();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ != ChunkStatus::CHUNK_RELEASED) {
                // the transition is checked before any data is committed
                setStatusLocked(ChunkStatus::DOWNLOAD_SUCCEEDED);
                batches_ = std::move(data.batches);
                metadata_ = std::move(data.metadata);
                schema_ = std::move(data.schema);
                interrupted_ = data.interrupted;
                dataInitialized_ = true;
                return;
            }
        }
        decoder::ArrowStreamDecoder::purge(data.batches);
        abandon("decode");
    }

    decoder::ArrowData Chunk::parse(std::string_view payload, decoder::CompressionCodec codec, std::stop_token stop) {
        log_->debug("Parsing data for chunk index {} and statement {}", index_, statementId_);

        auto allocated = arrow::AllocateBuffer(static_cast<int64_t>(payload.size()), arena_.get());
        if (!allocated.ok()) {
            throw DecodeError(allocated.status().ToString());
        }
        std::shared_ptr<arrow::Buffer> raw = std::move(allocated).ValueUnsafe();
        if (!payload.empty()) {
            std::memcpy(raw->mutable_data(), payload.data(), payload.size());
        }

        auto context = fmt::format("Data decompression for chunk index [{}] and statement [{}]", index_, statementId_);
        auto decompressed = decoder::decompress(std::move(raw), codec, arena_.get(), context);
        if (!decompressed.ok()) {
            throw DecodeError(decompressed.status().ToString());
        }

        auto stream = std::make_shared<arrow::io::BufferReader>(std::move(decompressed).ValueUnsafe());
        auto decoded = decoder::ArrowStreamDecoder::decode(stream, arena_.get(), {statementId_, index_}, stop);
        if (!decoded.ok()) {
            throw DecodeError(decoded.status().ToString());
        }

        log_->debug("Data parsed for chunk index {} and statement {}", index_, statementId_);
        return std::move(decoded).ValueUnsafe();
    }

    template<typename Error>
    void Chunk::fail(const Error& cause) {
        std::string message;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ == ChunkStatus::CHUNK_RELEASED) {
                log_->debug("Chunk index {} and statement {} released before failing with: {}",
                            index_,
                            statementId_,
                            cause.what());
                abandon("download");
            }
            errorMessage_ = fmt::format("Data parsing failed for chunk index [{}] and statement [{}]. Exception [{}: {}]",
                                        index_,
                                        statementId_,
                                        to_string(cause.kind()),
                                        cause.what());
            message = *errorMessage_;
            setStatusLocked(ChunkStatus::DOWNLOAD_FAILED);
        }
        log_->error(message);
        if constexpr (std::is_same_v<Error, TransportError>) {
            throw TransportError(message, cause.http_status());
        } else {
            throw Error(message);
        }
    }

    void Chunk::setStatus(ChunkStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        setStatusLocked(status);
    }

    void Chunk::setStatusLocked(ChunkStatus status) {
        if (status_ == status) {
            return;
        }
        checkTransition(status_, status);
        log_->trace("Chunk index {} and statement {}: {} -> {}",
                    index_,
                    statementId_,
                    to_string(status_),
                    to_string(status));
        status_ = status;
    }

    void Chunk::markFailed(std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        errorMessage_ = std::move(message);
        if (status_ != ChunkStatus::CHUNK_RELEASED) {
            setStatusLocked(ChunkStatus::DOWNLOAD_FAILED);
        }
    }

    bool Chunk::scheduleRetry() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ChunkStatus::CHUNK_RELEASED) {
            return false;
        }
        // DOWNLOAD_RETRY is only reachable from DOWNLOAD_FAILED
        setStatusLocked(ChunkStatus::DOWNLOAD_FAILED);
        setStatusLocked(ChunkStatus::DOWNLOAD_RETRY);
        return true;
    }

    void Chunk::abandon(std::string_view step) const {
        throw DownloadInterruptedError(
            fmt::format("Chunk index {} of statement {} was released during {}", index_, statementId_, step));
    }

    bool Chunk::release() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == ChunkStatus::CHUNK_RELEASED) {
            return false;
        }
        if (dataInitialized_) {
            logArenaStats("BeforeRelease");
        }
        decoder::ArrowStreamDecoder::purge(batches_);
        schema_.reset();
        auto leaked = arena_->close();
        if (dataInitialized_) {
            logArenaStats("AfterRelease");
        }
        if (leaked > 0) {
            // batches still referenced by a consumer, the memory goes back when they are dropped
            log_->warn("Chunk index {} and statement {} released with {} bytes still referenced",
                       index_,
                       statementId_,
                       leaked);
        }
        setStatusLocked(ChunkStatus::CHUNK_RELEASED);
        return true;
    }

    void Chunk::logArenaStats(std::string_view event) const {
        auto stats = arena_->stats();
        log_->debug("Chunk allocator stats - Event: {}, Chunk Index: {}, Allocated Memory: {}, Peak Memory: {}, "
                    "Allocations: {}, Frees: {}",
                    event,
                    index_,
                    stats.allocated,
                    stats.peak,
                    stats.allocations,
                    stats.frees);
    }

    ChunkStatus Chunk::status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    std::string Chunk::chunkUrl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return link_ ? link_->url : std::string{};
    }

    std::optional<ChunkLink> Chunk::link() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return link_;
    }

    std::optional<std::string> Chunk::errorMessage() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errorMessage_;
    }

    size_t Chunk::recordBatchCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dataInitialized_ ? batches_.size() : 0;
    }

    std::shared_ptr<arrow::RecordBatch> Chunk::recordBatch(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= batches_.size()) {
            return nullptr;
        }
        return batches_[index];
    }

    decoder::ColumnMetadata Chunk::columnMetadata() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_;
    }

    std::shared_ptr<arrow::Schema> Chunk::schema() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return schema_;
    }

    bool Chunk::interrupted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupted_;
    }

} // namespace chunks
