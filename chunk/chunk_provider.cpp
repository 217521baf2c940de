// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_provider.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace chunks {

    ChunkProvider::ChunkProvider(std::string statementId,
                                 const std::vector<ChunkInfo>& chunks,
                                 http_client::IHttpClient& client,
                                 ILinkResolver& resolver,
                                 telemetry::ITelemetrySink& telemetry,
                                 ChunkProviderConfig config)
        : statementId_{std::move(statementId)}
        , config_{std::move(config)}
        , client_{client}
        , resolver_{resolver}
        , telemetry_{telemetry}
        , pool_{config_.poolSize}
        , log_{get_logger(logger_tag::CHUNK_PROVIDER)} {
        for (const auto& info : chunks) {
            log_->debug("Manifest chunk information - Index: {}, Row Offset: {}, Row Count: {}, Link: {}",
                        info.index,
                        info.rowOffset,
                        info.rowCount,
                        info.link ? formatExpiration(info.link->expiry) : std::string("none"));
            auto [it, inserted] =
                chunks_.emplace(info.index, std::make_unique<Chunk>(info, statementId_, config_.download));
            if (!inserted) {
                throw std::invalid_argument("Duplicate chunk index " + std::to_string(info.index));
            }
            processed_.emplace(info.index, create_cv_wrapper<bool>());
            rowCount_ += info.rowCount;
        }
        chunkCount_ = chunks_.size();
        if (!chunks_.empty() && chunks_.rbegin()->first != chunkCount_ - 1) {
            throw std::invalid_argument("Chunk indices of statement " + statementId_ + " are not contiguous");
        }

        allowedChunksInMemory_ = static_cast<size_t>(std::min<uint64_t>(pool_.size(), chunkCount_));
        pool_.start();
        downloadNextChunks();
    }

    ChunkProvider::~ChunkProvider() { close(); }

    bool ChunkProvider::hasNextChunk() const noexcept {
        return currentChunkIndex_ + 1 < static_cast<int64_t>(chunkCount_);
    }

    bool ChunkProvider::next() {
        if (currentChunkIndex_ >= 0) {
            releaseCurrentChunk();
        }
        if (!hasNextChunk()) {
            return false;
        }
        ++currentChunkIndex_;
        return true;
    }

    Chunk& ChunkProvider::getChunk() {
        if (currentChunkIndex_ < 0) {
            throw std::logic_error("getChunk() called before next()");
        }
        auto index = static_cast<uint64_t>(currentChunkIndex_);
        auto& chunk = *chunks_.at(index);

        auto status = processed_.at(index)->wait(stop_.get_token());
        // a task cut short by close() may still signal, closed wins
        if (status == cv_wrapper::Status::Interrupted || stop_.stop_requested()) {
            throw DownloadInterruptedError("Result of statement " + statementId_ + " was closed while waiting for chunk " +
                                           std::to_string(index));
        }
        if (chunk.status() != ChunkStatus::DOWNLOAD_SUCCEEDED) {
            throw ChunkError(ErrorKind::ExhaustedRetries,
                             chunk.errorMessage().value_or("Chunk index " + std::to_string(index) + " is " +
                                                           std::string(to_string(chunk.status()))));
        }
        return chunk;
    }

    void ChunkProvider::downloadProcessed(uint64_t chunkIndex) {
        if (auto it = processed_.find(chunkIndex); it != processed_.end()) {
            it->second->release(true);
        }
    }

    void ChunkProvider::releaseCurrentChunk() {
        auto& chunk = *chunks_.at(static_cast<uint64_t>(currentChunkIndex_));
        if (chunk.status() == ChunkStatus::DOWNLOAD_SUCCEEDED) {
            try {
                telemetry_.recordChunkIteration(statementId_, chunk.chunkIndex(), chunk.rowCount());
            } catch (const std::exception& e) {
                log_->warn("Telemetry for chunk index {} dropped: {}", chunk.chunkIndex(), e.what());
            }
        }
        if (chunk.release()) {
            --chunksInMemory_;
            downloadNextChunks();
        }
    }

    void ChunkProvider::downloadNextChunks() {
        while (!closed_.load() && nextChunkToDownload_ < chunkCount_ &&
               chunksInMemory_.load() < allowedChunksInMemory_) {
            auto index = nextChunkToDownload_++;
            auto& chunk = *chunks_.at(index);
            if (chunk.status() == ChunkStatus::DOWNLOAD_SUCCEEDED) {
                processed_.at(index)->release(true);
                continue;
            }

            auto task = std::make_shared<ChunkDownloadTask>(chunk,
                                                            client_,
                                                            resolver_,
                                                            *this,
                                                            telemetry_,
                                                            DownloadContext{config_.connectionId, statementId_, index},
                                                            config_.download);
            ++chunksInMemory_;
            pool_.post([this, task, stop = stop_.get_token()]() {
                try {
                    task->run(stop);
                } catch (const std::exception& e) {
                    // the chunk status and error message carry the outcome
                    log_->error("Download task for chunk index {} of statement {} ended: {}",
                                task->context().chunkIndex,
                                statementId_,
                                e.what());
                }
            });
        }
    }

    void ChunkProvider::close() {
        if (closed_.exchange(true)) {
            return;
        }
        log_->debug("Closing result of statement {}", statementId_);
        stop_.request_stop();
        resolver_.shutdown();
        pool_.stop();
        for (auto& [index, chunk] : chunks_) {
            chunk->release();
        }
        chunksInMemory_ = 0;
    }

} // namespace chunks
