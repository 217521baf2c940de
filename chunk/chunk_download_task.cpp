// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_download_task.hpp"
#include "errors.hpp"

#include "utility/cv_wrapper.hpp"
#include "utility/timer.hpp"

namespace chunks {

    namespace {
        constexpr const char* EXHAUSTED_MESSAGE = "Failed to download chunk after multiple attempts";
        constexpr const char* INTERRUPTED_MESSAGE = "Chunk download was interrupted";
    } // namespace

    ChunkDownloadTask::ChunkDownloadTask(Chunk& chunk,
                                         http_client::IHttpClient& client,
                                         ILinkResolver& resolver,
                                         IDownloadCallback& callback,
                                         telemetry::ITelemetrySink& telemetry,
                                         DownloadContext context,
                                         DownloadConfig config)
        : chunk_{chunk}
        , client_{client}
        , resolver_{resolver}
        , callback_{callback}
        , telemetry_{telemetry}
        , context_{std::move(context)}
        , config_{config}
        , log_{get_logger(logger_tag::CHUNK_DOWNLOAD_TASK)} {}

    void ChunkDownloadTask::run(std::stop_token stop) {
        Timer timer;
        try {
            downloadWithRetries(stop);
        } catch (...) {
            finish(timer.elapsed_ms(), false);
            throw;
        }
        finish(timer.elapsed_ms(), true);
    }

    void ChunkDownloadTask::downloadWithRetries(std::stop_token stop) {
        int retries = 0;
        while (true) {
            if (stop.stop_requested()) {
                interrupted();
            }
            ++attempts_;
            try {
                if (chunk_.isLinkInvalid()) {
                    refreshLink(stop);
                }
                chunk_.download(client_, callback_.compressionCodec(), stop);
                log_->debug("[{}] Downloaded chunk index {} of statement {} in {} attempt(s)",
                            context_.connectionId,
                            context_.chunkIndex,
                            context_.statementId,
                            attempts_);
                return;
            } catch (const RecoverableError& e) {
                ++retries;
                if (retries >= config_.maxRetries) {
                    log_->error("[{}] Failed to download chunk index {} of statement {} after {} attempts: {}",
                                context_.connectionId,
                                context_.chunkIndex,
                                context_.statementId,
                                attempts_,
                                e.what());
                    DownloadExhaustedError error(EXHAUSTED_MESSAGE, attempts_, e.what());
                    chunk_.markFailed(error.what());
                    throw error;
                }
                log_->warn("[{}] Retry {} of {} for chunk index {} of statement {}: {}",
                           context_.connectionId,
                           retries,
                           config_.maxRetries,
                           context_.chunkIndex,
                           context_.statementId,
                           e.what());
                if (!chunk_.scheduleRetry()) {
                    throw DownloadInterruptedError("Chunk index " + std::to_string(context_.chunkIndex) +
                                                   " was released before its retry");
                }
                if (!backoff(stop)) {
                    interrupted();
                }
            }
        }
    }

    void ChunkDownloadTask::refreshLink(std::stop_token stop) {
        log_->debug("[{}] Resolving link for chunk index {} of statement {}",
                    context_.connectionId,
                    context_.chunkIndex,
                    context_.statementId);
        auto link = resolver_.resolveLink(context_.chunkIndex);
        switch (link->wait_for(config_.linkWaitTimeout, stop)) {
            case cv_wrapper::Status::Ok:
                chunk_.setLink(*link->result());
                return;
            case cv_wrapper::Status::Interrupted:
                interrupted();
            case cv_wrapper::Status::Timeout:
                throw LinkError("Timed out after " + std::to_string(config_.linkWaitTimeout.count()) +
                                "ms waiting for the link of chunk index " + std::to_string(context_.chunkIndex));
            case cv_wrapper::Status::Error:
            case cv_wrapper::Status::Unknown:
                break;
        }
        throw LinkError("Link resolution failed for chunk index " + std::to_string(context_.chunkIndex) + ": " +
                        link->error_message());
    }

    bool ChunkDownloadTask::backoff(std::stop_token stop) const {
        // never released, only the timeout or a stop request end the wait
        cv_wrapper::cv_wrapper_t<bool> sleeper;
        return sleeper.wait_for(config_.retryDelay, stop) != cv_wrapper::Status::Interrupted;
    }

    void ChunkDownloadTask::interrupted() {
        log_->error("[{}] Download of chunk index {} of statement {} interrupted after {} attempt(s)",
                    context_.connectionId,
                    context_.chunkIndex,
                    context_.statementId,
                    attempts_);
        chunk_.markFailed(INTERRUPTED_MESSAGE);
        throw DownloadInterruptedError(INTERRUPTED_MESSAGE);
    }

    void ChunkDownloadTask::finish(int64_t elapsedMs, bool success) noexcept {
        if (!success) {
            try {
                if (auto status = chunk_.status();
                    status != ChunkStatus::DOWNLOAD_FAILED && canTransitionTo(status, ChunkStatus::DOWNLOAD_FAILED)) {
                    chunk_.setStatus(ChunkStatus::DOWNLOAD_FAILED);
                }
            } catch (const std::exception& e) {
                log_->error("[{}] Could not mark chunk index {} failed: {}",
                            context_.connectionId,
                            context_.chunkIndex,
                            e.what());
            }
        }
        try {
            telemetry_.recordDownloadLatency(context_.statementId, context_.chunkIndex, elapsedMs, attempts_, success);
        } catch (const std::exception& e) {
            log_->warn("[{}] Telemetry for chunk index {} dropped: {}", context_.connectionId, context_.chunkIndex, e.what());
        }
        try {
            callback_.downloadProcessed(context_.chunkIndex);
        } catch (const std::exception& e) {
            log_->error("[{}] Download callback for chunk index {} failed: {}",
                        context_.connectionId,
                        context_.chunkIndex,
                        e.what());
        }
    }

} // namespace chunks
