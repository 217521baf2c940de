// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "chunk.hpp"
#include "download_config.hpp"
#include "link_resolver.hpp"

#include "connectors/http_client/http_client.hpp"
#include "decoder/compression.hpp"
#include "telemetry/telemetry_sink.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <stop_token>

namespace chunks {

    class IDownloadCallback {
    public:
        virtual ~IDownloadCallback() = default;

        // Called once per task, whatever the outcome.
        virtual void downloadProcessed(uint64_t chunkIndex) = 0;

        virtual decoder::CompressionCodec compressionCodec() const = 0;
    };

    /// Drives one chunk from "link known or needed" to "data decoded".
    ///
    /// Resolves the link when it is missing or about to expire, downloads, and retries
    /// link, transport and decode failures up to DownloadConfig::maxRetries attempts with
    /// a fixed delay. run() returns on success. It throws DownloadExhaustedError once the
    /// retries are used up and DownloadInterruptedError when stop is requested while waiting.
    /// In every case the chunk is left DOWNLOAD_SUCCEEDED or DOWNLOAD_FAILED, telemetry gets
    /// the elapsed time and the callback is told exactly once.
    class ChunkDownloadTask {
    public:
        ChunkDownloadTask(Chunk& chunk,
                          http_client::IHttpClient& client,
                          ILinkResolver& resolver,
                          IDownloadCallback& callback,
                          telemetry::ITelemetrySink& telemetry,
                          DownloadContext context,
                          DownloadConfig config = {});

        void run(std::stop_token stop = {});

        int attempts() const noexcept { return attempts_; }

        const DownloadContext& context() const noexcept { return context_; }

    private:
        void downloadWithRetries(std::stop_token stop);

        void refreshLink(std::stop_token stop);

        // false when stop was requested during the delay
        bool backoff(std::stop_token stop) const;

        [[noreturn]] void interrupted();

        void finish(int64_t elapsedMs, bool success) noexcept;

        Chunk& chunk_;
        http_client::IHttpClient& client_;
        ILinkResolver& resolver_;
        IDownloadCallback& callback_;
        telemetry::ITelemetrySink& telemetry_;
        const DownloadContext context_;
        const DownloadConfig config_;
        int attempts_ = 0;
        log_t log_;
    };

} // namespace chunks
