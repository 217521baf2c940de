// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "telemetry_sink.hpp"

namespace telemetry {

    LoggingTelemetrySink::LoggingTelemetrySink()
        : log_{get_logger(logger_tag::TELEMETRY)} {}

    void LoggingTelemetrySink::recordDownloadLatency(const std::string& statementId,
                                                     uint64_t chunkIndex,
                                                     int64_t elapsedMs,
                                                     int attempts,
                                                     bool success) {
        log_->info("chunk_download statement={} chunk={} elapsed_ms={} attempts={} success={}",
                   statementId,
                   chunkIndex,
                   elapsedMs,
                   attempts,
                   success);
    }

    void LoggingTelemetrySink::recordChunkIteration(const std::string& statementId,
                                                    uint64_t chunkIndex,
                                                    uint64_t rowsRead) {
        log_->info("chunk_iteration statement={} chunk={} rows_read={}", statementId, chunkIndex, rowsRead);
    }

} // namespace telemetry
