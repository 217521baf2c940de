// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "utility/logger.hpp"

#include <cstdint>
#include <string>

namespace telemetry {

    class ITelemetrySink {
    public:
        virtual ~ITelemetrySink() = default;

        virtual void recordDownloadLatency(const std::string& statementId,
                                           uint64_t chunkIndex,
                                           int64_t elapsedMs,
                                           int attempts,
                                           bool success) = 0;

        virtual void recordChunkIteration(const std::string& statementId, uint64_t chunkIndex, uint64_t rowsRead) = 0;
    };

    // Writes one info line per event to the Telemetry logger.
    class LoggingTelemetrySink final : public ITelemetrySink {
    public:
        LoggingTelemetrySink();

        void recordDownloadLatency(const std::string& statementId,
                                   uint64_t chunkIndex,
                                   int64_t elapsedMs,
                                   int attempts,
                                   bool success) override;

        void recordChunkIteration(const std::string& statementId, uint64_t chunkIndex, uint64_t rowsRead) override;

    private:
        log_t log_;
    };

    class NoopTelemetrySink final : public ITelemetrySink {
    public:
        void recordDownloadLatency(const std::string&, uint64_t, int64_t, int, bool) override {}
        void recordChunkIteration(const std::string&, uint64_t, uint64_t) override {}
    };

} // namespace telemetry
