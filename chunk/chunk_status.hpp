// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace chunks {

    /// Lifecycle of a result chunk from link assignment to memory release.
    ///
    /// PENDING               placeholder, no download URL yet
    /// URL_FETCHED           URL known, ready for download
    /// DOWNLOAD_IN_PROGRESS  reserved, no edges lead in or out
    /// DOWNLOAD_SUCCEEDED    bytes downloaded and decoded into record batches
    /// PROCESSING_SUCCEEDED  decoded data handed over for consumption
    /// DOWNLOAD_FAILED       last attempt failed, may be retried
    /// PROCESSING_FAILED     decoded data could not be processed
    /// CANCELLED             download cancelled before it started
    /// CHUNK_RELEASED        memory returned, terminal
    /// DOWNLOAD_RETRY        failed download scheduled for another attempt
    ///
    /// Chunks built from inline data start in DOWNLOAD_SUCCEEDED or DOWNLOAD_FAILED.
    enum class ChunkStatus : uint8_t
    {
        PENDING,
        URL_FETCHED,
        DOWNLOAD_IN_PROGRESS,
        DOWNLOAD_SUCCEEDED,
        PROCESSING_SUCCEEDED,
        DOWNLOAD_FAILED,
        PROCESSING_FAILED,
        DOWNLOAD_RETRY,
        CANCELLED,
        CHUNK_RELEASED
    };

    // CHUNK_RELEASED stays the last enumerator
    inline constexpr std::size_t CHUNK_STATUS_COUNT = static_cast<std::size_t>(ChunkStatus::CHUNK_RELEASED) + 1;

    inline constexpr std::array<ChunkStatus, CHUNK_STATUS_COUNT> ALL_CHUNK_STATUSES = {
        ChunkStatus::PENDING,
        ChunkStatus::URL_FETCHED,
        ChunkStatus::DOWNLOAD_IN_PROGRESS,
        ChunkStatus::DOWNLOAD_SUCCEEDED,
        ChunkStatus::PROCESSING_SUCCEEDED,
        ChunkStatus::DOWNLOAD_FAILED,
        ChunkStatus::PROCESSING_FAILED,
        ChunkStatus::DOWNLOAD_RETRY,
        ChunkStatus::CANCELLED,
        ChunkStatus::CHUNK_RELEASED,
    };

    static_assert(ALL_CHUNK_STATUSES.back() == ChunkStatus::CHUNK_RELEASED, "ALL_CHUNK_STATUSES misses a status");

    std::string_view to_string(ChunkStatus status) noexcept;

    std::span<const ChunkStatus> validTransitionsFrom(ChunkStatus from) noexcept;

    bool canTransitionTo(ChunkStatus from, ChunkStatus to) noexcept;

    // Throws IllegalTransitionError if `to` is not reachable from `from` in one step.
    void checkTransition(ChunkStatus from, ChunkStatus to);

} // namespace chunks
