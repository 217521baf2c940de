// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_status.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>

namespace chunks {

    namespace {
        using S = ChunkStatus;

        constexpr std::array<S, 3> FROM_PENDING = {S::URL_FETCHED, S::DOWNLOAD_FAILED, S::CHUNK_RELEASED};
        constexpr std::array<S, 4> FROM_URL_FETCHED = {S::DOWNLOAD_SUCCEEDED,
                                                       S::DOWNLOAD_FAILED,
                                                       S::CANCELLED,
                                                       S::CHUNK_RELEASED};
        constexpr std::array<S, 3> FROM_DOWNLOAD_SUCCEEDED = {S::PROCESSING_SUCCEEDED,
                                                              S::PROCESSING_FAILED,
                                                              S::CHUNK_RELEASED};
        constexpr std::array<S, 1> FROM_PROCESSING_SUCCEEDED = {S::CHUNK_RELEASED};
        constexpr std::array<S, 2> FROM_DOWNLOAD_FAILED = {S::DOWNLOAD_RETRY, S::CHUNK_RELEASED};
        constexpr std::array<S, 1> FROM_PROCESSING_FAILED = {S::CHUNK_RELEASED};
        constexpr std::array<S, 1> FROM_CANCELLED = {S::CHUNK_RELEASED};
        constexpr std::array<S, 4> FROM_DOWNLOAD_RETRY = {S::URL_FETCHED,
                                                          S::DOWNLOAD_SUCCEEDED,
                                                          S::DOWNLOAD_FAILED,
                                                          S::CHUNK_RELEASED};
    } // namespace

    std::string_view to_string(ChunkStatus status) noexcept {
        switch (status) {
            case ChunkStatus::PENDING:
                return "PENDING";
            case ChunkStatus::URL_FETCHED:
                return "URL_FETCHED";
            case ChunkStatus::DOWNLOAD_IN_PROGRESS:
                return "DOWNLOAD_IN_PROGRESS";
            case ChunkStatus::DOWNLOAD_SUCCEEDED:
                return "DOWNLOAD_SUCCEEDED";
            case ChunkStatus::PROCESSING_SUCCEEDED:
                return "PROCESSING_SUCCEEDED";
            case ChunkStatus::DOWNLOAD_FAILED:
                return "DOWNLOAD_FAILED";
            case ChunkStatus::PROCESSING_FAILED:
                return "PROCESSING_FAILED";
            case ChunkStatus::DOWNLOAD_RETRY:
                return "DOWNLOAD_RETRY";
            case ChunkStatus::CANCELLED:
                return "CANCELLED";
            case ChunkStatus::CHUNK_RELEASED:
                return "CHUNK_RELEASED";
        }
        return "UNKNOWN";
    }

    std::span<const ChunkStatus> validTransitionsFrom(ChunkStatus from) noexcept {
        switch (from) {
            case ChunkStatus::PENDING:
                return FROM_PENDING;
            case ChunkStatus::URL_FETCHED:
                return FROM_URL_FETCHED;
            case ChunkStatus::DOWNLOAD_SUCCEEDED:
                return FROM_DOWNLOAD_SUCCEEDED;
            case ChunkStatus::PROCESSING_SUCCEEDED:
                return FROM_PROCESSING_SUCCEEDED;
            case ChunkStatus::DOWNLOAD_FAILED:
                return FROM_DOWNLOAD_FAILED;
            case ChunkStatus::PROCESSING_FAILED:
                return FROM_PROCESSING_FAILED;
            case ChunkStatus::CANCELLED:
                return FROM_CANCELLED;
            case ChunkStatus::DOWNLOAD_RETRY:
                return FROM_DOWNLOAD_RETRY;
            case ChunkStatus::DOWNLOAD_IN_PROGRESS:
            case ChunkStatus::CHUNK_RELEASED:
                return {};
        }
        return {};
    }

    bool canTransitionTo(ChunkStatus from, ChunkStatus to) noexcept {
        auto targets = validTransitionsFrom(from);
        return std::find(targets.begin(), targets.end(), to) != targets.end();
    }

    void checkTransition(ChunkStatus from, ChunkStatus to) {
        if (!canTransitionTo(from, to)) {
            throw IllegalTransitionError("Illegal chunk status transition " + std::string(to_string(from)) +
                                         " -> " + std::string(to_string(to)));
        }
    }

} // namespace chunks
