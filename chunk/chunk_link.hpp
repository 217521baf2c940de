// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunks {

    using link_clock = std::chrono::system_clock;

    /// Presigned download location of one chunk.
    struct ChunkLink {
        std::string url;
        std::map<std::string, std::string> headers;
        link_clock::time_point expiry{};
        // set when the link came from a batched link response
        std::optional<uint64_t> chunkIndex;

        // Expired once expiry minus the safety buffer is not in the future.
        bool isExpired(std::chrono::seconds buffer, link_clock::time_point now = link_clock::now()) const noexcept {
            return expiry - buffer <= now;
        }
    };

    /// Server metadata for one chunk of a statement result.
    struct ChunkInfo {
        uint64_t index = 0;
        uint64_t rowCount = 0;
        uint64_t rowOffset = 0;
        std::optional<ChunkLink> link;
    };

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z]" in UTC. Throws std::invalid_argument.
    link_clock::time_point parseExpiration(std::string_view text);

    std::string formatExpiration(link_clock::time_point tp);

    // Reads an `external_links` manifest, either the bare array or an object holding it.
    // Throws std::invalid_argument on malformed documents.
    std::vector<ChunkInfo> parseExternalLinks(std::string_view json);

} // namespace chunks
