// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "link_resolver.hpp"

#include "utility/logger.hpp"
#include "utility/worker.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chunks {

    // Protocol call returning links for a run of chunks starting at `startIndex`.
    using LinkFetcher = std::function<std::vector<ChunkLink>(uint64_t startIndex)>;

    /// Batching link resolver.
    ///
    /// Requests are queued; one background worker asks the fetcher for the lowest pending index
    /// and fulfils every pending request the returned batch covers. Links of chunks nobody
    /// asked for yet are kept and handed out on the next request. Links without a chunk index
    /// are taken to follow `startIndex` in order.
    class ChunkLinkService final : public ILinkResolver {
    public:
        ChunkLinkService(std::string statementId, LinkFetcher fetcher);
        ~ChunkLinkService() override;

        shared_data<ChunkLink> resolveLink(uint64_t chunkIndex) override;

        void shutdown() override;

        size_t pendingRequests() const;

    private:
        void fetchPending();

        // returns false when the batch did not cover `start`
        bool fulfil(uint64_t start, std::vector<ChunkLink>& links);

        void failAll(const std::string& message);

        const std::string statementId_;
        LinkFetcher fetcher_;

        mutable std::mutex mutex_;
        std::map<uint64_t, shared_data<ChunkLink>> pending_;
        std::map<uint64_t, ChunkLink> prefetched_;
        bool fetching_ = false;
        bool closed_ = false;

        TaskManager<std::function<void()>> worker_;
        log_t log_;
    };

} // namespace chunks
