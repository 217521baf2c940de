// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_link_service.hpp"

namespace chunks {

    ChunkLinkService::ChunkLinkService(std::string statementId, LinkFetcher fetcher)
        : statementId_{std::move(statementId)}
        , fetcher_{std::move(fetcher)}
        , log_{get_logger(logger_tag::CHUNK_LINK_SERVICE)} {
        worker_.start();
    }

    ChunkLinkService::~ChunkLinkService() { shutdown(); }

    shared_data<ChunkLink> ChunkLinkService::resolveLink(uint64_t chunkIndex) {
        auto result = create_cv_wrapper<ChunkLink>();
        bool schedule = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                result->release_on_error("Link service for statement " + statementId_ + " is shut down");
                return result;
            }
            if (auto it = prefetched_.find(chunkIndex); it != prefetched_.end()) {
                result->release(std::move(it->second));
                prefetched_.erase(it);
                return result;
            }
            if (auto it = pending_.find(chunkIndex); it != pending_.end()) {
                return it->second;
            }
            pending_.emplace(chunkIndex, result);
            if (!fetching_) {
                fetching_ = true;
                schedule = true;
            }
        }

        if (schedule && !worker_.addTask([this]() { fetchPending(); })) {
            std::lock_guard<std::mutex> lock(mutex_);
            fetching_ = false;
            failAll("Link request queue is full");
        }
        return result;
    }

    void ChunkLinkService::fetchPending() {
        while (true) {
            uint64_t start = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || pending_.empty()) {
                    fetching_ = false;
                    return;
                }
                start = pending_.begin()->first;
            }

            log_->debug("Fetching links from chunk index {} for statement {}", start, statementId_);
            std::vector<ChunkLink> links;
            try {
                links = fetcher_(start);
            } catch (const std::exception& e) {
                log_->error("Link fetch from chunk index {} for statement {} failed: {}", start, statementId_, e.what());
                std::lock_guard<std::mutex> lock(mutex_);
                failAll(std::string("Link fetch failed: ") + e.what());
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (!fulfil(start, links)) {
                if (auto it = pending_.find(start); it != pending_.end()) {
                    it->second->release_on_error("No link returned for chunk index " + std::to_string(start));
                    pending_.erase(it);
                }
            }
        }
    }

    bool ChunkLinkService::fulfil(uint64_t start, std::vector<ChunkLink>& links) {
        bool covered = false;
        auto next = start;
        for (auto& link : links) {
            auto index = link.chunkIndex.value_or(next);
            next = index + 1;
            covered = covered || index == start;
            if (auto it = pending_.find(index); it != pending_.end()) {
                it->second->release(std::move(link));
                pending_.erase(it);
            } else {
                prefetched_.insert_or_assign(index, std::move(link));
            }
        }
        return covered;
    }

    void ChunkLinkService::failAll(const std::string& message) {
        for (auto& [index, waiter] : pending_) {
            waiter->release_on_error(message);
        }
        pending_.clear();
    }

    void ChunkLinkService::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        worker_.stop();

        std::lock_guard<std::mutex> lock(mutex_);
        failAll("Link service for statement " + statementId_ + " is shut down");
        prefetched_.clear();
        fetching_ = false;
    }

    size_t ChunkLinkService::pendingRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

} // namespace chunks
