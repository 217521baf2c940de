// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <arrow/memory_pool.h>
#include <arrow/status.h>

#include <atomic>
#include <cstdint>
#include <string>

namespace decoder {

    struct ArenaStats {
        int64_t allocated = 0;
        int64_t peak = 0;
        int64_t total_allocated = 0;
        int64_t allocations = 0;
        int64_t frees = 0;
    };

    /// Memory pool owning every buffer of one result chunk.
    ///
    /// Allocations are delegated to the parent pool and accounted here, so the chunk can
    /// tell how much it holds and whether all of it came back on release. After close()
    /// the arena refuses new allocations; buffers still alive are reported as leaked.
    /// The arena must outlive every buffer allocated from it.
    class ChunkArena final : public arrow::MemoryPool {
    public:
        explicit ChunkArena(arrow::MemoryPool* parent = arrow::default_memory_pool());
        ~ChunkArena() override = default;

        using arrow::MemoryPool::Allocate;
        using arrow::MemoryPool::Free;
        using arrow::MemoryPool::Reallocate;

        arrow::Status Allocate(int64_t size, int64_t alignment, uint8_t** out) override;
        arrow::Status Reallocate(int64_t old_size, int64_t new_size, int64_t alignment, uint8_t** ptr) override;
        void Free(uint8_t* buffer, int64_t size, int64_t alignment) override;

        int64_t bytes_allocated() const override;
        int64_t max_memory() const override;
        int64_t total_bytes_allocated() const override;
        int64_t num_allocations() const override;
        std::string backend_name() const override;

        // Returns bytes still allocated at the time of closing. Idempotent.
        int64_t close();
        bool closed() const noexcept;

        ArenaStats stats() const noexcept;

    private:
        arrow::MemoryPool* parent_;
        std::atomic<int64_t> allocated_{0};
        std::atomic<int64_t> peak_{0};
        std::atomic<int64_t> total_allocated_{0};
        std::atomic<int64_t> allocations_{0};
        std::atomic<int64_t> frees_{0};
        std::atomic<bool> closed_{false};
    };

} // namespace decoder
