// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_arena.hpp"

namespace decoder {

    ChunkArena::ChunkArena(arrow::MemoryPool* parent)
        : parent_{parent} {}

    arrow::Status ChunkArena::Allocate(int64_t size, int64_t alignment, uint8_t** out) {
        if (closed_.load()) {
            return arrow::Status::OutOfMemory("Chunk arena is closed, refusing to allocate ", size, " bytes");
        }
        ARROW_RETURN_NOT_OK(parent_->Allocate(size, alignment, out));

        auto now_allocated = allocated_.fetch_add(size) + size;
        auto peak = peak_.load();
        while (now_allocated > peak && !peak_.compare_exchange_weak(peak, now_allocated)) {
        }
        total_allocated_.fetch_add(size);
        allocations_.fetch_add(1);
        return arrow::Status::OK();
    }

    arrow::Status ChunkArena::Reallocate(int64_t old_size, int64_t new_size, int64_t alignment, uint8_t** ptr) {
        if (closed_.load()) {
            return arrow::Status::OutOfMemory("Chunk arena is closed, refusing to grow to ", new_size, " bytes");
        }
        ARROW_RETURN_NOT_OK(parent_->Reallocate(old_size, new_size, alignment, ptr));

        auto now_allocated = allocated_.fetch_add(new_size - old_size) + new_size - old_size;
        auto peak = peak_.load();
        while (now_allocated > peak && !peak_.compare_exchange_weak(peak, now_allocated)) {
        }
        if (new_size > old_size) {
            total_allocated_.fetch_add(new_size - old_size);
        }
        return arrow::Status::OK();
    }

    void ChunkArena::Free(uint8_t* buffer, int64_t size, int64_t alignment) {
        parent_->Free(buffer, size, alignment);
        allocated_.fetch_sub(size);
        frees_.fetch_add(1);
    }

    int64_t ChunkArena::bytes_allocated() const { return allocated_.load(); }

    int64_t ChunkArena::max_memory() const { return peak_.load(); }

    int64_t ChunkArena::total_bytes_allocated() const { return total_allocated_.load(); }

    int64_t ChunkArena::num_allocations() const { return allocations_.load(); }

    std::string ChunkArena::backend_name() const { return "chunk_arena(" + parent_->backend_name() + ")"; }

    int64_t ChunkArena::close() {
        closed_.store(true);
        return allocated_.load();
    }

    bool ChunkArena::closed() const noexcept { return closed_.load(); }

    ArenaStats ChunkArena::stats() const noexcept {
        return ArenaStats{
            .allocated = allocated_.load(),
            .peak = peak_.load(),
            .total_allocated = total_allocated_.load(),
            .allocations = allocations_.load(),
            .frees = frees_.load(),
        };
    }

} // namespace decoder
