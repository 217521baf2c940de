// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "converters/arrow_value_converter.hpp"

#include <arrow/record_batch.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace chunks {

    class Chunk;

    /// Forward-only cursor over the rows of one decoded chunk.
    ///
    /// Rows are addressed as (batch, row in batch); nothing is materialized. Batches without
    /// rows are skipped. The cursor stops after the chunk's declared row count or after the
    /// last batch with rows, whichever comes first. The chunk must outlive the iterator.
    class ChunkRowIterator {
    public:
        explicit ChunkRowIterator(const Chunk& chunk);

        bool hasNext() const;

        // Moves to the next row. Returns false once exhausted, on every later call too.
        bool next();

        // Value of a column at the current row. Throws std::out_of_range before the first next().
        converters::Value columnValue(int columnIndex,
                                      converters::ColumnType requestedType,
                                      const std::optional<std::string>& typeMetadata,
                                      const converters::IValueConverter& converter = converters::defaultConverter()) const;

        // Same, with the column's own SQL type metadata.
        converters::Value columnValue(int columnIndex, converters::ColumnType requestedType) const;

        std::optional<std::string> columnTypeHint(int columnIndex) const;

        uint64_t rowsRead() const noexcept { return rowsRead_; }
        int64_t currentBatchIndex() const noexcept { return batchCursor_; }
        int64_t currentRowInBatch() const noexcept { return rowCursor_; }

    private:
        // first batch at or after `from` holding rows, batchCount_ if none
        int64_t nextNonEmptyBatch(int64_t from) const;

        const Chunk* chunk_;
        int64_t batchCount_;
        int64_t batchCursor_ = -1;
        int64_t rowsInBatch_ = -1;
        int64_t rowCursor_ = -1;
        uint64_t rowsRead_ = 0;
        std::shared_ptr<arrow::RecordBatch> current_;
    };

} // namespace chunks
