// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_row_iterator.hpp"
#include "chunk.hpp"

#include <stdexcept>

namespace chunks {

    ChunkRowIterator::ChunkRowIterator(const Chunk& chunk)
        : chunk_{&chunk}
        , batchCount_{static_cast<int64_t>(chunk.recordBatchCount())} {}

    int64_t ChunkRowIterator::nextNonEmptyBatch(int64_t from) const {
        for (auto i = from; i < batchCount_; ++i) {
            auto batch = chunk_->recordBatch(static_cast<size_t>(i));
            if (batch && batch->num_rows() > 0) {
                return i;
            }
        }
        return batchCount_;
    }

    bool ChunkRowIterator::hasNext() const {
        if (rowsRead_ >= chunk_->rowCount()) {
            return false;
        }
        if (rowCursor_ < rowsInBatch_ - 1) {
            return true;
        }
        return nextNonEmptyBatch(batchCursor_ + 1) < batchCount_;
    }

    bool ChunkRowIterator::next() {
        if (!hasNext()) {
            return false;
        }
        // not started yet or crossed a batch boundary
        if (rowsInBatch_ < 0 || ++rowCursor_ == rowsInBatch_) {
            rowCursor_ = 0;
            batchCursor_ = nextNonEmptyBatch(batchCursor_ + 1);
            current_ = chunk_->recordBatch(static_cast<size_t>(batchCursor_));
            rowsInBatch_ = current_->num_rows();
        }
        ++rowsRead_;
        return true;
    }

    converters::Value ChunkRowIterator::columnValue(int columnIndex,
                                                    converters::ColumnType requestedType,
                                                    const std::optional<std::string>& typeMetadata,
                                                    const converters::IValueConverter& converter) const {
        if (!current_) {
            throw std::out_of_range("Row iterator is not positioned on a row");
        }
        if (columnIndex < 0 || columnIndex >= current_->num_columns()) {
            throw std::out_of_range("Column index " + std::to_string(columnIndex) + " out of range");
        }
        return converter.convert(*current_->column(columnIndex), rowCursor_, requestedType, typeMetadata);
    }

    converters::Value ChunkRowIterator::columnValue(int columnIndex, converters::ColumnType requestedType) const {
        return columnValue(columnIndex, requestedType, columnTypeHint(columnIndex));
    }

    std::optional<std::string> ChunkRowIterator::columnTypeHint(int columnIndex) const {
        auto metadata = chunk_->columnMetadata();
        if (columnIndex < 0 || static_cast<size_t>(columnIndex) >= metadata.size()) {
            return std::nullopt;
        }
        return metadata[static_cast<size_t>(columnIndex)];
    }

} // namespace chunks
