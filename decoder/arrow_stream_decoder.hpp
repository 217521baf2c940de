// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/memory_pool.h>
#include <arrow/record_batch.h>
#include <arrow/result.h>
#include <arrow/type.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace decoder {

    // Field metadata key holding the SQL type name of a result column.
    inline constexpr const char* ARROW_METADATA_KEY = "Spark:DataType:SqlName";

    using RecordBatchList = std::vector<std::shared_ptr<arrow::RecordBatch>>;
    using ColumnMetadata = std::vector<std::optional<std::string>>;

    struct ArrowData {
        RecordBatchList batches;
        ColumnMetadata metadata;
        std::shared_ptr<arrow::Schema> schema;
        // reading stopped on cancellation, batches were purged
        bool interrupted = false;
    };

    // Identifies the chunk being decoded in log lines.
    struct DecodeContext {
        std::string statementId;
        uint64_t chunkIndex = 0;
    };

    /// Reads an Arrow IPC stream into record batches.
    ///
    /// Every buffer behind the returned batches comes from `arena`; the decoder never frees
    /// or closes the arena. Schema metadata is captured once, from the first batch.
    /// A stop request observed between batches purges what was read and yields an empty,
    /// `interrupted` result instead of an error. Any other failure purges and returns the status.
    class ArrowStreamDecoder {
    public:
        static arrow::Result<ArrowData> decode(std::shared_ptr<arrow::io::InputStream> stream,
                                               arrow::MemoryPool* arena,
                                               const DecodeContext& context,
                                               std::stop_token stop = {});

        static ColumnMetadata columnMetadata(const arrow::Schema& schema);

        // Drops every batch; buffers go back to their arena once nothing else references them.
        static void purge(RecordBatchList& batches) noexcept;
    };

} // namespace decoder
