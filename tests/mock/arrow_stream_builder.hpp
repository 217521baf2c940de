// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace test_data {

    // id: int64 "BIGINT", name: utf8 "STRING", price: decimal(10, 2) without metadata
    std::shared_ptr<arrow::Schema> schema();

    // Rows carry ids startId, startId + 1, ... and names "row-<id>".
    std::shared_ptr<arrow::RecordBatch> batch(int64_t rows, int64_t startId = 0);

    // Arrow IPC stream bytes of the given batches.
    std::string stream(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches);

    // One batch per entry, ids continue across batches.
    std::string streamWithRowCounts(const std::vector<int64_t>& rowCounts);

    // Whole-payload compression the way the server applies it.
    std::string compress(const std::string& payload, arrow::Compression::type codec);

} // namespace test_data
