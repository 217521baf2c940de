// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <arrow/buffer.h>
#include <arrow/memory_pool.h>
#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace decoder {

    // Compression applied by the server to the whole chunk payload (not Arrow IPC body compression).
    enum class CompressionCodec : uint8_t
    {
        NONE,
        LZ4_FRAME,
        GZIP,
        ZSTD
    };

    std::string_view to_string(CompressionCodec codec) noexcept;

    // Accepts the manifest names ("NONE", "LZ4_FRAME", ...) and the short CLI forms ("lz4", "gzip").
    arrow::Result<CompressionCodec> parseCompressionCodec(std::string_view name);

    arrow::Compression::type toArrowCompression(CompressionCodec codec) noexcept;

    // Decompresses the whole payload into a buffer allocated from `pool`.
    // NONE hands the input back untouched. Errors carry `context` for correlation.
    arrow::Result<std::shared_ptr<arrow::Buffer>> decompress(std::shared_ptr<arrow::Buffer> payload,
                                                             CompressionCodec codec,
                                                             arrow::MemoryPool* pool,
                                                             std::string_view context);

} // namespace decoder
