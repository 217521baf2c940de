// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "compression.hpp"

#include <arrow/io/compressed.h>
#include <arrow/io/memory.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace decoder {

    namespace {
        constexpr int64_t READ_BLOCK_SIZE = 1 << 16;

        std::string to_upper(std::string_view name) {
            std::string result(name);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return result;
        }

        arrow::Result<std::shared_ptr<arrow::Buffer>> decompress_impl(std::shared_ptr<arrow::Buffer> payload,
                                                                      CompressionCodec codec,
                                                                      arrow::MemoryPool* pool) {
            ARROW_ASSIGN_OR_RAISE(auto arrow_codec, arrow::util::Codec::Create(toArrowCompression(codec)));
            auto raw = std::make_shared<arrow::io::BufferReader>(std::move(payload));
            ARROW_ASSIGN_OR_RAISE(auto stream, arrow::io::CompressedInputStream::Make(arrow_codec.get(), raw, pool));
            ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create(READ_BLOCK_SIZE, pool));

            while (true) {
                ARROW_ASSIGN_OR_RAISE(auto block, stream->Read(READ_BLOCK_SIZE));
                if (block->size() == 0) {
                    break;
                }
                ARROW_RETURN_NOT_OK(sink->Write(block));
            }
            ARROW_RETURN_NOT_OK(stream->Close());
            return sink->Finish();
        }
    } // namespace

    std::string_view to_string(CompressionCodec codec) noexcept {
        switch (codec) {
            case CompressionCodec::NONE:
                return "NONE";
            case CompressionCodec::LZ4_FRAME:
                return "LZ4_FRAME";
            case CompressionCodec::GZIP:
                return "GZIP";
            case CompressionCodec::ZSTD:
                return "ZSTD";
        }
        return "UNKNOWN";
    }

    arrow::Result<CompressionCodec> parseCompressionCodec(std::string_view name) {
        auto upper = to_upper(name);
        if (upper.empty() || upper == "NONE") {
            return CompressionCodec::NONE;
        }
        if (upper == "LZ4_FRAME" || upper == "LZ4") {
            return CompressionCodec::LZ4_FRAME;
        }
        if (upper == "GZIP") {
            return CompressionCodec::GZIP;
        }
        if (upper == "ZSTD") {
            return CompressionCodec::ZSTD;
        }
        return arrow::Status::Invalid("Unknown compression codec: ", std::string(name));
    }

    arrow::Compression::type toArrowCompression(CompressionCodec codec) noexcept {
        switch (codec) {
            case CompressionCodec::NONE:
                return arrow::Compression::UNCOMPRESSED;
            case CompressionCodec::LZ4_FRAME:
                return arrow::Compression::LZ4_FRAME;
            case CompressionCodec::GZIP:
                return arrow::Compression::GZIP;
            case CompressionCodec::ZSTD:
                return arrow::Compression::ZSTD;
        }
        return arrow::Compression::UNCOMPRESSED;
    }

    arrow::Result<std::shared_ptr<arrow::Buffer>> decompress(std::shared_ptr<arrow::Buffer> payload,
                                                             CompressionCodec codec,
                                                             arrow::MemoryPool* pool,
                                                             std::string_view context) {
        if (codec == CompressionCodec::NONE) {
            return payload;
        }
        auto result = decompress_impl(std::move(payload), codec, pool);
        if (!result.ok()) {
            return result.status().WithMessage(std::string(context), ": ", to_string(codec),
                                               " decompression failed: ", result.status().message());
        }
        return result;
    }

} // namespace decoder
