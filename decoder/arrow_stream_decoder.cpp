// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "arrow_stream_decoder.hpp"

#include "utility/logger.hpp"

#include <arrow/ipc/options.h>
#include <arrow/ipc/reader.h>
#include <arrow/util/key_value_metadata.h>

namespace decoder {

    namespace {
        arrow::Status read_batches(arrow::ipc::RecordBatchStreamReader& reader,
                                   ArrowData& data,
                                   const std::stop_token& stop) {
            bool fetched_metadata = false;
            while (!stop.stop_requested()) {
                std::shared_ptr<arrow::RecordBatch> scratch;
                ARROW_RETURN_NOT_OK(reader.ReadNext(&scratch));
                if (scratch == nullptr) {
                    // end of stream
                    return arrow::Status::OK();
                }
                if (!fetched_metadata) {
                    data.metadata = ArrowStreamDecoder::columnMetadata(*scratch->schema());
                    fetched_metadata = true;
                }
                // moved out, the reader keeps no reference to the batch
                data.batches.push_back(std::move(scratch));
            }
            data.interrupted = true;
            return arrow::Status::OK();
        }
    } // namespace

    arrow::Result<ArrowData> ArrowStreamDecoder::decode(std::shared_ptr<arrow::io::InputStream> stream,
                                                        arrow::MemoryPool* arena,
                                                        const DecodeContext& context,
                                                        std::stop_token stop) {
        auto log = get_logger(logger_tag::ARROW_STREAM_DECODER);

        auto options = arrow::ipc::IpcReadOptions::Defaults();
        options.memory_pool = arena;

        ArrowData data;
        auto reader_result = arrow::ipc::RecordBatchStreamReader::Open(std::move(stream), options);
        if (!reader_result.ok()) {
            log->error("Failed to open arrow stream for chunk index {} and statement {}: {}",
                       context.chunkIndex,
                       context.statementId,
                       reader_result.status().ToString());
            return reader_result.status();
        }
        auto reader = std::move(reader_result).ValueUnsafe();
        data.schema = reader->schema();

        auto status = read_batches(*reader, data, stop);
        if (!status.ok()) {
            log->error("Error while reading arrow data for chunk index {} and statement {}, purging {} batches: {}",
                       context.chunkIndex,
                       context.statementId,
                       data.batches.size(),
                       status.ToString());
            purge(data.batches);
            return status;
        }

        if (data.interrupted) {
            log->error("Data parsing interrupted for chunk index {} and statement {}, purging {} batches",
                       context.chunkIndex,
                       context.statementId,
                       data.batches.size());
            purge(data.batches);
            data.metadata.clear();
            return data;
        }

        log->debug("Parsed {} record batches for chunk index {} and statement {}",
                   data.batches.size(),
                   context.chunkIndex,
                   context.statementId);
        return data;
    }

    ColumnMetadata ArrowStreamDecoder::columnMetadata(const arrow::Schema& schema) {
        ColumnMetadata metadata;
        metadata.reserve(schema.num_fields());
        for (const auto& field : schema.fields()) {
            const auto& kv = field->metadata();
            if (kv == nullptr) {
                metadata.emplace_back(std::nullopt);
                continue;
            }
            auto index = kv->FindKey(ARROW_METADATA_KEY);
            if (index < 0) {
                metadata.emplace_back(std::nullopt);
            } else {
                metadata.emplace_back(kv->value(index));
            }
        }
        return metadata;
    }

    void ArrowStreamDecoder::purge(RecordBatchList& batches) noexcept { batches.clear(); }

} // namespace decoder
