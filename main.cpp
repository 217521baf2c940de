// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "chunk/chunk_link_service.hpp"
#include "chunk/chunk_provider.hpp"
#include "chunk/errors.hpp"
#include "connectors/http_client/http_client.hpp"
#include "converters/arrow_value_converter.hpp"
#include "telemetry/telemetry_sink.hpp"
#include "utility/logger.hpp"

namespace po = boost::program_options;

namespace {
    std::string read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open manifest " + path);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Links are refreshed by reading the manifest again; whoever writes it keeps it current.
    chunks::LinkFetcher manifest_fetcher(std::string path) {
        return [path = std::move(path)](uint64_t start) {
            std::vector<chunks::ChunkLink> links;
            for (auto& info : chunks::parseExternalLinks(read_file(path))) {
                if (info.index >= start && info.link) {
                    info.link->chunkIndex = info.index;
                    links.push_back(std::move(*info.link));
                }
            }
            return links;
        };
    }
} // namespace

int main(int argc, char* argv[]) {
    // Default values
    std::string manifest_path;
    std::string statement_id = "local";
    std::string codec_name = "none";
    size_t threads = 4;
    std::string log_dir;
    uint64_t max_rows = 0;

    // Define command-line options
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message")
    ("manifest",
    po::value<std::string>(&manifest_path)->required(),
    "JSON file with the external_links of a statement result")
    ("statement-id",
    po::value<std::string>(&statement_id)->default_value(statement_id),
    "Statement id used in log lines")
    ("codec",
    po::value<std::string>(&codec_name)->default_value(codec_name),
    "Chunk compression: none, lz4, gzip or zstd")
    ("threads",
    po::value<size_t>(&threads)->default_value(threads),
    "Download threads, also the number of chunks kept in memory")
    ("log-dir",
    po::value<std::string>(&log_dir),
    "Directory for log files, stdout only when omitted")
    ("max-rows",
    po::value<uint64_t>(&max_rows)->default_value(max_rows),
    "Stop after this many rows, 0 prints everything")
    ("insecure", "Skip TLS peer verification");

    // Parse arguments
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    auto codec = decoder::parseCompressionCodec(codec_name);
    if (!codec.ok()) {
        std::cerr << codec.status().ToString() << "\n";
        return 1;
    }

    // Logging
    initialize_all_loggers(log_dir);
    auto log = get_logger(logger_tag::CHUNK_PROVIDER);

    std::vector<chunks::ChunkInfo> manifest;
    try {
        manifest = chunks::parseExternalLinks(read_file(manifest_path));
    } catch (const std::exception& e) {
        std::cerr << "Invalid manifest: " << e.what() << "\n";
        return 1;
    }

    http_client::BeastHttpClient client(http_client::HttpClientConfig{.verifyPeer = vm.count("insecure") == 0});
    chunks::ChunkLinkService links(statement_id, manifest_fetcher(manifest_path));
    telemetry::LoggingTelemetrySink telemetry;

    chunks::ChunkProviderConfig config{
        .poolSize = threads,
        .codec = *codec,
        .connectionId = "chunkstax_fetch",
    };

    uint64_t printed = 0;
    try {
        chunks::ChunkProvider provider(statement_id, manifest, client, links, telemetry, config);
        log->info("Fetching {} rows in {} chunks of statement {}", provider.rowCount(), provider.chunkCount(), statement_id);

        while ((max_rows == 0 || printed < max_rows) && provider.next()) {
            auto& chunk = provider.getChunk();
            auto schema = chunk.schema();
            auto columns = schema ? schema->num_fields() : 0;

            auto it = chunk.iterator();
            while ((max_rows == 0 || printed < max_rows) && it.next()) {
                for (int c = 0; c < columns; ++c) {
                    if (c > 0) {
                        std::cout << '\t';
                    }
                    std::cout << converters::toString(it.columnValue(c, converters::ColumnType::STRING));
                }
                std::cout << '\n';
                ++printed;
            }
        }
        provider.close();
    } catch (const std::exception& e) {
        log->error("Fetching statement {} failed: {}", statement_id, e.what());
        std::cerr << e.what() << "\n";
        return 2;
    }

    log->info("Printed {} rows of statement {}", printed, statement_id);
    return 0;
}
