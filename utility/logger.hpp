// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view CHUNK = "Chunk";
    inline constexpr std::string_view CHUNK_DOWNLOAD_TASK = "ChunkDownloadTask";
    inline constexpr std::string_view ARROW_STREAM_DECODER = "ArrowStreamDecoder";
    inline constexpr std::string_view CHUNK_PROVIDER = "ChunkProvider";
    inline constexpr std::string_view CHUNK_LINK_SERVICE = "ChunkLinkService";
    inline constexpr std::string_view HTTP_CLIENT = "HttpClient";
    inline constexpr std::string_view TELEMETRY = "Telemetry";
} // namespace logger_tag

inline constexpr std::string_view LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v";

// we need a named logger per component, not the default one
inline log_t initialize_logger(std::string name, std::string prefix = "") {
    static std::mutex init_mutex;
    std::lock_guard<std::mutex> lock(init_mutex);

    if (auto log_ptr = spdlog::get(name); log_ptr) {
        // prevent creating two loggers with same name
        return log_ptr;
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!prefix.empty()) {
        std::filesystem::create_directories(prefix);
        if (prefix.back() != '/') {
            prefix += '/';
        }

        using namespace std::chrono;
        auto dtn = system_clock::now().time_since_epoch();
        auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true));
    }

    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());
    logger->set_pattern(std::string(LOG_PATTERN));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

// Library code logs through this; an uninitialized tag gets a stdout-only logger.
inline log_t get_logger(std::string_view tag) {
    if (auto log_ptr = spdlog::get(std::string(tag)); log_ptr) {
        return log_ptr;
    }
    return initialize_logger(std::string(tag));
}

inline void initialize_all_loggers(const std::string& prefix, spdlog::level::level_enum level = spdlog::level::info) {
    static constexpr std::array<std::string_view, 7> all_loggers = {
        logger_tag::CHUNK,
        logger_tag::CHUNK_DOWNLOAD_TASK,
        logger_tag::ARROW_STREAM_DECODER,
        logger_tag::CHUNK_PROVIDER,
        logger_tag::CHUNK_LINK_SERVICE,
        logger_tag::HTTP_CLIENT,
        logger_tag::TELEMETRY,
    };

    spdlog::flush_every(std::chrono::seconds(1));
    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix)->set_level(level);
    }
}
