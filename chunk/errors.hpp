// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunks {

    enum class ErrorKind : uint8_t
    {
        Link,
        Transport,
        Decode,
        Interrupted,
        ExhaustedRetries
    };

    constexpr std::string_view to_string(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Link:
                return "LINK_ERROR";
            case ErrorKind::Transport:
                return "TRANSPORT_ERROR";
            case ErrorKind::Decode:
                return "DECODE_ERROR";
            case ErrorKind::Interrupted:
                return "THREAD_INTERRUPTED_ERROR";
            case ErrorKind::ExhaustedRetries:
                return "CHUNK_DOWNLOAD_ERROR";
        }
        return "UNKNOWN_ERROR";
    }

    class ChunkError : public std::runtime_error {
    public:
        ChunkError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message)
            , kind_{kind} {}

        ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // Errors the download task retries.
    class RecoverableError : public ChunkError {
    public:
        using ChunkError::ChunkError;
    };

    class LinkError : public RecoverableError {
    public:
        explicit LinkError(const std::string& message)
            : RecoverableError(ErrorKind::Link, message) {}
    };

    class TransportError : public RecoverableError {
    public:
        explicit TransportError(const std::string& message, std::optional<unsigned> http_status = std::nullopt)
            : RecoverableError(ErrorKind::Transport, message)
            , http_status_{http_status} {}

        std::optional<unsigned> http_status() const noexcept { return http_status_; }

    private:
        std::optional<unsigned> http_status_;
    };

    class DecodeError : public RecoverableError {
    public:
        explicit DecodeError(const std::string& message)
            : RecoverableError(ErrorKind::Decode, message) {}
    };

    class DownloadInterruptedError : public ChunkError {
    public:
        explicit DownloadInterruptedError(const std::string& message)
            : ChunkError(ErrorKind::Interrupted, message) {}
    };

    class DownloadExhaustedError : public ChunkError {
    public:
        DownloadExhaustedError(const std::string& message, int attempts, std::string cause)
            : ChunkError(ErrorKind::ExhaustedRetries, message + ": " + cause)
            , attempts_{attempts}
            , cause_{std::move(cause)} {}

        int attempts() const noexcept { return attempts_; }
        const std::string& cause() const noexcept { return cause_; }

    private:
        int attempts_;
        std::string cause_;
    };

    // Requested status change is not an edge of the chunk lifecycle graph.
    class IllegalTransitionError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace chunks
