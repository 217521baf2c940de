// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "chunk_link.hpp"

#include <boost/json.hpp>

#include <charconv>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace json = boost::json;

namespace {
    json::string_view to_json(std::string_view key) { return json::string_view(key.data(), key.size()); }

    std::string as_string(const json::object& obj, std::string_view key) {
        const auto* value = obj.if_contains(to_json(key));
        if (value == nullptr || !value->is_string()) {
            throw std::invalid_argument("External link: missing string key: " + std::string(key));
        }
        return std::string(value->as_string().c_str());
    }

    uint64_t as_uint(const json::object& obj, std::string_view key, std::optional<uint64_t> fallback = std::nullopt) {
        const auto* value = obj.if_contains(to_json(key));
        if (value == nullptr) {
            if (fallback) {
                return *fallback;
            }
            throw std::invalid_argument("External link: missing numeric key: " + std::string(key));
        }
        if (value->is_int64() && value->as_int64() >= 0) {
            return static_cast<uint64_t>(value->as_int64());
        }
        if (value->is_uint64()) {
            return value->as_uint64();
        }
        if (value->is_string()) {
            // REST responses send 64-bit counters as strings, digits only
            const auto& text = value->as_string();
            const char* end = text.data() + text.size();
            uint64_t parsed = 0;
            auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
            if (text.empty() || ec != std::errc() || ptr != end) {
                throw std::invalid_argument("External link: key is not a non-negative integer: " + std::string(key) +
                                            " = \"" + std::string(text.c_str()) + "\"");
            }
            return parsed;
        }
        throw std::invalid_argument("External link: key is not a non-negative integer: " + std::string(key));
    }

    chunks::ChunkInfo parse_link(const json::value& value) {
        if (!value.is_object()) {
            throw std::invalid_argument("External link: entry is not an object");
        }
        const auto& obj = value.as_object();

        chunks::ChunkInfo info;
        info.index = as_uint(obj, "chunk_index");
        info.rowCount = as_uint(obj, "row_count", 0);
        info.rowOffset = as_uint(obj, "row_offset", 0);

        chunks::ChunkLink link;
        link.url = as_string(obj, "external_link");
        link.chunkIndex = info.index;
        if (obj.contains("expiration")) {
            link.expiry = chunks::parseExpiration(as_string(obj, "expiration"));
        } else {
            // thrift result links carry epoch milliseconds
            link.expiry = chunks::link_clock::time_point(std::chrono::milliseconds(as_uint(obj, "expiry_time")));
        }
        if (const auto* headers = obj.if_contains("http_headers"); headers != nullptr && !headers->is_null()) {
            if (!headers->is_object()) {
                throw std::invalid_argument("External link: http_headers is not an object");
            }
            for (const auto& [key, header_value] : headers->as_object()) {
                if (!header_value.is_string()) {
                    throw std::invalid_argument("External link: header is not a string: " + std::string(key));
                }
                link.headers.emplace(std::string(key), std::string(header_value.as_string().c_str()));
            }
        }
        info.link = std::move(link);
        return info;
    }
} // namespace

namespace chunks {

    link_clock::time_point parseExpiration(std::string_view text) {
        static const std::regex pattern(R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?Z?$)");

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_match(text.begin(), text.end(), match, pattern)) {
            throw std::invalid_argument("Malformed expiration timestamp: " + std::string(text));
        }

        using namespace std::chrono;
        auto ymd = year{std::stoi(match[1].str())} / month{static_cast<unsigned>(std::stoi(match[2].str()))} /
                   day{static_cast<unsigned>(std::stoi(match[3].str()))};
        if (!ymd.ok()) {
            throw std::invalid_argument("Invalid expiration date: " + std::string(text));
        }

        auto tp = sys_days{ymd} + hours{std::stoi(match[4].str())} + minutes{std::stoi(match[5].str())} +
                  seconds{std::stoi(match[6].str())};

        nanoseconds fraction{0};
        if (match[7].matched) {
            auto digits = match[7].str();
            digits.resize(9, '0');
            fraction = nanoseconds{std::stoll(digits)};
        }
        return time_point_cast<link_clock::duration>(tp + fraction);
    }

    std::string formatExpiration(link_clock::time_point tp) {
        using namespace std::chrono;
        auto dp = floor<days>(tp);
        year_month_day ymd{dp};
        hh_mm_ss hms{floor<milliseconds>(tp - dp)};
        char buffer[32];
        std::snprintf(buffer,
                      sizeof(buffer),
                      "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()),
                      static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()),
                      static_cast<int>(hms.subseconds().count()));
        return buffer;
    }

    std::vector<ChunkInfo> parseExternalLinks(std::string_view text) {
        json::value doc;
        try {
            doc = json::parse(json::string_view(text.data(), text.size()));
        } catch (const std::exception& e) {
            throw std::invalid_argument(std::string("External links: invalid JSON: ") + e.what());
        }

        const json::array* links = nullptr;
        if (doc.is_array()) {
            links = &doc.as_array();
        } else if (doc.is_object()) {
            const auto* nested = doc.as_object().if_contains("external_links");
            if (nested == nullptr || !nested->is_array()) {
                throw std::invalid_argument("External links: missing external_links array");
            }
            links = &nested->as_array();
        } else {
            throw std::invalid_argument("External links: document is neither an array nor an object");
        }

        std::vector<ChunkInfo> result;
        result.reserve(links->size());
        for (const auto& entry : *links) {
            result.push_back(parse_link(entry));
        }
        return result;
    }

} // namespace chunks
