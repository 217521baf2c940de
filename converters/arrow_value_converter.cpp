// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "arrow_value_converter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>
#include <regex>
#include <type_traits>

namespace converters {

    namespace {
        template<class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template<class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        constexpr int64_t MICROS_PER_DAY = 86400LL * 1000 * 1000;

        template<typename T>
        constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

        bool starts_with(const std::string& text, std::string_view prefix) {
            return text.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), text.begin());
        }

        std::string lower(std::string_view text) {
            std::string result(text);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return result;
        }

        [[noreturn]] void unsupported(const Value& source, ColumnType target) {
            throw ConversionError(fmt::format("Cannot convert value [{}] to {}", toString(source), to_string(target)));
        }

        int64_t to_micros(int64_t value, arrow::TimeUnit::type unit) {
            switch (unit) {
                case arrow::TimeUnit::SECOND:
                    return value * 1000 * 1000;
                case arrow::TimeUnit::MILLI:
                    return value * 1000;
                case arrow::TimeUnit::MICRO:
                    return value;
                case arrow::TimeUnit::NANO:
                    return value / 1000;
            }
            return value;
        }

        std::optional<Date> parse_date(const std::string& text) {
            static const std::regex pattern(R"(^\s*(\d{4})-(\d{2})-(\d{2})\s*$)");
            std::smatch match;
            if (!std::regex_match(text, match, pattern)) {
                return std::nullopt;
            }
            using namespace std::chrono;
            year_month_day ymd{year{std::stoi(match[1].str())},
                               month{static_cast<unsigned>(std::stoi(match[2].str()))},
                               day{static_cast<unsigned>(std::stoi(match[3].str()))}};
            if (!ymd.ok()) {
                return std::nullopt;
            }
            return Date{static_cast<int32_t>(sys_days{ymd}.time_since_epoch().count())};
        }

        std::optional<Timestamp> parse_timestamp(const std::string& text) {
            static const std::regex pattern(
                R"(^\s*(\d{4}-\d{2}-\d{2})(?:[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?)?Z?\s*$)");
            std::smatch match;
            if (!std::regex_match(text, match, pattern)) {
                return std::nullopt;
            }
            auto date = parse_date(match[1].str());
            if (!date) {
                return std::nullopt;
            }
            int64_t micros = date->days * MICROS_PER_DAY;
            if (match[2].matched) {
                micros += (std::stoll(match[2].str()) * 3600 + std::stoll(match[3].str()) * 60 +
                           std::stoll(match[4].str())) *
                          1000 * 1000;
            }
            if (match[5].matched) {
                auto digits = match[5].str();
                digits.resize(6, '0');
                micros += std::stoll(digits.substr(0, 6));
            }
            return Timestamp{micros, std::nullopt};
        }

        template<typename T>
        T parse_number(const std::string& text, ColumnType target) {
            auto trimmed = text;
            trimmed.erase(0, trimmed.find_first_not_of(" \t"));
            trimmed.erase(trimmed.find_last_not_of(" \t") + 1);
            if constexpr (std::is_floating_point_v<T>) {
                try {
                    size_t consumed = 0;
                    auto value = std::stod(trimmed, &consumed);
                    if (consumed != trimmed.size()) {
                        throw ConversionError("trailing characters");
                    }
                    return static_cast<T>(value);
                } catch (const std::exception&) {
                    throw ConversionError(fmt::format("Cannot parse [{}] as {}", text, to_string(target)));
                }
            } else {
                T value{};
                auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
                if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
                    throw ConversionError(fmt::format("Cannot parse [{}] as {}", text, to_string(target)));
                }
                return value;
            }
        }

        template<typename T>
        T to_number(const Value& source, ColumnType target) {
            return std::visit(overloaded{
                                  [&](bool v) -> T { return static_cast<T>(v ? 1 : 0); },
                                  [&](const std::string& v) -> T { return parse_number<T>(v, target); },
                                  [&](const Decimal& v) -> T {
                                      if constexpr (std::is_floating_point_v<T>) {
                                          return parse_number<T>(v.text, target);
                                      } else {
                                          // integral targets truncate the fraction
                                          return parse_number<T>(v.text.substr(0, v.text.find('.')), target);
                                      }
                                  },
                                  [&](const auto& v) -> T {
                                      using V = std::decay_t<decltype(v)>;
                                      if constexpr (std::is_arithmetic_v<V>) {
                                          return static_cast<T>(v);
                                      } else {
                                          unsupported(source, target);
                                      }
                                  },
                              },
                              source);
        }

        bool to_boolean(const Value& source) {
            return std::visit(overloaded{
                                  [&](bool v) { return v; },
                                  [&](const std::string& v) {
                                      auto text = lower(v);
                                      if (text == "true" || text == "1") {
                                          return true;
                                      }
                                      if (text == "false" || text == "0") {
                                          return false;
                                      }
                                      unsupported(source, ColumnType::BOOLEAN);
                                  },
                                  [&](const auto& v) -> bool {
                                      using V = std::decay_t<decltype(v)>;
                                      if constexpr (std::is_arithmetic_v<V>) {
                                          return v != 0;
                                      } else {
                                          unsupported(source, ColumnType::BOOLEAN);
                                      }
                                  },
                              },
                              source);
        }

        Binary to_binary(const Value& source) {
            if (const auto* bytes = std::get_if<Binary>(&source)) {
                return *bytes;
            }
            if (const auto* text = std::get_if<std::string>(&source)) {
                return Binary(text->begin(), text->end());
            }
            unsupported(source, ColumnType::BINARY);
        }

        Date to_date(const Value& source) {
            if (const auto* date = std::get_if<Date>(&source)) {
                return *date;
            }
            if (const auto* ts = std::get_if<Timestamp>(&source)) {
                auto days = ts->micros / MICROS_PER_DAY;
                if (ts->micros % MICROS_PER_DAY < 0) {
                    --days;
                }
                return Date{static_cast<int32_t>(days)};
            }
            if (const auto* text = std::get_if<std::string>(&source)) {
                if (auto date = parse_date(*text)) {
                    return *date;
                }
            }
            unsupported(source, ColumnType::DATE);
        }

        Timestamp to_timestamp(const Value& source) {
            if (const auto* ts = std::get_if<Timestamp>(&source)) {
                return *ts;
            }
            if (const auto* date = std::get_if<Date>(&source)) {
                return Timestamp{date->days * MICROS_PER_DAY, std::nullopt};
            }
            if (const auto* micros = std::get_if<int64_t>(&source)) {
                return Timestamp{*micros, std::nullopt};
            }
            if (const auto* text = std::get_if<std::string>(&source)) {
                if (auto ts = parse_timestamp(*text)) {
                    return *ts;
                }
            }
            unsupported(source, ColumnType::TIMESTAMP);
        }

        int32_t srid_from_metadata(const std::optional<std::string>& metadata, ColumnType type) {
            if (!metadata) {
                return 0;
            }
            static const std::regex geometry(R"(GEOMETRY\((\d+)\))");
            static const std::regex geography(R"(GEOGRAPHY\((\d+)\))");
            std::smatch match;
            if (std::regex_search(*metadata, match, type == ColumnType::GEOMETRY ? geometry : geography)) {
                return std::stoi(match[1].str());
            }
            return 0;
        }

        GeospatialValue to_geospatial(const Value& source, ColumnType type, const std::optional<std::string>& metadata) {
            static const std::regex ewkt(R"(^\s*SRID=(\d+);(.*)$)", std::regex::icase);

            GeospatialValue value{type, toString(source), 0};
            std::smatch match;
            if (std::regex_match(value.wkt, match, ewkt)) {
                value.srid = std::stoi(match[1].str());
                value.wkt = match[2].str();
            }
            if (value.srid == 0) {
                value.srid = srid_from_metadata(metadata, type);
            }
            return value;
        }

        std::string format_date(int32_t days) {
            using namespace std::chrono;
            year_month_day ymd{sys_days{std::chrono::days{days}}};
            return fmt::format("{:04}-{:02}-{:02}",
                               static_cast<int>(ymd.year()),
                               static_cast<unsigned>(ymd.month()),
                               static_cast<unsigned>(ymd.day()));
        }

        std::string format_timestamp(const Timestamp& ts) {
            auto days = ts.micros / MICROS_PER_DAY;
            auto rest = ts.micros % MICROS_PER_DAY;
            if (rest < 0) {
                --days;
                rest += MICROS_PER_DAY;
            }
            auto seconds = rest / 1000000;
            return fmt::format("{} {:02}:{:02}:{:02}.{:06}",
                               format_date(static_cast<int32_t>(days)),
                               seconds / 3600,
                               (seconds / 60) % 60,
                               seconds % 60,
                               rest % 1000000);
        }
    } // namespace

    std::string_view to_string(ColumnType type) noexcept {
        switch (type) {
            case ColumnType::BYTE:
                return "BYTE";
            case ColumnType::SHORT:
                return "SHORT";
            case ColumnType::INT:
                return "INT";
            case ColumnType::LONG:
                return "LONG";
            case ColumnType::FLOAT:
                return "FLOAT";
            case ColumnType::DOUBLE:
                return "DOUBLE";
            case ColumnType::DECIMAL:
                return "DECIMAL";
            case ColumnType::BINARY:
                return "BINARY";
            case ColumnType::BOOLEAN:
                return "BOOLEAN";
            case ColumnType::CHAR:
                return "CHAR";
            case ColumnType::STRING:
                return "STRING";
            case ColumnType::DATE:
                return "DATE";
            case ColumnType::TIMESTAMP:
                return "TIMESTAMP";
            case ColumnType::ARRAY:
                return "ARRAY";
            case ColumnType::STRUCT:
                return "STRUCT";
            case ColumnType::MAP:
                return "MAP";
            case ColumnType::INTERVAL:
                return "INTERVAL";
            case ColumnType::GEOMETRY:
                return "GEOMETRY";
            case ColumnType::GEOGRAPHY:
                return "GEOGRAPHY";
            case ColumnType::NULL_TYPE:
                return "NULL";
        }
        return "UNKNOWN";
    }

    ColumnAccessor makeAccessor(const arrow::Array& array) {
        switch (array.type_id()) {
            case arrow::Type::NA:
                return NullAccessor{static_cast<const arrow::NullArray*>(&array)};
            case arrow::Type::BOOL:
                return BoolAccessor{static_cast<const arrow::BooleanArray*>(&array)};
            case arrow::Type::INT8:
                return Int8Accessor{static_cast<const arrow::Int8Array*>(&array)};
            case arrow::Type::INT16:
                return Int16Accessor{static_cast<const arrow::Int16Array*>(&array)};
            case arrow::Type::INT32:
                return Int32Accessor{static_cast<const arrow::Int32Array*>(&array)};
            case arrow::Type::INT64:
                return Int64Accessor{static_cast<const arrow::Int64Array*>(&array)};
            case arrow::Type::FLOAT:
                return FloatAccessor{static_cast<const arrow::FloatArray*>(&array)};
            case arrow::Type::DOUBLE:
                return DoubleAccessor{static_cast<const arrow::DoubleArray*>(&array)};
            case arrow::Type::DECIMAL128:
                return DecimalAccessor{static_cast<const arrow::Decimal128Array*>(&array)};
            case arrow::Type::STRING:
                return StringAccessor{static_cast<const arrow::StringArray*>(&array)};
            case arrow::Type::BINARY:
                return BinaryAccessor{static_cast<const arrow::BinaryArray*>(&array)};
            case arrow::Type::DATE32:
                return DateAccessor{static_cast<const arrow::Date32Array*>(&array)};
            case arrow::Type::TIMESTAMP:
                return TimestampAccessor{static_cast<const arrow::TimestampArray*>(&array)};
            default:
                throw ConversionError("No accessor for arrow type " + array.type()->ToString());
        }
    }

    Value readCell(const ColumnAccessor& accessor, int64_t row) {
        return std::visit(
            overloaded{
                [](const NullAccessor&) -> Value { return std::monostate{}; },
                [row](const DecimalAccessor& a) -> Value {
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    const auto& type = static_cast<const arrow::Decimal128Type&>(*a.array->type());
                    return Decimal{a.array->FormatValue(row), type.scale()};
                },
                [row](const StringAccessor& a) -> Value {
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    return a.array->GetString(row);
                },
                [row](const BinaryAccessor& a) -> Value {
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    auto view = a.array->GetView(row);
                    return Binary(view.begin(), view.end());
                },
                [row](const DateAccessor& a) -> Value {
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    return Date{a.array->Value(row)};
                },
                [row](const TimestampAccessor& a) -> Value {
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    const auto& type = static_cast<const arrow::TimestampType&>(*a.array->type());
                    std::optional<std::string> timezone;
                    if (!type.timezone().empty()) {
                        timezone = type.timezone();
                    }
                    return Timestamp{to_micros(a.array->Value(row), type.unit()), std::move(timezone)};
                },
                [row](const auto& a) -> Value {
                    // bool and primitive numbers
                    if (a.array->IsNull(row)) {
                        return std::monostate{};
                    }
                    return a.array->Value(row);
                },
            },
            accessor);
    }

    ColumnType refineType(ColumnType requested, const std::optional<std::string>& metadata) {
        if (!metadata) {
            return requested;
        }
        const auto& hint = *metadata;
        if (starts_with(hint, "ARRAY")) {
            return ColumnType::ARRAY;
        }
        if (starts_with(hint, "STRUCT")) {
            return ColumnType::STRUCT;
        }
        if (starts_with(hint, "MAP")) {
            return ColumnType::MAP;
        }
        if (starts_with(hint, "VARIANT")) {
            return ColumnType::STRING;
        }
        if (starts_with(hint, "TIMESTAMP")) {
            // covers TIMESTAMP_NTZ
            return ColumnType::TIMESTAMP;
        }
        if (starts_with(hint, "GEOMETRY")) {
            return ColumnType::GEOMETRY;
        }
        if (starts_with(hint, "GEOGRAPHY")) {
            return ColumnType::GEOGRAPHY;
        }
        return requested;
    }

    std::string toString(const Value& value) {
        return std::visit(overloaded{
                              [](std::monostate) -> std::string { return "NULL"; },
                              [](bool v) -> std::string { return v ? "true" : "false"; },
                              [](int8_t v) -> std::string { return std::to_string(v); },
                              [](const std::string& v) -> std::string { return v; },
                              [](const Binary& v) -> std::string {
                                  std::string hex;
                                  hex.reserve(v.size() * 2);
                                  for (auto byte : v) {
                                      hex += fmt::format("{:02x}", byte);
                                  }
                                  return hex;
                              },
                              [](const Date& v) -> std::string { return format_date(v.days); },
                              [](const Timestamp& v) -> std::string {
                                  auto text = format_timestamp(v);
                                  return v.timezone ? text + " " + *v.timezone : text;
                              },
                              [](const Decimal& v) -> std::string { return v.text; },
                              [](const ComplexValue& v) -> std::string { return v.text; },
                              [](const GeospatialValue& v) -> std::string {
                                  return v.srid == 0 ? v.wkt : fmt::format("SRID={};{}", v.srid, v.wkt);
                              },
                              [](const auto& v) -> std::string { return fmt::format("{}", v); },
                          },
                          value);
    }

    Value ArrowValueConverter::convert(const arrow::Array& column,
                                       int64_t row,
                                       ColumnType requested,
                                       const std::optional<std::string>& metadata) const {
        if (row < 0 || row >= column.length()) {
            throw ConversionError(fmt::format("Row {} out of range for column of length {}", row, column.length()));
        }
        // check for null before reading the value
        if (column.IsNull(row)) {
            return std::monostate{};
        }
        auto target = refineType(requested, metadata);
        auto source = readCell(makeAccessor(column), row);
        if (std::holds_alternative<std::monostate>(source)) {
            return std::monostate{};
        }

        switch (target) {
            case ColumnType::BYTE:
                return to_number<int8_t>(source, target);
            case ColumnType::SHORT:
                return to_number<int16_t>(source, target);
            case ColumnType::INT:
                return to_number<int32_t>(source, target);
            case ColumnType::LONG:
                return to_number<int64_t>(source, target);
            case ColumnType::FLOAT:
                return to_number<float>(source, target);
            case ColumnType::DOUBLE:
                return to_number<double>(source, target);
            case ColumnType::DECIMAL:
                if (const auto* decimal = std::get_if<Decimal>(&source)) {
                    return *decimal;
                }
                return Decimal{toString(source), 0};
            case ColumnType::BINARY:
                return to_binary(source);
            case ColumnType::BOOLEAN:
                return to_boolean(source);
            case ColumnType::CHAR: {
                auto text = toString(source);
                return text.empty() ? text : text.substr(0, 1);
            }
            case ColumnType::STRING:
                return toString(source);
            case ColumnType::DATE:
                return to_date(source);
            case ColumnType::TIMESTAMP:
                return to_timestamp(source);
            case ColumnType::ARRAY:
            case ColumnType::STRUCT:
            case ColumnType::MAP:
                return ComplexValue{target, toString(source)};
            case ColumnType::INTERVAL:
                if (!metadata) {
                    throw ConversionError(fmt::format("Failed to read INTERVAL {} with null metadata.", toString(source)));
                }
                return ComplexValue{target, toString(source)};
            case ColumnType::GEOMETRY:
            case ColumnType::GEOGRAPHY:
                return to_geospatial(source, target, metadata);
            case ColumnType::NULL_TYPE:
                return std::monostate{};
        }
        throw ConversionError(fmt::format("Unsupported conversion type {}", to_string(target)));
    }

    const IValueConverter& defaultConverter() {
        static const ArrowValueConverter converter;
        return converter;
    }

} // namespace converters
