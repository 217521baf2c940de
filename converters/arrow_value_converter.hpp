// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <arrow/array.h>
#include <arrow/type.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace converters {

    // Type a caller wants a cell as, usually taken from the result manifest.
    enum class ColumnType : uint8_t
    {
        BYTE,
        SHORT,
        INT,
        LONG,
        FLOAT,
        DOUBLE,
        DECIMAL,
        BINARY,
        BOOLEAN,
        CHAR,
        STRING,
        DATE,
        TIMESTAMP,
        ARRAY,
        STRUCT,
        MAP,
        INTERVAL,
        GEOMETRY,
        GEOGRAPHY,
        NULL_TYPE
    };

    std::string_view to_string(ColumnType type) noexcept;

    class ConversionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    using Binary = std::vector<uint8_t>;

    struct Date {
        int32_t days = 0; // since 1970-01-01
        bool operator==(const Date&) const = default;
    };

    struct Timestamp {
        int64_t micros = 0; // since epoch, UTC
        std::optional<std::string> timezone;
        bool operator==(const Timestamp&) const = default;
    };

    struct Decimal {
        std::string text;
        int32_t scale = 0;
        bool operator==(const Decimal&) const = default;
    };

    // ARRAY, STRUCT, MAP and INTERVAL cells keep the server's textual form.
    struct ComplexValue {
        ColumnType type = ColumnType::STRING;
        std::string text;
        bool operator==(const ComplexValue&) const = default;
    };

    struct GeospatialValue {
        ColumnType type = ColumnType::GEOMETRY;
        std::string wkt;
        int32_t srid = 0;
        bool operator==(const GeospatialValue&) const = default;
    };

    using Value = std::variant<std::monostate,
                               bool,
                               int8_t,
                               int16_t,
                               int32_t,
                               int64_t,
                               float,
                               double,
                               std::string,
                               Binary,
                               Date,
                               Timestamp,
                               Decimal,
                               ComplexValue,
                               GeospatialValue>;

    // Typed views over the wire column kinds, one alternative per supported arrow type.
    struct NullAccessor {
        const arrow::NullArray* array;
    };
    struct BoolAccessor {
        const arrow::BooleanArray* array;
    };
    struct Int8Accessor {
        const arrow::Int8Array* array;
    };
    struct Int16Accessor {
        const arrow::Int16Array* array;
    };
    struct Int32Accessor {
        const arrow::Int32Array* array;
    };
    struct Int64Accessor {
        const arrow::Int64Array* array;
    };
    struct FloatAccessor {
        const arrow::FloatArray* array;
    };
    struct DoubleAccessor {
        const arrow::DoubleArray* array;
    };
    struct DecimalAccessor {
        const arrow::Decimal128Array* array;
    };
    struct StringAccessor {
        const arrow::StringArray* array;
    };
    struct BinaryAccessor {
        const arrow::BinaryArray* array;
    };
    struct DateAccessor {
        const arrow::Date32Array* array;
    };
    struct TimestampAccessor {
        const arrow::TimestampArray* array;
    };

    using ColumnAccessor = std::variant<NullAccessor,
                                        BoolAccessor,
                                        Int8Accessor,
                                        Int16Accessor,
                                        Int32Accessor,
                                        Int64Accessor,
                                        FloatAccessor,
                                        DoubleAccessor,
                                        DecimalAccessor,
                                        StringAccessor,
                                        BinaryAccessor,
                                        DateAccessor,
                                        TimestampAccessor>;

    // Throws ConversionError for arrow types without an accessor.
    ColumnAccessor makeAccessor(const arrow::Array& array);

    // Cell as its natural value; null cells give std::monostate.
    Value readCell(const ColumnAccessor& accessor, int64_t row);

    // Requested type after applying the column's SQL type metadata (ARRAY<...>, TIMESTAMP_NTZ, ...).
    ColumnType refineType(ColumnType requested, const std::optional<std::string>& metadata);

    std::string toString(const Value& value);

    class IValueConverter {
    public:
        virtual ~IValueConverter() = default;
        virtual Value convert(const arrow::Array& column,
                              int64_t row,
                              ColumnType requested,
                              const std::optional<std::string>& metadata) const = 0;
    };

    class ArrowValueConverter final : public IValueConverter {
    public:
        Value convert(const arrow::Array& column,
                      int64_t row,
                      ColumnType requested,
                      const std::optional<std::string>& metadata) const override;
    };

    const IValueConverter& defaultConverter();

} // namespace converters
