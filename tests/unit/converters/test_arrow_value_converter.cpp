// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "converters/arrow_value_converter.hpp"

#include <arrow/builder.h>

#include <catch2/catch.hpp>

using namespace converters;

namespace {
    template<typename Builder, typename T>
    std::shared_ptr<arrow::Array> column(std::shared_ptr<arrow::DataType> type, const std::vector<std::optional<T>>& values) {
        Builder builder(std::move(type), arrow::default_memory_pool());
        for (const auto& value : values) {
            if (value) {
                REQUIRE(builder.Append(*value).ok());
            } else {
                REQUIRE(builder.AppendNull().ok());
            }
        }
        return builder.Finish().ValueOrDie();
    }

    std::shared_ptr<arrow::Array> strings(const std::vector<std::optional<std::string>>& values) {
        return column<arrow::StringBuilder>(arrow::utf8(), values);
    }

    std::shared_ptr<arrow::Array> longs(const std::vector<std::optional<int64_t>>& values) {
        return column<arrow::Int64Builder>(arrow::int64(), values);
    }

    Value convert(const std::shared_ptr<arrow::Array>& array,
                  int64_t row,
                  ColumnType type,
                  std::optional<std::string> metadata = std::nullopt) {
        return defaultConverter().convert(*array, row, type, metadata);
    }
} // namespace

TEST_CASE("arrow_value_converter: metadata refines the requested type") {
    REQUIRE(refineType(ColumnType::STRING, std::nullopt) == ColumnType::STRING);
    REQUIRE(refineType(ColumnType::STRING, "ARRAY<INT>") == ColumnType::ARRAY);
    REQUIRE(refineType(ColumnType::STRING, "STRUCT<a: INT>") == ColumnType::STRUCT);
    REQUIRE(refineType(ColumnType::STRING, "MAP<STRING, INT>") == ColumnType::MAP);
    REQUIRE(refineType(ColumnType::STRING, "TIMESTAMP_NTZ") == ColumnType::TIMESTAMP);
    REQUIRE(refineType(ColumnType::STRING, "GEOGRAPHY(4326)") == ColumnType::GEOGRAPHY);
    REQUIRE(refineType(ColumnType::LONG, "VARIANT") == ColumnType::STRING);
    REQUIRE(refineType(ColumnType::LONG, "BIGINT") == ColumnType::LONG);
}

TEST_CASE("arrow_value_converter: null cells") {
    auto ids = longs({1, std::nullopt});
    REQUIRE(std::holds_alternative<std::monostate>(convert(ids, 1, ColumnType::LONG)));
    REQUIRE(std::holds_alternative<std::monostate>(convert(ids, 1, ColumnType::STRING)));
    REQUIRE(toString(convert(ids, 1, ColumnType::STRING)) == "NULL");

    arrow::NullBuilder nulls;
    REQUIRE(nulls.AppendNulls(2).ok());
    auto all_null = nulls.Finish().ValueOrDie();
    REQUIRE(std::holds_alternative<std::monostate>(convert(all_null, 0, ColumnType::INT)));
}

TEST_CASE("arrow_value_converter: numbers") {
    auto ids = longs({42, 300});

    REQUIRE(std::get<int64_t>(convert(ids, 0, ColumnType::LONG)) == 42);
    REQUIRE(std::get<int32_t>(convert(ids, 0, ColumnType::INT)) == 42);
    REQUIRE(std::get<double>(convert(ids, 1, ColumnType::DOUBLE)) == Approx(300.0));
    REQUIRE(std::get<std::string>(convert(ids, 1, ColumnType::STRING)) == "300");
    REQUIRE(std::get<Decimal>(convert(ids, 0, ColumnType::DECIMAL)) == Decimal{"42", 0});

    auto text = strings({"17", " 2.5 ", "abc"});
    REQUIRE(std::get<int16_t>(convert(text, 0, ColumnType::SHORT)) == 17);
    REQUIRE(std::get<float>(convert(text, 1, ColumnType::FLOAT)) == Approx(2.5f));
    REQUIRE_THROWS_AS(convert(text, 2, ColumnType::INT), ConversionError);
    REQUIRE_THROWS_AS(convert(text, 3, ColumnType::INT), ConversionError);
}

TEST_CASE("arrow_value_converter: decimals") {
    auto type = arrow::decimal128(10, 2);
    auto prices = column<arrow::Decimal128Builder>(type, std::vector<std::optional<arrow::Decimal128>>{
                                                             arrow::Decimal128(12345)});

    auto decimal = std::get<Decimal>(convert(prices, 0, ColumnType::DECIMAL));
    REQUIRE(decimal.text == "123.45");
    REQUIRE(decimal.scale == 2);
    REQUIRE(std::get<int64_t>(convert(prices, 0, ColumnType::LONG)) == 123);
    REQUIRE(std::get<double>(convert(prices, 0, ColumnType::DOUBLE)) == Approx(123.45));
}

TEST_CASE("arrow_value_converter: booleans and characters") {
    auto flags = column<arrow::BooleanBuilder>(arrow::boolean(), std::vector<std::optional<bool>>{true, false});
    REQUIRE(std::get<bool>(convert(flags, 0, ColumnType::BOOLEAN)));
    REQUIRE(std::get<std::string>(convert(flags, 1, ColumnType::STRING)) == "false");
    REQUIRE(std::get<int32_t>(convert(flags, 0, ColumnType::INT)) == 1);

    auto text = strings({"TRUE", "0", "maybe", "xyz", ""});
    REQUIRE(std::get<bool>(convert(text, 0, ColumnType::BOOLEAN)));
    REQUIRE_FALSE(std::get<bool>(convert(text, 1, ColumnType::BOOLEAN)));
    REQUIRE_THROWS_AS(convert(text, 2, ColumnType::BOOLEAN), ConversionError);
    REQUIRE(std::get<std::string>(convert(text, 3, ColumnType::CHAR)) == "x");
    REQUIRE(std::get<std::string>(convert(text, 4, ColumnType::CHAR)).empty());
}

TEST_CASE("arrow_value_converter: dates and timestamps") {
    // 2024-03-01
    auto dates = column<arrow::Date32Builder>(arrow::date32(), std::vector<std::optional<int32_t>>{19783});
    REQUIRE(std::get<Date>(convert(dates, 0, ColumnType::DATE)).days == 19783);
    REQUIRE(std::get<std::string>(convert(dates, 0, ColumnType::STRING)) == "2024-03-01");
    REQUIRE(std::get<Timestamp>(convert(dates, 0, ColumnType::TIMESTAMP)).micros == 19783LL * 86400 * 1000000);

    auto millis = column<arrow::TimestampBuilder>(arrow::timestamp(arrow::TimeUnit::MILLI, "UTC"),
                                                  std::vector<std::optional<int64_t>>{1709251200123});
    auto ts = std::get<Timestamp>(convert(millis, 0, ColumnType::TIMESTAMP));
    REQUIRE(ts.micros == 1709251200123000);
    REQUIRE(ts.timezone == std::optional<std::string>("UTC"));
    REQUIRE(std::get<std::string>(convert(millis, 0, ColumnType::STRING)) == "2024-03-01 00:00:00.123000 UTC");
    REQUIRE(std::get<Date>(convert(millis, 0, ColumnType::DATE)).days == 19783);

    auto text = strings({"2024-03-01", "2024-03-01T10:20:30.5", "2024-02-30", "yesterday"});
    REQUIRE(std::get<Date>(convert(text, 0, ColumnType::DATE)).days == 19783);
    REQUIRE(std::get<Timestamp>(convert(text, 1, ColumnType::TIMESTAMP)).micros ==
            19783LL * 86400 * 1000000 + (10 * 3600 + 20 * 60 + 30) * 1000000LL + 500000);
    REQUIRE_THROWS_AS(convert(text, 2, ColumnType::DATE), ConversionError);
    REQUIRE_THROWS_AS(convert(text, 3, ColumnType::TIMESTAMP), ConversionError);

    // TIMESTAMP_NTZ metadata turns a string request into a timestamp
    REQUIRE(std::holds_alternative<Timestamp>(convert(text, 1, ColumnType::STRING, "TIMESTAMP_NTZ")));
}

TEST_CASE("arrow_value_converter: complex and interval values") {
    auto text = strings({"[1,2,3]", "1-2"});

    auto array = std::get<ComplexValue>(convert(text, 0, ColumnType::STRING, "ARRAY<INT>"));
    REQUIRE(array.type == ColumnType::ARRAY);
    REQUIRE(array.text == "[1,2,3]");

    REQUIRE_THROWS_WITH(convert(text, 1, ColumnType::INTERVAL),
                        Catch::Contains("Failed to read INTERVAL 1-2 with null metadata"));
    auto interval = std::get<ComplexValue>(convert(text, 1, ColumnType::INTERVAL, "INTERVAL YEAR TO MONTH"));
    REQUIRE(interval.type == ColumnType::INTERVAL);
}

TEST_CASE("arrow_value_converter: geospatial values") {
    auto text = strings({"SRID=4326;POINT(1 2)", "POINT(3 4)"});

    auto ewkt = std::get<GeospatialValue>(convert(text, 0, ColumnType::GEOMETRY));
    REQUIRE(ewkt.srid == 4326);
    REQUIRE(ewkt.wkt == "POINT(1 2)");
    REQUIRE(toString(ewkt) == "SRID=4326;POINT(1 2)");

    auto from_metadata = std::get<GeospatialValue>(convert(text, 1, ColumnType::STRING, "GEOGRAPHY(4269)"));
    REQUIRE(from_metadata.type == ColumnType::GEOGRAPHY);
    REQUIRE(from_metadata.srid == 4269);
    REQUIRE(from_metadata.wkt == "POINT(3 4)");

    auto plain = std::get<GeospatialValue>(convert(text, 1, ColumnType::GEOMETRY));
    REQUIRE(plain.srid == 0);
    REQUIRE(toString(plain) == "POINT(3 4)");
}

TEST_CASE("arrow_value_converter: binary") {
    auto bytes = column<arrow::BinaryBuilder>(arrow::binary(), std::vector<std::optional<std::string>>{std::string("\x01\xab", 2)});
    REQUIRE(std::get<Binary>(convert(bytes, 0, ColumnType::BINARY)) == Binary{0x01, 0xab});
    REQUIRE(std::get<std::string>(convert(bytes, 0, ColumnType::STRING)) == "01ab");
    REQUIRE(std::get<Binary>(convert(strings({"hi"}), 0, ColumnType::BINARY)) == Binary{'h', 'i'});
}

TEST_CASE("arrow_value_converter: unsupported inputs") {
    auto text = strings({"value"});
    REQUIRE_THROWS_AS(convert(text, 1, ColumnType::STRING), ConversionError);
    REQUIRE_THROWS_AS(convert(text, -1, ColumnType::STRING), ConversionError);
    REQUIRE_THROWS_AS(convert(text, 0, ColumnType::DATE), ConversionError);

    auto small = column<arrow::UInt8Builder>(arrow::uint8(), std::vector<std::optional<uint8_t>>{7});
    REQUIRE_THROWS_WITH(convert(small, 0, ColumnType::INT), Catch::Contains("No accessor for arrow type uint8"));

    REQUIRE(to_string(ColumnType::GEOGRAPHY) == "GEOGRAPHY");
}
