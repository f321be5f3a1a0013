/**
 * @file test_deserialize.cpp
 * @brief Unit tests for built-in Deserialize<T> specializations
 */

#include <gtest/gtest.h>
#include "locus/Deserialize.hpp"
#include "locus/Errors.hpp"
#include "locus/ValueDeserializer.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace locus;

namespace {

template <typename T>
T decode(const Value& value) {
    ValueDeserializer backend(value);
    T out{};
    Deserialize<T>::deserialize(backend, out);
    return out;
}

template <typename T>
std::string decode_error(const Value& value) {
    try {
        decode<T>(value);
    } catch (const DecodeError& err) {
        return err.what();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(DeserializeScalarTest, Bool) {
    EXPECT_TRUE(decode<bool>(true));
    EXPECT_FALSE(decode<bool>(false));
    EXPECT_EQ(decode_error<bool>(1), "invalid type: integer `1`, expected a boolean");
}

TEST(DeserializeScalarTest, IntegersInRange) {
    EXPECT_EQ(decode<std::int8_t>(-128), -128);
    EXPECT_EQ(decode<std::uint8_t>(255), 255);
    EXPECT_EQ(decode<std::int32_t>(-5), -5);
    EXPECT_EQ(decode<std::uint64_t>(18446744073709551615ull), 18446744073709551615ull);
    EXPECT_EQ(decode<std::int64_t>(-9223372036854775807ll), -9223372036854775807ll);
}

TEST(DeserializeScalarTest, IntegerOutOfRangeIsInvalidValue) {
    EXPECT_EQ(decode_error<std::uint8_t>(300), "invalid value: integer `300`, expected u8");
    EXPECT_EQ(decode_error<std::uint32_t>(-1), "invalid value: integer `-1`, expected u32");
    EXPECT_EQ(decode_error<std::int8_t>(-129), "invalid value: integer `-129`, expected i8");
    EXPECT_EQ(decode_error<std::int64_t>(18446744073709551615ull),
              "invalid value: integer `18446744073709551615`, expected i64");
}

TEST(DeserializeScalarTest, IntegerFromWrongType) {
    EXPECT_EQ(decode_error<std::uint32_t>("500"), "invalid type: string \"500\", expected u32");
    EXPECT_EQ(decode_error<std::int16_t>(1.5), "invalid type: floating point `1.5`, expected i16");
    EXPECT_EQ(decode_error<std::uint16_t>(nullptr), "invalid type: unit value, expected u16");
}

TEST(DeserializeScalarTest, FloatsAcceptIntegers) {
    EXPECT_DOUBLE_EQ(decode<double>(2.5), 2.5);
    EXPECT_DOUBLE_EQ(decode<double>(3), 3.0);
    EXPECT_DOUBLE_EQ(decode<double>(-3), -3.0);
    EXPECT_FLOAT_EQ(decode<float>(0.25), 0.25f);
    EXPECT_EQ(decode_error<double>("x"), "invalid type: string \"x\", expected f64");
}

TEST(DeserializeScalarTest, FloatOutOfRangeSaturates) {
    EXPECT_EQ(decode<float>(1e300), std::numeric_limits<float>::infinity());
    EXPECT_EQ(decode<float>(-1e300), -std::numeric_limits<float>::infinity());
    EXPECT_DOUBLE_EQ(decode<double>(1e300), 1e300);
}

TEST(DeserializeScalarTest, Char) {
    EXPECT_EQ(decode<char>("a"), 'a');
    EXPECT_EQ(decode_error<char>("ab"), "invalid value: string \"ab\", expected a character");
}

TEST(DeserializeScalarTest, String) {
    EXPECT_EQ(decode<std::string>("hello"), "hello");
    EXPECT_EQ(decode_error<std::string>(1), "invalid type: integer `1`, expected a string");
    EXPECT_EQ(decode_error<std::string>(true), "invalid type: boolean `true`, expected a string");
}

TEST(DeserializeScalarTest, ByteBuf) {
    EXPECT_EQ(decode<ByteBuf>(Value::binary(Bytes{1, 2, 3})).bytes, (Bytes{1, 2, 3}));
    EXPECT_EQ(decode<ByteBuf>(Value::array({4, 5})).bytes, (Bytes{4, 5}));
    EXPECT_EQ(decode<ByteBuf>("hi").bytes, (Bytes{'h', 'i'}));
}

TEST(DeserializeScalarTest, Unit) {
    EXPECT_EQ(decode<Unit>(nullptr), Unit{});
    EXPECT_EQ(decode_error<Unit>(0), "invalid type: integer `0`, expected unit");
}

TEST(DeserializeScalarTest, IgnoredAnyAcceptsEverything) {
    EXPECT_NO_THROW(decode<IgnoredAny>(nullptr));
    EXPECT_NO_THROW(decode<IgnoredAny>(Value::array({1, "two", nullptr})));
    EXPECT_NO_THROW(decode<IgnoredAny>(Value{{"k", {{"nested", true}}}}));
}

// ============================================================================
// Containers
// ============================================================================

TEST(DeserializeContainerTest, Optional) {
    EXPECT_EQ(decode<std::optional<int>>(nullptr), std::nullopt);
    EXPECT_EQ(decode<std::optional<int>>(4), std::optional<int>(4));
    EXPECT_EQ(decode_error<std::optional<int>>("4"),
              "invalid type: string \"4\", expected i32");
}

TEST(DeserializeContainerTest, Vector) {
    EXPECT_EQ(decode<std::vector<int>>(Value::array({1, 2, 3})), (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(decode<std::vector<int>>(Value::array()).empty());
    EXPECT_EQ(decode_error<std::vector<int>>(Value::object()),
              "invalid type: map, expected a sequence");
}

TEST(DeserializeContainerTest, NestedVectors) {
    const Value doc = Value::array({Value::array({1}), Value::array({2, 3})});
    EXPECT_EQ(decode<std::vector<std::vector<int>>>(doc),
              (std::vector<std::vector<int>>{{1}, {2, 3}}));
}

TEST(DeserializeContainerTest, MapWithStringKeys) {
    const Value doc = {{"a", 1}, {"b", 2}};
    const auto decoded = decode<std::map<std::string, int>>(doc);
    EXPECT_EQ(decoded, (std::map<std::string, int>{{"a", 1}, {"b", 2}}));
    EXPECT_EQ((decode_error<std::map<std::string, int>>(Value::array())),
              "invalid type: sequence, expected a map");
}

TEST(DeserializeContainerTest, MapWithIntegerKeys) {
    const Value doc = {{"1", "one"}, {"-2", "minus two"}};
    const auto decoded = decode<std::map<int, std::string>>(doc);
    EXPECT_EQ(decoded, (std::map<int, std::string>{{1, "one"}, {-2, "minus two"}}));
}

TEST(DeserializeContainerTest, MapWithBoolKeys) {
    const Value doc = {{"true", 1}, {"false", 0}};
    const auto decoded = decode<std::map<bool, int>>(doc);
    EXPECT_EQ(decoded, (std::map<bool, int>{{true, 1}, {false, 0}}));
}

TEST(DeserializeContainerTest, Pair) {
    const auto decoded = decode<std::pair<std::string, int>>(Value::array({"x", 1}));
    EXPECT_EQ(decoded.first, "x");
    EXPECT_EQ(decoded.second, 1);
}

TEST(DeserializeContainerTest, Tuple) {
    const auto decoded =
        decode<std::tuple<int, std::string, bool>>(Value::array({7, "seven", true}));
    EXPECT_EQ(decoded, std::make_tuple(7, std::string("seven"), true));
}

TEST(DeserializeContainerTest, TupleTooShort) {
    EXPECT_EQ((decode_error<std::tuple<int, int, int>>(Value::array({1, 2}))),
              "invalid length 2, expected a tuple of size 3");
}

TEST(DeserializeContainerTest, TupleTooLong) {
    EXPECT_EQ((decode_error<std::pair<int, int>>(Value::array({1, 2, 3}))),
              "invalid length 3, expected fewer elements in array");
}
