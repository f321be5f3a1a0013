/**
 * @file test_value_deserializer.cpp
 * @brief Unit tests for the Value backend
 */

#include <gtest/gtest.h>
#include "locus/Deserialize.hpp"
#include "locus/Errors.hpp"
#include "locus/ValueDeserializer.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using namespace locus;

namespace {

/// Records which callback the backend chose
class RecordingVisitor : public Visitor {
public:
    std::string expecting() const override { return "anything"; }

    void visit_bool(bool) override { called = "bool"; }
    void visit_i64(std::int64_t) override { called = "i64"; }
    void visit_u64(std::uint64_t) override { called = "u64"; }
    void visit_f64(double) override { called = "f64"; }
    void visit_str(std::string_view) override { called = "str"; }
    void visit_borrowed_str(std::string_view) override { called = "borrowed_str"; }
    void visit_bytes(const Bytes&) override { called = "bytes"; }
    void visit_borrowed_bytes(const Bytes&) override { called = "borrowed_bytes"; }
    void visit_none() override { called = "none"; }
    void visit_some(Deserializer&) override { called = "some"; }
    void visit_unit() override { called = "unit"; }
    void visit_newtype_struct(Deserializer&) override { called = "newtype_struct"; }

    void visit_seq(SeqAccess& seq) override {
        called = "seq";
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        while (seq.next_element_seed(seed)) {
        }
    }

    void visit_map(MapAccess& map) override {
        called = "map";
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        while (map.next_key_seed(seed)) {
            map.next_value_seed(seed);
        }
    }

    std::string called;
};

/// Map visitor that stops after the first entry
class FirstEntryVisitor : public Visitor {
public:
    std::string expecting() const override { return "a map"; }

    void visit_map(MapAccess& map) override {
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        if (map.next_key_seed(seed)) {
            map.next_value_seed(seed);
        }
    }
};

std::string any_callback(const Value& value) {
    ValueDeserializer backend(value);
    RecordingVisitor visitor;
    backend.deserialize_any(visitor);
    return visitor.called;
}

template <typename T>
std::string decode_error(const Value& value) {
    ValueDeserializer backend(value);
    T out{};
    try {
        Deserialize<T>::deserialize(backend, out);
    } catch (const DecodeError& err) {
        return err.what();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST(ValueDeserializerTest, AnyDispatchesOnStoredType) {
    EXPECT_EQ(any_callback(nullptr), "unit");
    EXPECT_EQ(any_callback(true), "bool");
    EXPECT_EQ(any_callback(-1), "i64");
    EXPECT_EQ(any_callback(1u), "u64");
    EXPECT_EQ(any_callback(0.5), "f64");
    EXPECT_EQ(any_callback("text"), "borrowed_str");
    EXPECT_EQ(any_callback(Value::binary(Bytes{1})), "borrowed_bytes");
    EXPECT_EQ(any_callback(Value::array({1, 2})), "seq");
    EXPECT_EQ(any_callback(Value::object()), "map");
}

TEST(ValueDeserializerTest, OptionDistinguishesNull) {
    const Value null;
    const Value one = 1;
    RecordingVisitor visitor;

    ValueDeserializer(null).deserialize_option(visitor);
    EXPECT_EQ(visitor.called, "none");

    ValueDeserializer(one).deserialize_option(visitor);
    EXPECT_EQ(visitor.called, "some");
}

TEST(ValueDeserializerTest, NewtypeStructPassesItself) {
    const Value value = 1;
    RecordingVisitor visitor;
    ValueDeserializer(value).deserialize_newtype_struct("Meters", visitor);
    EXPECT_EQ(visitor.called, "newtype_struct");
}

TEST(ValueDeserializerTest, IgnoredAnyIsUnit) {
    const Value value = {{"a", 1}};
    RecordingVisitor visitor;
    ValueDeserializer(value).deserialize_ignored_any(visitor);
    EXPECT_EQ(visitor.called, "unit");
}

// ============================================================================
// Length checks
// ============================================================================

TEST(ValueDeserializerTest, UnconsumedMapEntries) {
    const Value value = {{"a", 1}, {"b", 2}};
    FirstEntryVisitor visitor;
    try {
        ValueDeserializer(value).deserialize_map(visitor);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& err) {
        EXPECT_EQ(err.kind(), DecodeError::Kind::InvalidLength);
        EXPECT_STREQ(err.what(), "invalid length 2, expected fewer elements in map");
    }
}

TEST(ValueDeserializerTest, SeqRequiresArray) {
    EXPECT_EQ(decode_error<std::vector<int>>("abc"),
              "invalid type: string \"abc\", expected a sequence");
}

// ============================================================================
// Map keys
// ============================================================================

TEST(ValueDeserializerTest, NonNumericKeyForIntegerMap) {
    const Value value = {{"abc", 1}};
    EXPECT_EQ((decode_error<std::map<std::uint32_t, int>>(value)),
              "expected numeric key, found `abc`");
}

TEST(ValueDeserializerTest, LeadingZeroKeyIsNotNumeric) {
    const Value value = {{"01", 1}};
    EXPECT_EQ((decode_error<std::map<std::uint32_t, int>>(value)),
              "expected numeric key, found `01`");
}

TEST(ValueDeserializerTest, NumericKeyRangeChecked) {
    const Value value = {{"300", 1}};
    EXPECT_EQ((decode_error<std::map<std::uint8_t, int>>(value)),
              "invalid value: integer `300`, expected u8");
}

TEST(ValueDeserializerTest, FloatKeys) {
    const Value value = {{"1.5", "x"}};
    ValueDeserializer backend(value);
    std::map<double, std::string> out;
    Deserialize<std::map<double, std::string>>::deserialize(backend, out);
    EXPECT_EQ(out.at(1.5), "x");
}

// ============================================================================
// Buffering and descriptions
// ============================================================================

TEST(ValueDeserializerTest, DeserializeValueCopiesDocument) {
    const Value doc = {
        {"name", "demo"},
        {"tags", {"a", "b"}},
        {"nested", {{"n", -3}, {"f", 1.25}, {"ok", true}, {"none", nullptr}}}
    };
    ValueDeserializer backend(doc);
    Value copy;
    Deserialize<Value>::deserialize(backend, copy);
    EXPECT_EQ(copy, doc);
}

TEST(ValueDeserializerTest, UnexpectedDescriptions) {
    EXPECT_EQ(unexpected_of(nullptr).description(), "unit value");
    EXPECT_EQ(unexpected_of(true).description(), "boolean `true`");
    EXPECT_EQ(unexpected_of(-4).description(), "integer `-4`");
    EXPECT_EQ(unexpected_of(4u).description(), "integer `4`");
    EXPECT_EQ(unexpected_of(2.0).description(), "floating point `2.0`");
    EXPECT_EQ(unexpected_of("s").description(), "string \"s\"");
    EXPECT_EQ(unexpected_of(Value::array()).description(), "sequence");
    EXPECT_EQ(unexpected_of(Value::object()).description(), "map");
    EXPECT_EQ(unexpected_of(Value::binary(Bytes{})).description(), "byte array");
}
