/**
 * @file test_struct.cpp
 * @brief Unit tests for Fields<T> struct decoding
 */

#include <gtest/gtest.h>
#include "locus/Errors.hpp"
#include "locus/Struct.hpp"
#include "locus/ValueDeserializer.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <optional>
#include <string>

using namespace locus;

namespace {

struct Package {
    std::string name;
    std::uint32_t version = 0;
    std::optional<std::string> license;
};

struct Strict {
    std::string name;
};

struct Triple {
    std::int32_t a = -1;
    std::optional<std::int32_t> b;
    std::int32_t c = -1;
};

} // anonymous namespace

namespace locus {

template <>
struct Deserialize<Package> {
    static void deserialize(Deserializer& deserializer, Package& out) {
        static const auto fields = Fields<Package>("Package")
            .required("name", &Package::name)
            .required("version", &Package::version)
            .optional("license", &Package::license);
        fields.deserialize(deserializer, out);
    }
};

template <>
struct Deserialize<Strict> {
    static void deserialize(Deserializer& deserializer, Strict& out) {
        static const auto fields = Fields<Strict>("Strict", FieldPolicy{true})
            .required("name", &Strict::name);
        fields.deserialize(deserializer, out);
    }
};

template <>
struct Deserialize<Triple> {
    static void deserialize(Deserializer& deserializer, Triple& out) {
        static const auto fields = Fields<Triple>("Triple")
            .required("a", &Triple::a)
            .optional("b", &Triple::b)
            .required("c", &Triple::c);
        fields.deserialize(deserializer, out);
    }
};

} // namespace locus

namespace {

template <typename T>
T decode_from(Deserializer& backend) {
    T out{};
    Deserialize<T>::deserialize(backend, out);
    return out;
}

template <typename T>
T decode(const Value& value) {
    ValueDeserializer backend(value);
    return decode_from<T>(backend);
}

template <typename T>
DecodeError decode_error(const Value& value) {
    try {
        decode<T>(value);
    } catch (const DecodeError& err) {
        return err;
    }
    return DecodeError::custom("no error");
}

} // anonymous namespace

// ============================================================================
// Map form
// ============================================================================

TEST(StructTest, AllFields) {
    const Value doc = {{"name", "demo"}, {"version", 3}, {"license", "MIT"}};
    const Package pkg = decode<Package>(doc);
    EXPECT_EQ(pkg.name, "demo");
    EXPECT_EQ(pkg.version, 3u);
    EXPECT_EQ(pkg.license, std::optional<std::string>("MIT"));
}

TEST(StructTest, OptionalFieldMayBeAbsent) {
    const Value doc = {{"name", "demo"}, {"version", 1}};
    const Package pkg = decode<Package>(doc);
    EXPECT_FALSE(pkg.license.has_value());
}

TEST(StructTest, OptionalFieldMayBeNull) {
    const Value doc = {{"name", "demo"}, {"version", 1}, {"license", nullptr}};
    EXPECT_FALSE(decode<Package>(doc).license.has_value());
}

TEST(StructTest, UnknownFieldsSkippedByDefault) {
    const Value doc = {{"name", "demo"}, {"version", 1}, {"extra", {{"deep", {1, 2}}}}};
    EXPECT_EQ(decode<Package>(doc).name, "demo");
}

TEST(StructTest, MissingRequiredField) {
    const Value doc = {{"name", "demo"}};
    const DecodeError err = decode_error<Package>(doc);
    EXPECT_EQ(err.kind(), DecodeError::Kind::MissingField);
    EXPECT_EQ(err.field(), "version");
    EXPECT_STREQ(err.what(), "missing field `version`");
}

TEST(StructTest, DenyUnknownFields) {
    const Value doc = {{"name", "demo"}, {"extra", 1}};
    const DecodeError err = decode_error<Strict>(doc);
    EXPECT_EQ(err.kind(), DecodeError::Kind::UnknownField);
    EXPECT_EQ(err.field(), "extra");
    EXPECT_STREQ(err.what(), "unknown field `extra`, expected `name`");
}

TEST(StructTest, FieldTypeError) {
    const Value doc = {{"name", "demo"}, {"version", "1.0"}};
    EXPECT_STREQ(decode_error<Package>(doc).what(),
                 "invalid type: string \"1.0\", expected u32");
}

TEST(StructTest, NotAMap) {
    EXPECT_STREQ(decode_error<Package>("demo").what(),
                 "invalid type: string \"demo\", expected struct Package");
}

TEST(StructTest, DuplicateField) {
    locus_test::EntriesDeserializer backend({{"name", "a"}, {"version", 1}, {"name", "b"}});
    try {
        decode_from<Package>(backend);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& err) {
        EXPECT_EQ(err.kind(), DecodeError::Kind::DuplicateField);
        EXPECT_STREQ(err.what(), "duplicate field `name`");
    }
}

TEST(StructTest, FieldNamesInDeclarationOrder) {
    const auto fields = Fields<Package>("Package")
        .required("name", &Package::name)
        .optional("license", &Package::license);
    ASSERT_EQ(fields.names().size(), 2u);
    EXPECT_EQ(fields.names()[0], "name");
    EXPECT_EQ(fields.names()[1], "license");
    EXPECT_EQ(fields.name(), "Package");
}

// ============================================================================
// Sequence form
// ============================================================================

TEST(StructSeqTest, FieldsInOrder) {
    const Package pkg = decode<Package>(Value::array({"demo", 2, "MIT"}));
    EXPECT_EQ(pkg.name, "demo");
    EXPECT_EQ(pkg.version, 2u);
    EXPECT_EQ(pkg.license, std::optional<std::string>("MIT"));
}

TEST(StructSeqTest, TrailingOptionalFieldMayBeOmitted) {
    const Package pkg = decode<Package>(Value::array({"demo", 2}));
    EXPECT_FALSE(pkg.license.has_value());
}

TEST(StructSeqTest, RequiredFieldAfterOmittedOptional) {
    const DecodeError err = decode_error<Triple>(Value::array({1}));
    EXPECT_EQ(err.kind(), DecodeError::Kind::InvalidLength);
    EXPECT_STREQ(err.what(), "invalid length 1, expected struct Triple with 3 elements");

    const Triple triple = decode<Triple>(Value::array({1, nullptr, 3}));
    EXPECT_FALSE(triple.b.has_value());
    EXPECT_EQ(triple.c, 3);
}

TEST(StructSeqTest, TooFewElements) {
    const DecodeError err = decode_error<Package>(Value::array({"demo"}));
    EXPECT_EQ(err.kind(), DecodeError::Kind::InvalidLength);
    EXPECT_STREQ(err.what(), "invalid length 1, expected struct Package with 3 elements");
}

TEST(StructSeqTest, TooManyElements) {
    EXPECT_STREQ(decode_error<Package>(Value::array({"demo", 2, "MIT", true})).what(),
                 "invalid length 4, expected fewer elements in array");
}
