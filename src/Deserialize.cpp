/**
 * @file Deserialize.cpp
 * @brief Scalar Deserialize<T> specializations
 */

#include "locus/Deserialize.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace locus {

namespace {

// ============================================================================
// Visitors
// ============================================================================

class BoolVisitor : public Visitor {
public:
    explicit BoolVisitor(bool& out) : out_(out) {}

    std::string expecting() const override { return "a boolean"; }

    void visit_bool(bool v) override { out_ = v; }

private:
    bool& out_;
};

/**
 * @brief Accepts any integer callback that fits Int
 *
 * Out-of-range values are invalid values, not invalid types:
 * "invalid value: integer `300`, expected u8".
 */
template <typename Int>
class IntVisitor : public Visitor {
public:
    IntVisitor(Int& out, const char* name) : out_(out), name_(name) {}

    std::string expecting() const override { return name_; }

    void visit_i64(std::int64_t v) override {
        if constexpr (std::is_signed<Int>::value) {
            if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max()) {
                throw DecodeError::invalid_value(Unexpected::signed_integer(v), name_);
            }
        } else {
            if (v < 0 || static_cast<std::uint64_t>(v) > std::numeric_limits<Int>::max()) {
                throw DecodeError::invalid_value(Unexpected::signed_integer(v), name_);
            }
        }
        out_ = static_cast<Int>(v);
    }

    void visit_u64(std::uint64_t v) override {
        if (v > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
            throw DecodeError::invalid_value(Unexpected::unsigned_integer(v), name_);
        }
        out_ = static_cast<Int>(v);
    }

private:
    Int& out_;
    const char* name_;
};

/// Narrows a double, saturating to infinity outside the target's range
template <typename Float>
Float narrow_float(double v) {
    if (std::isnan(v)) {
        return std::numeric_limits<Float>::quiet_NaN();
    }
    if (v > static_cast<double>(std::numeric_limits<Float>::max())) {
        return std::numeric_limits<Float>::infinity();
    }
    if (v < static_cast<double>(std::numeric_limits<Float>::lowest())) {
        return -std::numeric_limits<Float>::infinity();
    }
    return static_cast<Float>(v);
}

/// Floats also accept integers, as JSON does not distinguish `1` from `1.0`
template <typename Float>
class FloatVisitor : public Visitor {
public:
    FloatVisitor(Float& out, const char* name) : out_(out), name_(name) {}

    std::string expecting() const override { return name_; }

    void visit_f64(double v) override { out_ = narrow_float<Float>(v); }
    void visit_i64(std::int64_t v) override { out_ = static_cast<Float>(v); }
    void visit_u64(std::uint64_t v) override { out_ = static_cast<Float>(v); }

private:
    Float& out_;
    const char* name_;
};

class CharVisitor : public Visitor {
public:
    explicit CharVisitor(char& out) : out_(out) {}

    std::string expecting() const override { return "a character"; }

    void visit_char(char32_t v) override {
        if (v > 0x7F) {
            throw DecodeError::invalid_value(Unexpected::character(v), expecting());
        }
        out_ = static_cast<char>(v);
    }

    void visit_str(std::string_view v) override {
        if (v.size() != 1 || static_cast<unsigned char>(v[0]) > 0x7F) {
            throw DecodeError::invalid_value(Unexpected::str(v), expecting());
        }
        out_ = v[0];
    }

private:
    char& out_;
};

class StringVisitor : public Visitor {
public:
    explicit StringVisitor(std::string& out) : out_(out) {}

    std::string expecting() const override { return "a string"; }

    void visit_str(std::string_view v) override { out_.assign(v.data(), v.size()); }
    void visit_string(std::string&& v) override { out_ = std::move(v); }

private:
    std::string& out_;
};

class ByteBufVisitor : public Visitor {
public:
    explicit ByteBufVisitor(Bytes& out) : out_(out) {}

    std::string expecting() const override { return "byte array"; }

    void visit_bytes(const Bytes& v) override { out_ = v; }
    void visit_byte_buf(Bytes&& v) override { out_ = std::move(v); }

    void visit_str(std::string_view v) override { out_.assign(v.begin(), v.end()); }

    // A JSON array of small integers
    void visit_seq(SeqAccess& seq) override {
        out_.clear();
        for (;;) {
            std::uint8_t byte = 0;
            TypedSeed<std::uint8_t> seed(byte);
            if (!seq.next_element_seed(seed)) {
                break;
            }
            out_.push_back(byte);
        }
    }

private:
    Bytes& out_;
};

class UnitVisitor : public Visitor {
public:
    std::string expecting() const override { return "unit"; }

    void visit_unit() override {}
};

class IgnoredAnyVisitor : public Visitor {
public:
    std::string expecting() const override { return "anything at all"; }

    void visit_bool(bool) override {}
    void visit_i64(std::int64_t) override {}
    void visit_u64(std::uint64_t) override {}
    void visit_f64(double) override {}
    void visit_str(std::string_view) override {}
    void visit_bytes(const Bytes&) override {}
    void visit_none() override {}
    void visit_unit() override {}

    void visit_some(Deserializer& deserializer) override {
        IgnoredAny ignored;
        Deserialize<IgnoredAny>::deserialize(deserializer, ignored);
    }

    void visit_newtype_struct(Deserializer& deserializer) override {
        IgnoredAny ignored;
        Deserialize<IgnoredAny>::deserialize(deserializer, ignored);
    }

    void visit_seq(SeqAccess& seq) override {
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        while (seq.next_element_seed(seed)) {
        }
    }

    void visit_map(MapAccess& map) override {
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        while (map.next_key_seed(seed)) {
            map.next_value_seed(seed);
        }
    }

    void visit_enum(EnumAccess& data) override {
        IgnoredAny ignored;
        TypedSeed<IgnoredAny> seed(ignored);
        data.variant_seed(seed).newtype_variant_seed(seed);
    }
};

} // anonymous namespace

// ============================================================================
// Specializations
// ============================================================================

void Deserialize<bool>::deserialize(Deserializer& deserializer, bool& out) {
    BoolVisitor visitor(out);
    deserializer.deserialize_bool(visitor);
}

void Deserialize<std::int8_t>::deserialize(Deserializer& deserializer, std::int8_t& out) {
    IntVisitor<std::int8_t> visitor(out, "i8");
    deserializer.deserialize_i8(visitor);
}

void Deserialize<std::int16_t>::deserialize(Deserializer& deserializer, std::int16_t& out) {
    IntVisitor<std::int16_t> visitor(out, "i16");
    deserializer.deserialize_i16(visitor);
}

void Deserialize<std::int32_t>::deserialize(Deserializer& deserializer, std::int32_t& out) {
    IntVisitor<std::int32_t> visitor(out, "i32");
    deserializer.deserialize_i32(visitor);
}

void Deserialize<std::int64_t>::deserialize(Deserializer& deserializer, std::int64_t& out) {
    IntVisitor<std::int64_t> visitor(out, "i64");
    deserializer.deserialize_i64(visitor);
}

void Deserialize<std::uint8_t>::deserialize(Deserializer& deserializer, std::uint8_t& out) {
    IntVisitor<std::uint8_t> visitor(out, "u8");
    deserializer.deserialize_u8(visitor);
}

void Deserialize<std::uint16_t>::deserialize(Deserializer& deserializer, std::uint16_t& out) {
    IntVisitor<std::uint16_t> visitor(out, "u16");
    deserializer.deserialize_u16(visitor);
}

void Deserialize<std::uint32_t>::deserialize(Deserializer& deserializer, std::uint32_t& out) {
    IntVisitor<std::uint32_t> visitor(out, "u32");
    deserializer.deserialize_u32(visitor);
}

void Deserialize<std::uint64_t>::deserialize(Deserializer& deserializer, std::uint64_t& out) {
    IntVisitor<std::uint64_t> visitor(out, "u64");
    deserializer.deserialize_u64(visitor);
}

void Deserialize<float>::deserialize(Deserializer& deserializer, float& out) {
    FloatVisitor<float> visitor(out, "f32");
    deserializer.deserialize_f32(visitor);
}

void Deserialize<double>::deserialize(Deserializer& deserializer, double& out) {
    FloatVisitor<double> visitor(out, "f64");
    deserializer.deserialize_f64(visitor);
}

void Deserialize<char>::deserialize(Deserializer& deserializer, char& out) {
    CharVisitor visitor(out);
    deserializer.deserialize_char(visitor);
}

void Deserialize<std::string>::deserialize(Deserializer& deserializer, std::string& out) {
    StringVisitor visitor(out);
    deserializer.deserialize_string(visitor);
}

void Deserialize<ByteBuf>::deserialize(Deserializer& deserializer, ByteBuf& out) {
    ByteBufVisitor visitor(out.bytes);
    deserializer.deserialize_byte_buf(visitor);
}

void Deserialize<Unit>::deserialize(Deserializer& deserializer, Unit&) {
    UnitVisitor visitor;
    deserializer.deserialize_unit(visitor);
}

void Deserialize<IgnoredAny>::deserialize(Deserializer& deserializer, IgnoredAny&) {
    IgnoredAnyVisitor visitor;
    deserializer.deserialize_ignored_any(visitor);
}

} // namespace locus
