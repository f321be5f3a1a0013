/**
 * @file ValueDeserializer.cpp
 * @brief Value backend: deserializer, accessors and map key handling
 */

#include "locus/ValueDeserializer.hpp"

#include <iterator>
#include <regex>
#include <string>
#include <utility>

namespace locus {

Unexpected unexpected_of(const Value& value) {
    switch (value.type()) {
    case Value::value_t::null:
        return Unexpected::unit();
    case Value::value_t::boolean:
        return Unexpected::boolean(value.get<bool>());
    case Value::value_t::number_integer:
        return Unexpected::signed_integer(value.get<std::int64_t>());
    case Value::value_t::number_unsigned:
        return Unexpected::unsigned_integer(value.get<std::uint64_t>());
    case Value::value_t::number_float:
        return Unexpected::floating(value.get<double>());
    case Value::value_t::string:
        return Unexpected::str(value.get_ref<const std::string&>());
    case Value::value_t::array:
        return Unexpected::sequence();
    case Value::value_t::object:
        return Unexpected::map();
    case Value::value_t::binary:
        return Unexpected::bytes();
    default:
        return Unexpected::other(type_name(value));
    }
}

namespace {

void visit_number(const Value& number, Visitor& visitor) {
    if (number.is_number_unsigned()) {
        visitor.visit_u64(number.get<std::uint64_t>());
    } else if (number.is_number_integer()) {
        visitor.visit_i64(number.get<std::int64_t>());
    } else {
        visitor.visit_f64(number.get<double>());
    }
}

// ============================================================================
// Sequences
// ============================================================================

class ValueSeqAccess : public SeqAccess {
public:
    explicit ValueSeqAccess(const Value& array) : array_(array) {}

    bool next_element_seed(Seed& seed) override {
        if (index_ >= array_.size()) {
            return false;
        }
        ValueDeserializer element(array_[index_]);
        ++index_;
        seed.deserialize(element);
        return true;
    }

    std::optional<std::size_t> size_hint() const override { return remaining(); }

    std::size_t remaining() const { return array_.size() - index_; }

private:
    const Value& array_;
    std::size_t index_ = 0;
};

void visit_array(const Value& array, Visitor& visitor) {
    ValueSeqAccess seq(array);
    visitor.visit_seq(seq);
    if (seq.remaining() != 0) {
        throw DecodeError::invalid_length(array.size(), "fewer elements in array");
    }
}

// ============================================================================
// Map keys
// ============================================================================

/// Parse key text as a JSON number, as produced by integer-keyed maps
Value parse_numeric_key(std::string_view key) {
    static const std::regex pattern("^-?[0-9]+(\\.[0-9]+)?([eE][+-]?[0-9]+)?$");
    if (std::regex_match(key.begin(), key.end(), pattern)) {
        try {
            Value number = Value::parse(key.begin(), key.end());
            if (number.is_number()) {
                return number;
            }
        } catch (const Value::parse_error&) {
            // Not a valid JSON number (e.g. leading zeros)
        }
    }
    throw DecodeError::custom("expected numeric key, found `" + std::string(key) + "`");
}

/// Access for an enum named by a key: only unit variants
class KeyVariantAccess : public VariantAccess {
public:
    void unit_variant() override {}

    void newtype_variant_seed(Seed&) override {
        throw DecodeError::invalid_type(Unexpected::unit_variant(), "newtype variant");
    }

    void tuple_variant(std::size_t, Visitor&) override {
        throw DecodeError::invalid_type(Unexpected::unit_variant(), "tuple variant");
    }

    void struct_variant(const Names&, Visitor&) override {
        throw DecodeError::invalid_type(Unexpected::unit_variant(), "struct variant");
    }
};

class MapKeyDeserializer : public Deserializer {
public:
    explicit MapKeyDeserializer(std::string_view key) : key_(key) {}

    void deserialize_any(Visitor& visitor) override { visitor.visit_borrowed_str(key_); }

    void deserialize_bool(Visitor& visitor) override {
        if (key_ == "true") {
            visitor.visit_bool(true);
        } else if (key_ == "false") {
            visitor.visit_bool(false);
        } else {
            visitor.visit_borrowed_str(key_);
        }
    }

    void deserialize_i8(Visitor& visitor) override { numeric(visitor); }
    void deserialize_i16(Visitor& visitor) override { numeric(visitor); }
    void deserialize_i32(Visitor& visitor) override { numeric(visitor); }
    void deserialize_i64(Visitor& visitor) override { numeric(visitor); }
    void deserialize_u8(Visitor& visitor) override { numeric(visitor); }
    void deserialize_u16(Visitor& visitor) override { numeric(visitor); }
    void deserialize_u32(Visitor& visitor) override { numeric(visitor); }
    void deserialize_u64(Visitor& visitor) override { numeric(visitor); }
    void deserialize_f32(Visitor& visitor) override { numeric(visitor); }
    void deserialize_f64(Visitor& visitor) override { numeric(visitor); }

    void deserialize_char(Visitor& visitor) override { deserialize_any(visitor); }
    void deserialize_str(Visitor& visitor) override { deserialize_any(visitor); }
    void deserialize_string(Visitor& visitor) override { deserialize_any(visitor); }
    void deserialize_bytes(Visitor& visitor) override { deserialize_any(visitor); }
    void deserialize_byte_buf(Visitor& visitor) override { deserialize_any(visitor); }

    void deserialize_option(Visitor& visitor) override { visitor.visit_some(*this); }

    void deserialize_unit(Visitor& visitor) override { deserialize_any(visitor); }

    void deserialize_unit_struct(std::string_view, Visitor& visitor) override {
        deserialize_any(visitor);
    }

    void deserialize_newtype_struct(std::string_view, Visitor& visitor) override {
        visitor.visit_newtype_struct(*this);
    }

    void deserialize_seq(Visitor& visitor) override { deserialize_any(visitor); }

    void deserialize_tuple(std::size_t, Visitor& visitor) override { deserialize_any(visitor); }

    void deserialize_tuple_struct(std::string_view, std::size_t, Visitor& visitor) override {
        deserialize_any(visitor);
    }

    void deserialize_map(Visitor& visitor) override { deserialize_any(visitor); }

    void deserialize_struct(std::string_view, const Names&, Visitor& visitor) override {
        deserialize_any(visitor);
    }

    void deserialize_enum(std::string_view, const Names&, Visitor& visitor) override;

    void deserialize_identifier(Visitor& visitor) override { deserialize_any(visitor); }
    void deserialize_ignored_any(Visitor& visitor) override { deserialize_any(visitor); }

private:
    void numeric(Visitor& visitor) { visit_number(parse_numeric_key(key_), visitor); }

    std::string_view key_;
};

class KeyEnumAccess : public EnumAccess {
public:
    explicit KeyEnumAccess(std::string_view key) : key_(key) {}

    VariantAccess& variant_seed(Seed& seed) override {
        MapKeyDeserializer variant(key_);
        seed.deserialize(variant);
        return access_;
    }

private:
    std::string_view key_;
    KeyVariantAccess access_;
};

void MapKeyDeserializer::deserialize_enum(std::string_view, const Names&, Visitor& visitor) {
    KeyEnumAccess access(key_);
    visitor.visit_enum(access);
}

// ============================================================================
// Maps
// ============================================================================

class ValueMapAccess : public MapAccess {
public:
    explicit ValueMapAccess(const Value& object) : it_(object.begin()), end_(object.end()) {}

    bool next_key_seed(Seed& seed) override {
        if (it_ == end_) {
            return false;
        }
        const std::string& key = it_.key();
        pending_ = &it_.value();
        ++it_;
        MapKeyDeserializer deserializer(key);
        seed.deserialize(deserializer);
        return true;
    }

    void next_value_seed(Seed& seed) override {
        if (pending_ == nullptr) {
            throw DecodeError::custom("value is missing");
        }
        ValueDeserializer deserializer(*pending_);
        pending_ = nullptr;
        seed.deserialize(deserializer);
    }

    std::optional<std::size_t> size_hint() const override { return remaining(); }

    std::size_t remaining() const { return static_cast<std::size_t>(std::distance(it_, end_)); }

private:
    Value::const_iterator it_;
    Value::const_iterator end_;
    const Value* pending_ = nullptr;
};

void visit_object(const Value& object, Visitor& visitor) {
    ValueMapAccess map(object);
    visitor.visit_map(map);
    if (map.remaining() != 0) {
        throw DecodeError::invalid_length(object.size(), "fewer elements in map");
    }
}

// ============================================================================
// Enums
// ============================================================================

class ValueVariantAccess : public VariantAccess {
public:
    explicit ValueVariantAccess(const Value* payload) : payload_(payload) {}

    void unit_variant() override {
        if (payload_ != nullptr && !payload_->is_null()) {
            throw DecodeError::invalid_type(unexpected_of(*payload_), "unit variant");
        }
    }

    void newtype_variant_seed(Seed& seed) override {
        if (payload_ == nullptr) {
            throw DecodeError::invalid_type(Unexpected::unit_variant(), "newtype variant");
        }
        ValueDeserializer deserializer(*payload_);
        seed.deserialize(deserializer);
    }

    void tuple_variant(std::size_t, Visitor& visitor) override {
        if (payload_ == nullptr) {
            throw DecodeError::invalid_type(Unexpected::unit_variant(), "tuple variant");
        }
        if (!payload_->is_array()) {
            throw DecodeError::invalid_type(unexpected_of(*payload_), "tuple variant");
        }
        visit_array(*payload_, visitor);
    }

    void struct_variant(const Names&, Visitor& visitor) override {
        if (payload_ == nullptr) {
            throw DecodeError::invalid_type(Unexpected::unit_variant(), "struct variant");
        }
        if (payload_->is_object()) {
            visit_object(*payload_, visitor);
        } else if (payload_->is_array()) {
            visit_array(*payload_, visitor);
        } else {
            throw DecodeError::invalid_type(unexpected_of(*payload_), "struct variant");
        }
    }

private:
    const Value* payload_;
};

class ValueEnumAccess : public EnumAccess {
public:
    ValueEnumAccess(std::string_view variant, const Value* payload)
        : variant_(variant), access_(payload) {}

    VariantAccess& variant_seed(Seed& seed) override {
        MapKeyDeserializer variant(variant_);
        seed.deserialize(variant);
        return access_;
    }

private:
    std::string_view variant_;
    ValueVariantAccess access_;
};

// ============================================================================
// Buffering into a Value
// ============================================================================

class ValueVisitor : public Visitor {
public:
    explicit ValueVisitor(Value& out) : out_(out) {}

    std::string expecting() const override { return "any valid JSON value"; }

    void visit_bool(bool v) override { out_ = v; }
    void visit_i64(std::int64_t v) override { out_ = v; }
    void visit_u64(std::uint64_t v) override { out_ = v; }
    void visit_f64(double v) override { out_ = v; }
    void visit_str(std::string_view v) override { out_ = std::string(v); }
    void visit_string(std::string&& v) override { out_ = std::move(v); }
    void visit_bytes(const Bytes& v) override { out_ = Value::binary(v); }

    void visit_none() override { out_ = nullptr; }
    void visit_unit() override { out_ = nullptr; }

    void visit_some(Deserializer& deserializer) override {
        Deserialize<Value>::deserialize(deserializer, out_);
    }

    void visit_newtype_struct(Deserializer& deserializer) override {
        Deserialize<Value>::deserialize(deserializer, out_);
    }

    void visit_seq(SeqAccess& seq) override {
        out_ = Value::array();
        for (;;) {
            Value element;
            TypedSeed<Value> seed(element);
            if (!seq.next_element_seed(seed)) {
                break;
            }
            out_.push_back(std::move(element));
        }
    }

    void visit_map(MapAccess& map) override {
        out_ = Value::object();
        for (;;) {
            std::string key;
            TypedSeed<std::string> key_seed(key);
            if (!map.next_key_seed(key_seed)) {
                break;
            }
            Value value;
            TypedSeed<Value> value_seed(value);
            map.next_value_seed(value_seed);
            out_[key] = std::move(value);
        }
    }

private:
    Value& out_;
};

} // anonymous namespace

// ============================================================================
// ValueDeserializer
// ============================================================================

void ValueDeserializer::deserialize_any(Visitor& visitor) {
    switch (value_.type()) {
    case Value::value_t::null:
        visitor.visit_unit();
        break;
    case Value::value_t::boolean:
        visitor.visit_bool(value_.get<bool>());
        break;
    case Value::value_t::number_integer:
    case Value::value_t::number_unsigned:
    case Value::value_t::number_float:
        visit_number(value_, visitor);
        break;
    case Value::value_t::string:
        visitor.visit_borrowed_str(value_.get_ref<const std::string&>());
        break;
    case Value::value_t::array:
        visit_array(value_, visitor);
        break;
    case Value::value_t::object:
        visit_object(value_, visitor);
        break;
    case Value::value_t::binary:
        visitor.visit_borrowed_bytes(value_.get_binary());
        break;
    default:
        throw DecodeError::invalid_type(unexpected_of(value_), visitor.expecting());
    }
}

void ValueDeserializer::deserialize_bool(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_i8(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_i16(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_i32(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_i64(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_u8(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_u16(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_u32(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_u64(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_f32(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_f64(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_char(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_str(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_string(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_bytes(Visitor& visitor) { deserialize_any(visitor); }
void ValueDeserializer::deserialize_byte_buf(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_option(Visitor& visitor) {
    if (value_.is_null()) {
        visitor.visit_none();
    } else {
        visitor.visit_some(*this);
    }
}

void ValueDeserializer::deserialize_unit(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_unit_struct(std::string_view, Visitor& visitor) {
    deserialize_any(visitor);
}

void ValueDeserializer::deserialize_newtype_struct(std::string_view, Visitor& visitor) {
    visitor.visit_newtype_struct(*this);
}

void ValueDeserializer::deserialize_seq(Visitor& visitor) {
    if (!value_.is_array()) {
        throw DecodeError::invalid_type(unexpected_of(value_), visitor.expecting());
    }
    visit_array(value_, visitor);
}

void ValueDeserializer::deserialize_tuple(std::size_t, Visitor& visitor) {
    deserialize_seq(visitor);
}

void ValueDeserializer::deserialize_tuple_struct(std::string_view, std::size_t,
                                                 Visitor& visitor) {
    deserialize_seq(visitor);
}

void ValueDeserializer::deserialize_map(Visitor& visitor) {
    if (!value_.is_object()) {
        throw DecodeError::invalid_type(unexpected_of(value_), visitor.expecting());
    }
    visit_object(value_, visitor);
}

void ValueDeserializer::deserialize_struct(std::string_view, const Names&, Visitor& visitor) {
    if (value_.is_array()) {
        visit_array(value_, visitor);
    } else if (value_.is_object()) {
        visit_object(value_, visitor);
    } else {
        throw DecodeError::invalid_type(unexpected_of(value_), visitor.expecting());
    }
}

void ValueDeserializer::deserialize_enum(std::string_view, const Names&, Visitor& visitor) {
    if (value_.is_string()) {
        ValueEnumAccess access(value_.get_ref<const std::string&>(), nullptr);
        visitor.visit_enum(access);
    } else if (value_.is_object()) {
        if (value_.size() != 1) {
            throw DecodeError::invalid_value(Unexpected::map(), "map with a single key");
        }
        const auto entry = value_.begin();
        ValueEnumAccess access(entry.key(), &entry.value());
        visitor.visit_enum(access);
    } else {
        throw DecodeError::invalid_type(unexpected_of(value_), "string or map");
    }
}

void ValueDeserializer::deserialize_identifier(Visitor& visitor) { deserialize_any(visitor); }

void ValueDeserializer::deserialize_ignored_any(Visitor& visitor) { visitor.visit_unit(); }

// ============================================================================
// Deserialize<Value>
// ============================================================================

void Deserialize<Value>::deserialize(Deserializer& deserializer, Value& out) {
    ValueVisitor visitor(out);
    deserializer.deserialize_any(visitor);
}

} // namespace locus
