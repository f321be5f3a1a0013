/**
 * @file Deserializer.hpp
 * @brief Visitor-driven decoding interfaces
 *
 * A Deserializer (the backend) walks serialized input. The value being
 * reconstructed asks for a representation ("a u32", "a struct with these
 * fields", ...) by calling the matching deserialize_* method with a Visitor.
 * The backend classifies the next value and calls back exactly one visit_*
 * method. Composite values hand the visitor an accessor (SeqAccess,
 * MapAccess, EnumAccess) through which it pulls nested values with Seeds.
 *
 * Visitors and seeds store their result in a target they were constructed
 * with. Failures are reported by throwing DecodeError.
 *
 * Accessors, nested deserializers and visitors are only valid for the
 * duration of the call they are passed to.
 */

#ifndef LOCUS_DESERIALIZER_HPP
#define LOCUS_DESERIALIZER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace locus {

class Deserializer;
class SeqAccess;
class MapAccess;
class EnumAccess;

/// Byte-string payload
using Bytes = std::vector<std::uint8_t>;

/// Static list of struct field or enum variant names
using Names = std::vector<std::string_view>;

/// Encode a Unicode scalar value as UTF-8
std::string utf8_encode(char32_t c);

/**
 * @brief Callbacks invoked by a Deserializer once it knows the value's shape
 *
 * Defaults mirror a widening data model: narrow integers are forwarded to
 * visit_i64()/visit_u64(), f32 to visit_f64(), characters and owned or
 * borrowed strings to visit_str(), and owned or borrowed bytes to
 * visit_bytes(). The remaining defaults throw DecodeError::invalid_type
 * naming expecting().
 */
class Visitor {
public:
    virtual ~Visitor() = default;

    /// What this visitor expects, used in error messages (e.g. "u32")
    virtual std::string expecting() const = 0;

    virtual void visit_bool(bool v);

    virtual void visit_i8(std::int8_t v);
    virtual void visit_i16(std::int16_t v);
    virtual void visit_i32(std::int32_t v);
    virtual void visit_i64(std::int64_t v);

    virtual void visit_u8(std::uint8_t v);
    virtual void visit_u16(std::uint16_t v);
    virtual void visit_u32(std::uint32_t v);
    virtual void visit_u64(std::uint64_t v);

    virtual void visit_f32(float v);
    virtual void visit_f64(double v);

    virtual void visit_char(char32_t v);

    /// Transient string, only valid during the call
    virtual void visit_str(std::string_view v);
    /// String that outlives the decode (points into the input)
    virtual void visit_borrowed_str(std::string_view v);
    /// Owned string the visitor may take
    virtual void visit_string(std::string&& v);

    virtual void visit_bytes(const Bytes& v);
    virtual void visit_borrowed_bytes(const Bytes& v);
    virtual void visit_byte_buf(Bytes&& v);

    virtual void visit_none();
    virtual void visit_some(Deserializer& deserializer);

    virtual void visit_unit();

    virtual void visit_newtype_struct(Deserializer& deserializer);

    virtual void visit_seq(SeqAccess& seq);
    virtual void visit_map(MapAccess& map);
    virtual void visit_enum(EnumAccess& data);
};

/**
 * @brief A decode step with context, writing into its own target
 *
 * Used for sequence elements, map keys and values, enum variant
 * identifiers and newtype variant payloads.
 */
class Seed {
public:
    virtual ~Seed() = default;

    virtual void deserialize(Deserializer& deserializer) = 0;
};

/**
 * @brief Format backend: one request per representation
 */
class Deserializer {
public:
    virtual ~Deserializer() = default;

    /// Let the backend pick the callback from the input itself
    virtual void deserialize_any(Visitor& visitor) = 0;

    virtual void deserialize_bool(Visitor& visitor) = 0;

    virtual void deserialize_i8(Visitor& visitor) = 0;
    virtual void deserialize_i16(Visitor& visitor) = 0;
    virtual void deserialize_i32(Visitor& visitor) = 0;
    virtual void deserialize_i64(Visitor& visitor) = 0;

    virtual void deserialize_u8(Visitor& visitor) = 0;
    virtual void deserialize_u16(Visitor& visitor) = 0;
    virtual void deserialize_u32(Visitor& visitor) = 0;
    virtual void deserialize_u64(Visitor& visitor) = 0;

    virtual void deserialize_f32(Visitor& visitor) = 0;
    virtual void deserialize_f64(Visitor& visitor) = 0;

    virtual void deserialize_char(Visitor& visitor) = 0;
    virtual void deserialize_str(Visitor& visitor) = 0;
    virtual void deserialize_string(Visitor& visitor) = 0;

    virtual void deserialize_bytes(Visitor& visitor) = 0;
    virtual void deserialize_byte_buf(Visitor& visitor) = 0;

    virtual void deserialize_option(Visitor& visitor) = 0;

    virtual void deserialize_unit(Visitor& visitor) = 0;
    virtual void deserialize_unit_struct(std::string_view name, Visitor& visitor) = 0;
    virtual void deserialize_newtype_struct(std::string_view name, Visitor& visitor) = 0;

    virtual void deserialize_seq(Visitor& visitor) = 0;
    virtual void deserialize_tuple(std::size_t len, Visitor& visitor) = 0;
    virtual void deserialize_tuple_struct(std::string_view name, std::size_t len,
                                          Visitor& visitor) = 0;

    virtual void deserialize_map(Visitor& visitor) = 0;
    virtual void deserialize_struct(std::string_view name, const Names& fields,
                                    Visitor& visitor) = 0;

    virtual void deserialize_enum(std::string_view name, const Names& variants,
                                  Visitor& visitor) = 0;

    /// Struct field or enum variant name
    virtual void deserialize_identifier(Visitor& visitor) = 0;

    /// Value whose content is skipped
    virtual void deserialize_ignored_any(Visitor& visitor) = 0;
};

/**
 * @brief Element iteration for sequences and tuples
 */
class SeqAccess {
public:
    virtual ~SeqAccess() = default;

    /**
     * @brief Decode the next element with @p seed
     * @return false if the sequence is exhausted (seed not called)
     */
    virtual bool next_element_seed(Seed& seed) = 0;

    /// Remaining element count, if known
    virtual std::optional<std::size_t> size_hint() const { return std::nullopt; }
};

/**
 * @brief Key/value iteration for maps and structs
 *
 * Calls alternate: next_key_seed(), then next_value_seed() for that key.
 */
class MapAccess {
public:
    virtual ~MapAccess() = default;

    /**
     * @brief Decode the next key with @p seed
     * @return false if the map is exhausted (seed not called)
     */
    virtual bool next_key_seed(Seed& seed) = 0;

    /// Decode the value belonging to the last key
    virtual void next_value_seed(Seed& seed) = 0;

    /// Remaining entry count, if known
    virtual std::optional<std::size_t> size_hint() const { return std::nullopt; }

    /**
     * @brief Decode content buffered out of this map with @p seed
     *
     * Visitors that must inspect a tag before they know how to decode the
     * rest (tagged enums) buffer entries into a Value and decode them
     * afterwards from a ValueDeserializer. Passing that deserializer through
     * here lets wrappers treat the replayed content as living at this map's
     * location.
     */
    virtual void replay_seed(Seed& seed, Deserializer& content) { seed.deserialize(content); }

    /// Like replay_seed(), for a value buffered from the entry named @p key
    virtual void replay_entry_seed(std::string_view key, Seed& seed, Deserializer& content) {
        static_cast<void>(key);
        seed.deserialize(content);
    }
};

/**
 * @brief Payload access for the variant selected by EnumAccess
 */
class VariantAccess {
public:
    virtual ~VariantAccess() = default;

    virtual void unit_variant() = 0;
    virtual void newtype_variant_seed(Seed& seed) = 0;
    virtual void tuple_variant(std::size_t len, Visitor& visitor) = 0;
    virtual void struct_variant(const Names& fields, Visitor& visitor) = 0;
};

/**
 * @brief Variant selection for enums
 */
class EnumAccess {
public:
    virtual ~EnumAccess() = default;

    /**
     * @brief Decode the variant identifier with @p seed
     * @return Access to the payload; valid as long as this EnumAccess
     */
    virtual VariantAccess& variant_seed(Seed& seed) = 0;
};

} // namespace locus

#endif // LOCUS_DESERIALIZER_HPP
