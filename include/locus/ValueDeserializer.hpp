/**
 * @file ValueDeserializer.hpp
 * @brief Deserializer backend over an in-memory Value tree
 *
 * Decodes from a parsed JSON/TOML document (locus::Value). Scalars are
 * self-describing: typed requests dispatch on the stored value and the
 * visitor decides whether it accepts it. Strings are handed out borrowed
 * (visit_borrowed_str).
 *
 * Object keys are always text. Integer, float and bool requests on a key
 * parse the key text (`{"1": ...}` decodes as std::map<int, ...>); all other
 * requests receive the key as a borrowed string.
 */

#ifndef LOCUS_VALUEDESERIALIZER_HPP
#define LOCUS_VALUEDESERIALIZER_HPP

#include "locus/Deserialize.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Errors.hpp"
#include "locus/Value.hpp"

#include <cstddef>
#include <string_view>

namespace locus {

/// Describe @p value as an unexpected input for error messages
Unexpected unexpected_of(const Value& value);

class ValueDeserializer : public Deserializer {
public:
    /// @p value must outlive the deserializer
    explicit ValueDeserializer(const Value& value) : value_(value) {}

    void deserialize_any(Visitor& visitor) override;

    void deserialize_bool(Visitor& visitor) override;

    void deserialize_i8(Visitor& visitor) override;
    void deserialize_i16(Visitor& visitor) override;
    void deserialize_i32(Visitor& visitor) override;
    void deserialize_i64(Visitor& visitor) override;

    void deserialize_u8(Visitor& visitor) override;
    void deserialize_u16(Visitor& visitor) override;
    void deserialize_u32(Visitor& visitor) override;
    void deserialize_u64(Visitor& visitor) override;

    void deserialize_f32(Visitor& visitor) override;
    void deserialize_f64(Visitor& visitor) override;

    void deserialize_char(Visitor& visitor) override;
    void deserialize_str(Visitor& visitor) override;
    void deserialize_string(Visitor& visitor) override;

    void deserialize_bytes(Visitor& visitor) override;
    void deserialize_byte_buf(Visitor& visitor) override;

    void deserialize_option(Visitor& visitor) override;

    void deserialize_unit(Visitor& visitor) override;
    void deserialize_unit_struct(std::string_view name, Visitor& visitor) override;
    void deserialize_newtype_struct(std::string_view name, Visitor& visitor) override;

    void deserialize_seq(Visitor& visitor) override;
    void deserialize_tuple(std::size_t len, Visitor& visitor) override;
    void deserialize_tuple_struct(std::string_view name, std::size_t len,
                                  Visitor& visitor) override;

    void deserialize_map(Visitor& visitor) override;
    void deserialize_struct(std::string_view name, const Names& fields,
                            Visitor& visitor) override;

    void deserialize_enum(std::string_view name, const Names& variants,
                          Visitor& visitor) override;

    void deserialize_identifier(Visitor& visitor) override;
    void deserialize_ignored_any(Visitor& visitor) override;

private:
    const Value& value_;
};

/**
 * @brief Decode any self-describing input into a Value
 *
 * Used to buffer content whose interpretation depends on a later entry.
 */
template <>
struct Deserialize<Value> {
    static void deserialize(Deserializer& deserializer, Value& out);
};

} // namespace locus

#endif // LOCUS_VALUEDESERIALIZER_HPP
