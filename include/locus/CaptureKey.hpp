/**
 * @file CaptureKey.hpp
 * @brief Learn the text of a map key or enum variant while it is decoded
 *
 * Everything is forwarded unchanged except visit_str(), visit_borrowed_str()
 * and visit_string(), which also copy the text into the output slot. No
 * location is attached to the key itself; only the value keyed by it is
 * tracked.
 */

#ifndef LOCUS_CAPTUREKEY_HPP
#define LOCUS_CAPTUREKEY_HPP

#include "locus/Deserializer.hpp"

#include <optional>
#include <string>
#include <utility>

namespace locus {

class CaptureKeySeed : public Seed {
public:
    CaptureKeySeed(Seed& delegate, std::optional<std::string>& key)
        : delegate_(delegate), key_(key) {}

    void deserialize(Deserializer& deserializer) override;

private:
    Seed& delegate_;
    std::optional<std::string>& key_;
};

class CaptureKeyDeserializer : public Deserializer {
public:
    CaptureKeyDeserializer(Deserializer& delegate, std::optional<std::string>& key)
        : delegate_(delegate), key_(key) {}

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
    Deserializer& delegate_;
    std::optional<std::string>& key_;
};

class CaptureKeyVisitor : public Visitor {
public:
    CaptureKeyVisitor(Visitor& delegate, std::optional<std::string>& key)
        : delegate_(delegate), key_(key) {}

    std::string expecting() const override { return delegate_.expecting(); }

    void visit_bool(bool v) override { delegate_.visit_bool(v); }
    void visit_i8(std::int8_t v) override { delegate_.visit_i8(v); }
    void visit_i16(std::int16_t v) override { delegate_.visit_i16(v); }
    void visit_i32(std::int32_t v) override { delegate_.visit_i32(v); }
    void visit_i64(std::int64_t v) override { delegate_.visit_i64(v); }
    void visit_u8(std::uint8_t v) override { delegate_.visit_u8(v); }
    void visit_u16(std::uint16_t v) override { delegate_.visit_u16(v); }
    void visit_u32(std::uint32_t v) override { delegate_.visit_u32(v); }
    void visit_u64(std::uint64_t v) override { delegate_.visit_u64(v); }
    void visit_f32(float v) override { delegate_.visit_f32(v); }
    void visit_f64(double v) override { delegate_.visit_f64(v); }
    void visit_char(char32_t v) override { delegate_.visit_char(v); }

    void visit_str(std::string_view v) override;
    void visit_borrowed_str(std::string_view v) override;
    void visit_string(std::string&& v) override;

    void visit_bytes(const Bytes& v) override { delegate_.visit_bytes(v); }
    void visit_borrowed_bytes(const Bytes& v) override { delegate_.visit_borrowed_bytes(v); }
    void visit_byte_buf(Bytes&& v) override { delegate_.visit_byte_buf(std::move(v)); }
    void visit_none() override { delegate_.visit_none(); }
    void visit_some(Deserializer& deserializer) override { delegate_.visit_some(deserializer); }
    void visit_unit() override { delegate_.visit_unit(); }
    void visit_newtype_struct(Deserializer& deserializer) override {
        delegate_.visit_newtype_struct(deserializer);
    }
    void visit_seq(SeqAccess& seq) override { delegate_.visit_seq(seq); }
    void visit_map(MapAccess& map) override { delegate_.visit_map(map); }
    void visit_enum(EnumAccess& data) override { delegate_.visit_enum(data); }

private:
    Visitor& delegate_;
    std::optional<std::string>& key_;
};

} // namespace locus

#endif // LOCUS_CAPTUREKEY_HPP
