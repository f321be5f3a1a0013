/**
 * @file Deserializer.cpp
 * @brief Default Visitor callbacks
 */

#include "locus/Deserializer.hpp"
#include "locus/Errors.hpp"

namespace locus {

std::string utf8_encode(char32_t c) {
    std::string out;
    if (c < 0x80) {
        out += static_cast<char>(c);
    } else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
    return out;
}

void Visitor::visit_bool(bool v) {
    throw DecodeError::invalid_type(Unexpected::boolean(v), expecting());
}

void Visitor::visit_i8(std::int8_t v) { visit_i64(v); }
void Visitor::visit_i16(std::int16_t v) { visit_i64(v); }
void Visitor::visit_i32(std::int32_t v) { visit_i64(v); }

void Visitor::visit_i64(std::int64_t v) {
    throw DecodeError::invalid_type(Unexpected::signed_integer(v), expecting());
}

void Visitor::visit_u8(std::uint8_t v) { visit_u64(v); }
void Visitor::visit_u16(std::uint16_t v) { visit_u64(v); }
void Visitor::visit_u32(std::uint32_t v) { visit_u64(v); }

void Visitor::visit_u64(std::uint64_t v) {
    throw DecodeError::invalid_type(Unexpected::unsigned_integer(v), expecting());
}

void Visitor::visit_f32(float v) { visit_f64(v); }

void Visitor::visit_f64(double v) {
    throw DecodeError::invalid_type(Unexpected::floating(v), expecting());
}

void Visitor::visit_char(char32_t v) {
    const std::string text = utf8_encode(v);
    visit_str(text);
}

void Visitor::visit_str(std::string_view v) {
    throw DecodeError::invalid_type(Unexpected::str(v), expecting());
}

void Visitor::visit_borrowed_str(std::string_view v) { visit_str(v); }
void Visitor::visit_string(std::string&& v) { visit_str(v); }

void Visitor::visit_bytes(const Bytes&) {
    throw DecodeError::invalid_type(Unexpected::bytes(), expecting());
}

void Visitor::visit_borrowed_bytes(const Bytes& v) { visit_bytes(v); }
void Visitor::visit_byte_buf(Bytes&& v) { visit_bytes(v); }

void Visitor::visit_none() {
    throw DecodeError::invalid_type(Unexpected::option(), expecting());
}

void Visitor::visit_some(Deserializer&) {
    throw DecodeError::invalid_type(Unexpected::option(), expecting());
}

void Visitor::visit_unit() {
    throw DecodeError::invalid_type(Unexpected::unit(), expecting());
}

void Visitor::visit_newtype_struct(Deserializer&) {
    throw DecodeError::invalid_type(Unexpected::newtype_struct(), expecting());
}

void Visitor::visit_seq(SeqAccess&) {
    throw DecodeError::invalid_type(Unexpected::sequence(), expecting());
}

void Visitor::visit_map(MapAccess&) {
    throw DecodeError::invalid_type(Unexpected::map(), expecting());
}

void Visitor::visit_enum(EnumAccess&) {
    throw DecodeError::invalid_type(Unexpected::enumeration(), expecting());
}

} // namespace locus
