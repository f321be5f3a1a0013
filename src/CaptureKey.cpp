/**
 * @file CaptureKey.cpp
 * @brief Forwarding implementation of the key-capturing decorators
 */

#include "locus/CaptureKey.hpp"

namespace locus {

void CaptureKeySeed::deserialize(Deserializer& deserializer) {
    CaptureKeyDeserializer capture(deserializer, key_);
    delegate_.deserialize(capture);
}

// ============================================================================
// CaptureKeyDeserializer: every request forwarded with a capturing visitor
// ============================================================================

void CaptureKeyDeserializer::deserialize_any(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_any(capture);
}

void CaptureKeyDeserializer::deserialize_bool(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_bool(capture);
}

void CaptureKeyDeserializer::deserialize_i8(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_i8(capture);
}

void CaptureKeyDeserializer::deserialize_i16(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_i16(capture);
}

void CaptureKeyDeserializer::deserialize_i32(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_i32(capture);
}

void CaptureKeyDeserializer::deserialize_i64(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_i64(capture);
}

void CaptureKeyDeserializer::deserialize_u8(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_u8(capture);
}

void CaptureKeyDeserializer::deserialize_u16(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_u16(capture);
}

void CaptureKeyDeserializer::deserialize_u32(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_u32(capture);
}

void CaptureKeyDeserializer::deserialize_u64(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_u64(capture);
}

void CaptureKeyDeserializer::deserialize_f32(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_f32(capture);
}

void CaptureKeyDeserializer::deserialize_f64(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_f64(capture);
}

void CaptureKeyDeserializer::deserialize_char(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_char(capture);
}

void CaptureKeyDeserializer::deserialize_str(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_str(capture);
}

void CaptureKeyDeserializer::deserialize_string(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_string(capture);
}

void CaptureKeyDeserializer::deserialize_bytes(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_bytes(capture);
}

void CaptureKeyDeserializer::deserialize_byte_buf(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_byte_buf(capture);
}

void CaptureKeyDeserializer::deserialize_option(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_option(capture);
}

void CaptureKeyDeserializer::deserialize_unit(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_unit(capture);
}

void CaptureKeyDeserializer::deserialize_unit_struct(std::string_view name, Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_unit_struct(name, capture);
}

void CaptureKeyDeserializer::deserialize_newtype_struct(std::string_view name, Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_newtype_struct(name, capture);
}

void CaptureKeyDeserializer::deserialize_seq(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_seq(capture);
}

void CaptureKeyDeserializer::deserialize_tuple(std::size_t len, Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_tuple(len, capture);
}

void CaptureKeyDeserializer::deserialize_tuple_struct(std::string_view name, std::size_t len,
                                                      Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_tuple_struct(name, len, capture);
}

void CaptureKeyDeserializer::deserialize_map(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_map(capture);
}

void CaptureKeyDeserializer::deserialize_struct(std::string_view name, const Names& fields,
                                                Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_struct(name, fields, capture);
}

void CaptureKeyDeserializer::deserialize_enum(std::string_view name, const Names& variants,
                                              Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_enum(name, variants, capture);
}

void CaptureKeyDeserializer::deserialize_identifier(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_identifier(capture);
}

void CaptureKeyDeserializer::deserialize_ignored_any(Visitor& visitor) {
    CaptureKeyVisitor capture(visitor, key_);
    delegate_.deserialize_ignored_any(capture);
}

// ============================================================================
// CaptureKeyVisitor: the string callbacks save a copy first
// ============================================================================

void CaptureKeyVisitor::visit_str(std::string_view v) {
    key_ = std::string(v);
    delegate_.visit_str(v);
}

void CaptureKeyVisitor::visit_borrowed_str(std::string_view v) {
    key_ = std::string(v);
    delegate_.visit_borrowed_str(v);
}

void CaptureKeyVisitor::visit_string(std::string&& v) {
    key_ = v;
    delegate_.visit_string(std::move(v));
}

} // namespace locus
