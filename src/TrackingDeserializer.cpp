/**
 * @file TrackingDeserializer.cpp
 * @brief Forward every request with a tracking visitor
 *
 * A failure is recorded with the chain of this deserializer itself, not an
 * extended one: whatever failed here failed at this location.
 */

#include "locus/TrackingDeserializer.hpp"
#include "locus/TrackingVisitor.hpp"

namespace locus {

void TrackingDeserializer::deserialize_any(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_any(wrap); });
}

void TrackingDeserializer::deserialize_bool(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_bool(wrap); });
}

void TrackingDeserializer::deserialize_i8(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_i8(wrap); });
}

void TrackingDeserializer::deserialize_i16(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_i16(wrap); });
}

void TrackingDeserializer::deserialize_i32(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_i32(wrap); });
}

void TrackingDeserializer::deserialize_i64(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_i64(wrap); });
}

void TrackingDeserializer::deserialize_u8(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_u8(wrap); });
}

void TrackingDeserializer::deserialize_u16(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_u16(wrap); });
}

void TrackingDeserializer::deserialize_u32(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_u32(wrap); });
}

void TrackingDeserializer::deserialize_u64(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_u64(wrap); });
}

void TrackingDeserializer::deserialize_f32(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_f32(wrap); });
}

void TrackingDeserializer::deserialize_f64(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_f64(wrap); });
}

void TrackingDeserializer::deserialize_char(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_char(wrap); });
}

void TrackingDeserializer::deserialize_str(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_str(wrap); });
}

void TrackingDeserializer::deserialize_string(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_string(wrap); });
}

void TrackingDeserializer::deserialize_bytes(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_bytes(wrap); });
}

void TrackingDeserializer::deserialize_byte_buf(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_byte_buf(wrap); });
}

void TrackingDeserializer::deserialize_option(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_option(wrap); });
}

void TrackingDeserializer::deserialize_unit(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_unit(wrap); });
}

void TrackingDeserializer::deserialize_unit_struct(std::string_view name, Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_unit_struct(name, wrap); });
}

void TrackingDeserializer::deserialize_newtype_struct(std::string_view name, Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_newtype_struct(name, wrap); });
}

void TrackingDeserializer::deserialize_seq(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_seq(wrap); });
}

void TrackingDeserializer::deserialize_tuple(std::size_t len, Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_tuple(len, wrap); });
}

void TrackingDeserializer::deserialize_tuple_struct(std::string_view name, std::size_t len,
                                                    Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_tuple_struct(name, len, wrap); });
}

void TrackingDeserializer::deserialize_map(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_map(wrap); });
}

void TrackingDeserializer::deserialize_struct(std::string_view name, const Names& fields,
                                              Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_struct(name, fields, wrap); });
}

void TrackingDeserializer::deserialize_enum(std::string_view name, const Names& variants,
                                            Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_enum(name, variants, wrap); });
}

void TrackingDeserializer::deserialize_identifier(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_identifier(wrap); });
}

void TrackingDeserializer::deserialize_ignored_any(Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize_ignored_any(wrap); });
}

} // namespace locus
