/**
 * @file TrackingVisitor.hpp
 * @brief Visitor wrapper that carries the current location into nested values
 *
 * Scalar callbacks are leaves and are forwarded verbatim. Composite callbacks
 * wrap what they hand on (nested deserializer, SeqAccess, MapAccess,
 * EnumAccess) so that the nested value is decoded one Chain link deeper.
 */

#ifndef LOCUS_TRACKINGVISITOR_HPP
#define LOCUS_TRACKINGVISITOR_HPP

#include "locus/Chain.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Track.hpp"

#include <string>
#include <utility>

namespace locus {

class TrackingVisitor : public Visitor {
public:
    /**
     * @param delegate Visitor to forward to
     * @param chain Location of the value being visited; must outlive this
     * @param track Failure record
     */
    TrackingVisitor(Visitor& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

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
    void visit_str(std::string_view v) override { delegate_.visit_str(v); }
    void visit_borrowed_str(std::string_view v) override { delegate_.visit_borrowed_str(v); }
    void visit_string(std::string&& v) override { delegate_.visit_string(std::move(v)); }
    void visit_bytes(const Bytes& v) override { delegate_.visit_bytes(v); }
    void visit_borrowed_bytes(const Bytes& v) override { delegate_.visit_borrowed_bytes(v); }
    void visit_byte_buf(Bytes&& v) override { delegate_.visit_byte_buf(std::move(v)); }
    void visit_none() override { delegate_.visit_none(); }
    void visit_unit() override { delegate_.visit_unit(); }

    void visit_some(Deserializer& deserializer) override;
    void visit_newtype_struct(Deserializer& deserializer) override;
    void visit_seq(SeqAccess& seq) override;

    /**
     * @brief Decode a map or struct with each value located under its key
     *
     * A "missing field" DecodeError raised by the struct itself is located
     * at the missing field's position among its siblings.
     */
    void visit_map(MapAccess& map) override;

    void visit_enum(EnumAccess& data) override;

private:
    Visitor& delegate_;
    const Chain& chain_;
    Track& track_;
};

} // namespace locus

#endif // LOCUS_TRACKINGVISITOR_HPP
