/**
 * @file TrackingDeserializer.hpp
 * @brief Entry point: a Deserializer that records the path to decode errors
 *
 * Wraps any backend Deserializer and can be used anywhere the backend could.
 * Each request is forwarded to the backend with the visitor wrapped in a
 * TrackingVisitor; nested values are wrapped in turn, each with one more
 * Chain link. If the request throws, the current location is recorded in
 * the Track (unless a deeper layer already recorded one) and the exception
 * is rethrown unchanged.
 *
 * Example:
 * ```cpp
 * locus::Value doc = locus::parse_json(R"({"dependencies":{"serde":{"version":1}}})");
 * locus::ValueDeserializer backend(doc);
 * locus::Track track;
 * locus::TrackingDeserializer tracked(backend, track);
 * Package pkg;
 * try {
 *     locus::Deserialize<Package>::deserialize(tracked, pkg);
 * } catch (const locus::DecodeError&) {
 *     std::move(track).path().to_string();  // "dependencies.serde.version"
 * }
 * ```
 */

#ifndef LOCUS_TRACKINGDESERIALIZER_HPP
#define LOCUS_TRACKINGDESERIALIZER_HPP

#include "locus/Chain.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Track.hpp"

namespace locus {

class TrackingDeserializer : public Deserializer {
public:
    /**
     * @brief Wrap @p delegate at the document root
     * @param delegate Backend to forward to
     * @param track Receives the failure location; must outlive the decode
     */
    TrackingDeserializer(Deserializer& delegate, Track& track)
        : delegate_(delegate), chain_(Chain::root()), track_(track) {}

    /**
     * @brief Wrap @p delegate for a nested value located at @p chain
     */
    TrackingDeserializer(Deserializer& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

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

    const Chain& chain() const noexcept { return chain_; }

private:
    Deserializer& delegate_;
    Chain chain_;
    Track& track_;
};

} // namespace locus

#endif // LOCUS_TRACKINGDESERIALIZER_HPP
