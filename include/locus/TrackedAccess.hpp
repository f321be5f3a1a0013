/**
 * @file TrackedAccess.hpp
 * @brief Tracking wrappers for seeds and the backend's accessors
 *
 * - TrackedSeed: decodes one element/value/payload at a fixed location
 * - TrackingSeqAccess: locates each element by its index
 * - TrackingMapAccess: locates each value by the text of its key
 * - TrackingEnumAccess / TrackingVariantAccess: locate the payload by the
 *   variant name
 */

#ifndef LOCUS_TRACKEDACCESS_HPP
#define LOCUS_TRACKEDACCESS_HPP

#include "locus/Chain.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Track.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace locus {

/**
 * @brief Seed that decodes its value at an already extended location
 */
class TrackedSeed : public Seed {
public:
    TrackedSeed(Seed& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

    void deserialize(Deserializer& deserializer) override;

private:
    Seed& delegate_;
    Chain chain_;
    Track& track_;
};

/**
 * @brief SeqAccess wrapper adding the element index to the location
 *
 * The index advances on every attempt, so reported indices match the
 * position in the input regardless of what the visitor does with elements.
 */
class TrackingSeqAccess : public SeqAccess {
public:
    TrackingSeqAccess(SeqAccess& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

    bool next_element_seed(Seed& seed) override;

    std::optional<std::size_t> size_hint() const override { return delegate_.size_hint(); }

private:
    SeqAccess& delegate_;
    const Chain& chain_;
    std::size_t index_ = 0;
    Track& track_;
};

/**
 * @brief MapAccess wrapper adding the key to the location of each value
 *
 * Keys are captured as text while they decode. A key that is not decoded
 * through a string callback (e.g. an integer key) is located as Unknown.
 * A captured key is used by at most one value.
 */
class TrackingMapAccess : public MapAccess {
public:
    TrackingMapAccess(MapAccess& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

    TrackingMapAccess(const TrackingMapAccess&) = delete;
    TrackingMapAccess& operator=(const TrackingMapAccess&) = delete;

    bool next_key_seed(Seed& seed) override;
    void next_value_seed(Seed& seed) override;

    std::optional<std::size_t> size_hint() const override { return delegate_.size_hint(); }

    /// Replayed content is located at this map itself.
    void replay_seed(Seed& seed, Deserializer& content) override;
    void replay_entry_seed(std::string_view key, Seed& seed, Deserializer& content) override;

private:
    MapAccess& delegate_;
    const Chain& chain_;
    std::optional<std::string> key_;
    Track& track_;
};

/**
 * @brief VariantAccess wrapper decoding the payload at the variant's location
 */
class TrackingVariantAccess : public VariantAccess {
public:
    TrackingVariantAccess(VariantAccess& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

    void unit_variant() override;
    void newtype_variant_seed(Seed& seed) override;
    void tuple_variant(std::size_t len, Visitor& visitor) override;
    void struct_variant(const Names& fields, Visitor& visitor) override;

private:
    VariantAccess& delegate_;
    const Chain& chain_;
    Track& track_;
};

/**
 * @brief EnumAccess wrapper capturing the variant name
 *
 * The returned TrackingVariantAccess, the captured name and the chain built
 * from it are owned by this object.
 */
class TrackingEnumAccess : public EnumAccess {
public:
    TrackingEnumAccess(EnumAccess& delegate, const Chain& chain, Track& track)
        : delegate_(delegate), chain_(chain), track_(track) {}

    TrackingEnumAccess(const TrackingEnumAccess&) = delete;
    TrackingEnumAccess& operator=(const TrackingEnumAccess&) = delete;

    VariantAccess& variant_seed(Seed& seed) override;

private:
    EnumAccess& delegate_;
    const Chain& chain_;
    Track& track_;
    std::optional<std::string> variant_;
    std::optional<Chain> variant_chain_;
    std::optional<TrackingVariantAccess> variant_access_;
};

} // namespace locus

#endif // LOCUS_TRACKEDACCESS_HPP
