/**
 * @file TrackedAccess.cpp
 * @brief Implementation of the tracking seed and accessor wrappers
 */

#include "locus/TrackedAccess.hpp"
#include "locus/CaptureKey.hpp"
#include "locus/TrackingDeserializer.hpp"
#include "locus/TrackingVisitor.hpp"

#include <utility>

namespace locus {

// ============================================================================
// TrackedSeed
// ============================================================================

void TrackedSeed::deserialize(Deserializer& deserializer) {
    TrackingDeserializer wrap(deserializer, chain_, track_);
    track_.guard(chain_, [&] { delegate_.deserialize(wrap); });
}

// ============================================================================
// Sequences
// ============================================================================

bool TrackingSeqAccess::next_element_seed(Seed& seed) {
    const Chain element = Chain::sequence_element(chain_, index_);
    ++index_;
    TrackedSeed tracked(seed, element, track_);
    return track_.guard(chain_, [&] { return delegate_.next_element_seed(tracked); });
}

// ============================================================================
// Maps
// ============================================================================

bool TrackingMapAccess::next_key_seed(Seed& seed) {
    key_.reset();
    CaptureKeySeed capture(seed, key_);
    try {
        return delegate_.next_key_seed(capture);
    } catch (...) {
        // The key itself failed; locate it as well as we can.
        if (key_) {
            track_.trigger(Chain::map_entry(chain_, *key_));
        } else {
            track_.trigger(Chain::unknown_key(chain_));
        }
        key_.reset();
        throw;
    }
}

void TrackingMapAccess::next_value_seed(Seed& seed) {
    std::optional<std::string> key = std::move(key_);
    key_.reset();
    const Chain entry = key ? Chain::map_entry(chain_, *key) : Chain::unknown_key(chain_);
    TrackedSeed tracked(seed, entry, track_);
    track_.guard(chain_, [&] { delegate_.next_value_seed(tracked); });
}

void TrackingMapAccess::replay_seed(Seed& seed, Deserializer& content) {
    TrackingDeserializer wrap(content, chain_, track_);
    track_.guard(chain_, [&] { delegate_.replay_seed(seed, wrap); });
}

void TrackingMapAccess::replay_entry_seed(std::string_view key, Seed& seed,
                                          Deserializer& content) {
    const Chain entry = Chain::map_entry(chain_, key);
    TrackedSeed tracked(seed, entry, track_);
    track_.guard(chain_, [&] { delegate_.replay_entry_seed(key, tracked, content); });
}

// ============================================================================
// Enums
// ============================================================================

VariantAccess& TrackingEnumAccess::variant_seed(Seed& seed) {
    variant_.reset();
    CaptureKeySeed capture(seed, variant_);
    VariantAccess& variant = track_.guard(chain_, [&]() -> VariantAccess& {
        return delegate_.variant_seed(capture);
    });

    if (variant_) {
        variant_chain_.emplace(Chain::enum_variant(chain_, *variant_));
    } else {
        variant_chain_.emplace(Chain::unknown_key(chain_));
    }
    variant_access_.emplace(variant, *variant_chain_, track_);
    return *variant_access_;
}

void TrackingVariantAccess::unit_variant() {
    track_.guard(chain_, [&] { delegate_.unit_variant(); });
}

void TrackingVariantAccess::newtype_variant_seed(Seed& seed) {
    const Chain nested = Chain::newtype_variant_wrapper(chain_);
    TrackedSeed tracked(seed, nested, track_);
    track_.guard(chain_, [&] { delegate_.newtype_variant_seed(tracked); });
}

void TrackingVariantAccess::tuple_variant(std::size_t len, Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.tuple_variant(len, wrap); });
}

void TrackingVariantAccess::struct_variant(const Names& fields, Visitor& visitor) {
    TrackingVisitor wrap(visitor, chain_, track_);
    track_.guard(chain_, [&] { delegate_.struct_variant(fields, wrap); });
}

} // namespace locus
