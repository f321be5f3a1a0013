/**
 * @file TrackingVisitor.cpp
 * @brief Composite callbacks of the tracking visitor
 *
 * The extended chain is only valid inside the nested call. If the nested
 * layer already recorded a deeper location, triggering here is a no-op;
 * otherwise this layer's own location is recorded.
 */

#include "locus/TrackingVisitor.hpp"
#include "locus/Errors.hpp"
#include "locus/TrackedAccess.hpp"
#include "locus/TrackingDeserializer.hpp"

namespace locus {

void TrackingVisitor::visit_some(Deserializer& deserializer) {
    const Chain nested = Chain::option(chain_);
    TrackingDeserializer wrap(deserializer, nested, track_);
    track_.guard(chain_, [&] { delegate_.visit_some(wrap); });
}

void TrackingVisitor::visit_newtype_struct(Deserializer& deserializer) {
    const Chain nested = Chain::newtype_wrapper(chain_);
    TrackingDeserializer wrap(deserializer, nested, track_);
    track_.guard(chain_, [&] { delegate_.visit_newtype_struct(wrap); });
}

void TrackingVisitor::visit_seq(SeqAccess& seq) {
    TrackingSeqAccess wrap(seq, chain_, track_);
    track_.guard(chain_, [&] { delegate_.visit_seq(wrap); });
}

void TrackingVisitor::visit_map(MapAccess& map) {
    TrackingMapAccess wrap(map, chain_, track_);
    try {
        delegate_.visit_map(wrap);
    } catch (const DecodeError& err) {
        if (err.kind() == DecodeError::Kind::MissingField) {
            track_.trigger(Chain::struct_field(chain_, err.field()));
        }
        track_.trigger(chain_);
        throw;
    } catch (...) {
        track_.trigger(chain_);
        throw;
    }
}

void TrackingVisitor::visit_enum(EnumAccess& data) {
    TrackingEnumAccess wrap(data, chain_, track_);
    track_.guard(chain_, [&] { delegate_.visit_enum(wrap); });
}

} // namespace locus
