/**
 * @file Path.cpp
 * @brief Path materialization and rendering
 */

#include "locus/Path.hpp"
#include "locus/Chain.hpp"

#include <algorithm>
#include <sstream>

namespace locus {

Path Path::from_chain(const Chain& chain) {
    std::vector<Segment> segments;

    for (const Chain* link = &chain; link != nullptr; link = link->parent()) {
        switch (link->kind()) {
            case Chain::Kind::Root:
                break;
            case Chain::Kind::SequenceElement:
                segments.push_back(Segment::sequence_index(link->index()));
                break;
            case Chain::Kind::MapEntry:
            case Chain::Kind::StructField:
            case Chain::Kind::EnumVariant:
                segments.push_back(Segment::map_key(std::string(link->key())));
                break;
            case Chain::Kind::Option:
            case Chain::Kind::NewtypeWrapper:
            case Chain::Kind::NewtypeVariantWrapper:
                // Transparent
                break;
            case Chain::Kind::UnknownKey:
                segments.push_back(Segment::unknown());
                break;
        }
    }

    std::reverse(segments.begin(), segments.end());
    return Path(std::move(segments));
}

bool Path::only_unknown() const noexcept {
    return std::all_of(segments_.begin(), segments_.end(), [](const Segment& seg) {
        return seg.kind() == Segment::Kind::Unknown;
    });
}

std::string Path::to_string() const {
    if (segments_.empty()) {
        return ".";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const Segment& seg = segments_[i];
        switch (seg.kind()) {
            case Segment::Kind::SequenceIndex:
                // Attached to its parent: "items[2]"
                oss << '[' << seg.index() << ']';
                break;
            case Segment::Kind::MapKey:
                if (i > 0) oss << '.';
                oss << seg.key();
                break;
            case Segment::Kind::Unknown:
                if (i > 0) oss << '.';
                oss << '?';
                break;
        }
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path.to_string();
}

} // namespace locus
