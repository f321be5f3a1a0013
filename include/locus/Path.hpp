/**
 * @file Path.hpp
 * @brief Owned location of a value inside a decoded document
 *
 * A Path is the finalized form of a Chain: an ordered list of segments from
 * the document root down to the value at which decoding failed.
 *
 * Rendering rules:
 * - The empty path renders as "."
 * - Key segments are joined with '.'
 * - Sequence indices render as "[n]" directly after their parent
 * - Keys that could not be captured as text render as "?"
 *
 * Examples:
 * - [key "dependencies", key "serde", key "version"] -> "dependencies.serde.version"
 * - [key "items", index 2, key "name"]               -> "items[2].name"
 * - [index 0]                                        -> "[0]"
 * - [key "map", unknown]                             -> "map.?"
 */

#ifndef LOCUS_PATH_HPP
#define LOCUS_PATH_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace locus {

class Chain;

/**
 * @brief Single component of a Path
 *
 * Struct field names, map keys and enum variant names all become MapKey
 * segments; they render identically.
 */
class Segment {
public:
    enum class Kind {
        SequenceIndex,
        MapKey,
        Unknown
    };

    static Segment sequence_index(std::size_t index) {
        return Segment(Kind::SequenceIndex, index, {});
    }

    static Segment map_key(std::string key) {
        return Segment(Kind::MapKey, 0, std::move(key));
    }

    static Segment unknown() {
        return Segment(Kind::Unknown, 0, {});
    }

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Element index
     * @pre kind() == Kind::SequenceIndex
     */
    std::size_t index() const noexcept { return index_; }

    /**
     * @brief Key, field or variant text
     * @pre kind() == Kind::MapKey
     */
    const std::string& key() const noexcept { return key_; }

    bool operator==(const Segment& other) const {
        return kind_ == other.kind_ && index_ == other.index_ && key_ == other.key_;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }

private:
    Segment(Kind kind, std::size_t index, std::string key)
        : kind_(kind), index_(index), key_(std::move(key)) {}

    Kind kind_;
    std::size_t index_;
    std::string key_;
};

/**
 * @brief Path to the value at which a decode error occurred
 *
 * Use to_string() (or operator<<) for the canonical text form, or iterate
 * to inspect the individual segments.
 */
class Path {
public:
    using const_iterator = std::vector<Segment>::const_iterator;

    Path() = default;
    explicit Path(std::vector<Segment> segments) : segments_(std::move(segments)) {}

    /**
     * @brief Materialize a live Chain into an owned Path
     *
     * Walks from @p chain up to its root and reverses the collected
     * segments. Transparent links (option, newtype wrappers) contribute
     * nothing.
     */
    static Path from_chain(const Chain& chain);

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }
    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }
    const Segment& operator[](std::size_t i) const { return segments_[i]; }
    const std::vector<Segment>& segments() const noexcept { return segments_; }

    /**
     * @brief True if no segment carries information
     *
     * Holds for the empty path and for paths made only of Unknown segments.
     */
    bool only_unknown() const noexcept;

    /// Canonical rendering, e.g. "dependencies.serde.version" or "items[2].name"
    std::string to_string() const;

    bool operator==(const Path& other) const { return segments_ == other.segments_; }
    bool operator!=(const Path& other) const { return !(*this == other); }

private:
    std::vector<Segment> segments_;
};

std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace locus

#endif // LOCUS_PATH_HPP
