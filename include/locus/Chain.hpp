/**
 * @file Chain.hpp
 * @brief Borrowed ancestry of the value currently being decoded
 *
 * A Chain node lives on the stack of the decode call that created it and
 * refers to its parent by pointer. Building ancestry therefore never
 * allocates; only Path::from_chain() copies anything, and it is called at most
 * once per top-level decode (on the first failure).
 *
 * Keys are borrowed too: the text behind a MapEntry/StructField/EnumVariant
 * key must outlive the node.
 */

#ifndef LOCUS_CHAIN_HPP
#define LOCUS_CHAIN_HPP

#include "locus/Path.hpp"

#include <cstddef>
#include <string_view>

namespace locus {

class Chain {
public:
    enum class Kind {
        Root,
        SequenceElement,
        MapEntry,
        StructField,
        EnumVariant,
        Option,
        NewtypeWrapper,
        NewtypeVariantWrapper,
        UnknownKey
    };

    static Chain root() noexcept {
        return Chain(Kind::Root, nullptr, 0, {});
    }

    static Chain sequence_element(const Chain& parent, std::size_t index) noexcept {
        return Chain(Kind::SequenceElement, &parent, index, {});
    }

    static Chain map_entry(const Chain& parent, std::string_view key) noexcept {
        return Chain(Kind::MapEntry, &parent, 0, key);
    }

    // Field names are expected to be static constants.
    static Chain struct_field(const Chain& parent, std::string_view field) noexcept {
        return Chain(Kind::StructField, &parent, 0, field);
    }

    static Chain enum_variant(const Chain& parent, std::string_view variant) noexcept {
        return Chain(Kind::EnumVariant, &parent, 0, variant);
    }

    static Chain option(const Chain& parent) noexcept {
        return Chain(Kind::Option, &parent, 0, {});
    }

    static Chain newtype_wrapper(const Chain& parent) noexcept {
        return Chain(Kind::NewtypeWrapper, &parent, 0, {});
    }

    static Chain newtype_variant_wrapper(const Chain& parent) noexcept {
        return Chain(Kind::NewtypeVariantWrapper, &parent, 0, {});
    }

    static Chain unknown_key(const Chain& parent) noexcept {
        return Chain(Kind::UnknownKey, &parent, 0, {});
    }

    Kind kind() const noexcept { return kind_; }

    /// Null for Root
    const Chain* parent() const noexcept { return parent_; }

    /// Meaningful for SequenceElement only
    std::size_t index() const noexcept { return index_; }

    /// Meaningful for MapEntry, StructField and EnumVariant
    std::string_view key() const noexcept { return key_; }

    Path to_path() const { return Path::from_chain(*this); }

private:
    Chain(Kind kind, const Chain* parent, std::size_t index, std::string_view key) noexcept
        : kind_(kind), parent_(parent), index_(index), key_(key) {}

    Kind kind_;
    const Chain* parent_;
    std::size_t index_;
    std::string_view key_;
};

} // namespace locus

#endif // LOCUS_CHAIN_HPP
