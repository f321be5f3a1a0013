/**
 * @file Deserialize.hpp
 * @brief Typed decoding on top of the Deserializer interface
 *
 * Deserialize<T>::deserialize(d, out) decodes one T from @p d into @p out.
 * Specializations are provided for:
 * - bool, fixed-width integers (range checked), float, double, char
 * - std::string, ByteBuf
 * - std::optional<T>, std::vector<T>, std::map<K, V>, std::pair, std::tuple
 * - Unit, IgnoredAny
 *
 * User types specialize Deserialize<T> themselves, usually through Fields<T>
 * (Struct.hpp) or Variants<T> (Enum.hpp):
 * ```cpp
 * template <>
 * struct locus::Deserialize<Dependency> {
 *     static void deserialize(locus::Deserializer& d, Dependency& out) {
 *         static const auto fields = locus::Fields<Dependency>("Dependency")
 *             .required("version", &Dependency::version);
 *         fields.deserialize(d, out);
 *     }
 * };
 * ```
 */

#ifndef LOCUS_DESERIALIZE_HPP
#define LOCUS_DESERIALIZE_HPP

#include "locus/Deserializer.hpp"
#include "locus/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace locus {

template <typename T, typename Enable = void>
struct Deserialize;

/// Value with no content ("null" in JSON)
struct Unit {
    bool operator==(const Unit&) const { return true; }
};

/// Accepts and discards any value
struct IgnoredAny {};

/// Byte string (as opposed to std::vector<uint8_t>, which is a sequence)
struct ByteBuf {
    Bytes bytes;
    bool operator==(const ByteBuf& other) const { return bytes == other.bytes; }
};

/**
 * @brief Seed decoding a T into a caller-owned target
 */
template <typename T>
class TypedSeed : public Seed {
public:
    explicit TypedSeed(T& out) : out_(out) {}

    void deserialize(Deserializer& deserializer) override {
        Deserialize<T>::deserialize(deserializer, out_);
    }

private:
    T& out_;
};

// ============================================================================
// Scalars (defined in Deserialize.cpp)
// ============================================================================

template <>
struct Deserialize<bool> {
    static void deserialize(Deserializer& deserializer, bool& out);
};

template <>
struct Deserialize<std::int8_t> {
    static void deserialize(Deserializer& deserializer, std::int8_t& out);
};

template <>
struct Deserialize<std::int16_t> {
    static void deserialize(Deserializer& deserializer, std::int16_t& out);
};

template <>
struct Deserialize<std::int32_t> {
    static void deserialize(Deserializer& deserializer, std::int32_t& out);
};

template <>
struct Deserialize<std::int64_t> {
    static void deserialize(Deserializer& deserializer, std::int64_t& out);
};

template <>
struct Deserialize<std::uint8_t> {
    static void deserialize(Deserializer& deserializer, std::uint8_t& out);
};

template <>
struct Deserialize<std::uint16_t> {
    static void deserialize(Deserializer& deserializer, std::uint16_t& out);
};

template <>
struct Deserialize<std::uint32_t> {
    static void deserialize(Deserializer& deserializer, std::uint32_t& out);
};

template <>
struct Deserialize<std::uint64_t> {
    static void deserialize(Deserializer& deserializer, std::uint64_t& out);
};

template <>
struct Deserialize<float> {
    static void deserialize(Deserializer& deserializer, float& out);
};

template <>
struct Deserialize<double> {
    static void deserialize(Deserializer& deserializer, double& out);
};

template <>
struct Deserialize<char> {
    static void deserialize(Deserializer& deserializer, char& out);
};

template <>
struct Deserialize<std::string> {
    static void deserialize(Deserializer& deserializer, std::string& out);
};

template <>
struct Deserialize<ByteBuf> {
    static void deserialize(Deserializer& deserializer, ByteBuf& out);
};

template <>
struct Deserialize<Unit> {
    static void deserialize(Deserializer& deserializer, Unit& out);
};

template <>
struct Deserialize<IgnoredAny> {
    static void deserialize(Deserializer& deserializer, IgnoredAny& out);
};

// ============================================================================
// Containers
// ============================================================================

namespace detail {

template <typename T>
class OptionVisitor : public Visitor {
public:
    explicit OptionVisitor(std::optional<T>& out) : out_(out) {}

    std::string expecting() const override { return "option"; }

    void visit_none() override { out_.reset(); }
    void visit_unit() override { out_.reset(); }

    void visit_some(Deserializer& deserializer) override {
        T value{};
        Deserialize<T>::deserialize(deserializer, value);
        out_ = std::move(value);
    }

private:
    std::optional<T>& out_;
};

template <typename T>
class SeqVisitor : public Visitor {
public:
    explicit SeqVisitor(std::vector<T>& out) : out_(out) {}

    std::string expecting() const override { return "a sequence"; }

    void visit_seq(SeqAccess& seq) override {
        out_.clear();
        // Cap the reservation so a lying size hint cannot exhaust memory
        out_.reserve(std::min<std::size_t>(seq.size_hint().value_or(0), 4096));
        for (;;) {
            T element{};
            TypedSeed<T> seed(element);
            if (!seq.next_element_seed(seed)) {
                break;
            }
            out_.push_back(std::move(element));
        }
    }

private:
    std::vector<T>& out_;
};

template <typename K, typename V, typename Compare, typename Alloc>
class MapVisitor : public Visitor {
public:
    explicit MapVisitor(std::map<K, V, Compare, Alloc>& out) : out_(out) {}

    std::string expecting() const override { return "a map"; }

    void visit_map(MapAccess& map) override {
        out_.clear();
        for (;;) {
            K key{};
            TypedSeed<K> key_seed(key);
            if (!map.next_key_seed(key_seed)) {
                break;
            }
            V value{};
            TypedSeed<V> value_seed(value);
            map.next_value_seed(value_seed);
            out_.insert_or_assign(std::move(key), std::move(value));
        }
    }

private:
    std::map<K, V, Compare, Alloc>& out_;
};

/**
 * @brief Fixed-length sequence decoded into a std::tuple-like target
 */
template <typename Tuple>
class TupleVisitor : public Visitor {
public:
    static constexpr std::size_t size = std::tuple_size<Tuple>::value;

    explicit TupleVisitor(Tuple& out) : out_(out) {}

    std::string expecting() const override {
        return "a tuple of size " + std::to_string(size);
    }

    void visit_seq(SeqAccess& seq) override {
        read_elements(seq, std::make_index_sequence<size>());
    }

private:
    template <std::size_t... I>
    void read_elements(SeqAccess& seq, std::index_sequence<I...>) {
        (read_element<I>(seq), ...);
    }

    template <std::size_t I>
    void read_element(SeqAccess& seq) {
        using Element = std::tuple_element_t<I, Tuple>;
        TypedSeed<Element> seed(std::get<I>(out_));
        if (!seq.next_element_seed(seed)) {
            throw DecodeError::invalid_length(I, expecting());
        }
    }

    Tuple& out_;
};

} // namespace detail

template <typename T>
struct Deserialize<std::optional<T>> {
    static void deserialize(Deserializer& deserializer, std::optional<T>& out) {
        detail::OptionVisitor<T> visitor(out);
        deserializer.deserialize_option(visitor);
    }
};

template <typename T, typename Alloc>
struct Deserialize<std::vector<T, Alloc>> {
    static void deserialize(Deserializer& deserializer, std::vector<T, Alloc>& out) {
        detail::SeqVisitor<T> visitor(out);
        deserializer.deserialize_seq(visitor);
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct Deserialize<std::map<K, V, Compare, Alloc>> {
    static void deserialize(Deserializer& deserializer, std::map<K, V, Compare, Alloc>& out) {
        detail::MapVisitor<K, V, Compare, Alloc> visitor(out);
        deserializer.deserialize_map(visitor);
    }
};

template <typename A, typename B>
struct Deserialize<std::pair<A, B>> {
    static void deserialize(Deserializer& deserializer, std::pair<A, B>& out) {
        detail::TupleVisitor<std::pair<A, B>> visitor(out);
        deserializer.deserialize_tuple(2, visitor);
    }
};

template <typename... Ts>
struct Deserialize<std::tuple<Ts...>> {
    static void deserialize(Deserializer& deserializer, std::tuple<Ts...>& out) {
        detail::TupleVisitor<std::tuple<Ts...>> visitor(out);
        deserializer.deserialize_tuple(sizeof...(Ts), visitor);
    }
};

} // namespace locus

#endif // LOCUS_DESERIALIZE_HPP
