/**
 * @file Enum.hpp
 * @brief Enum decoding from a variant table
 *
 * Variants<T> lists the variants of an enum-like type T, each with a factory
 * building T from the decoded payload:
 * - unit(name, make)                : make()
 * - newtype<P>(name, make)          : make(P&&)
 * - tuple<Ps...>(name, make)        : make(std::tuple<Ps...>&&)
 * - structure<P>(name, fields, make): make(P&&), P decoded by a Fields<P>
 *
 * Three input representations are supported:
 * - externally tagged (default): `"Unit"` or `{"Name": payload}`
 * - internally tagged: `{"type": "Name", ...payload fields}`
 * - adjacently tagged: `{"type": "Name", "content": payload}`
 *
 * Example:
 * ```cpp
 * using Shape = std::variant<Circle, Square>;
 * static const auto variants = locus::Variants<Shape>("Shape")
 *     .internally_tagged("kind")
 *     .structure<Circle>("circle", circle_fields,
 *                        [](Circle&& c) { return Shape(std::move(c)); })
 *     .structure<Square>("square", square_fields,
 *                        [](Square&& s) { return Shape(std::move(s)); });
 * ```
 */

#ifndef LOCUS_ENUM_HPP
#define LOCUS_ENUM_HPP

#include "locus/Deserialize.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Errors.hpp"
#include "locus/Struct.hpp"
#include "locus/Value.hpp"
#include "locus/ValueDeserializer.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace locus {

template <typename T>
class Variants {
public:
    enum class Tagging { External, Internal, Adjacent };

    explicit Variants(std::string_view name) : name_(name) {}

    /// `{"<tag>": "Name", ...}`; payload fields sit beside the tag
    Variants& internally_tagged(std::string_view tag) {
        tagging_ = Tagging::Internal;
        tag_ = tag;
        return *this;
    }

    /// `{"<tag>": "Name", "<content>": payload}`
    Variants& adjacently_tagged(std::string_view tag, std::string_view content) {
        tagging_ = Tagging::Adjacent;
        tag_ = tag;
        content_ = content;
        return *this;
    }

    template <typename Make>
    Variants& unit(std::string_view name, Make make) {
        Variant variant{name, Shape::Unit, {}, {}, {}};
        variant.from_access = [make](VariantAccess& access, T& out) {
            access.unit_variant();
            out = make();
        };
        variant.from_content = [make](Deserializer& d, T& out) {
            Unit unit;
            Deserialize<Unit>::deserialize(d, unit);
            out = make();
        };
        variant.make_unit = [make](T& out) { out = make(); };
        return add(std::move(variant));
    }

    template <typename P, typename Make>
    Variants& newtype(std::string_view name, Make make) {
        Variant variant{name, Shape::Newtype, {}, {}, {}};
        variant.from_access = [make](VariantAccess& access, T& out) {
            P payload{};
            TypedSeed<P> seed(payload);
            access.newtype_variant_seed(seed);
            out = make(std::move(payload));
        };
        variant.from_content = [make](Deserializer& d, T& out) {
            P payload{};
            Deserialize<P>::deserialize(d, payload);
            out = make(std::move(payload));
        };
        return add(std::move(variant));
    }

    template <typename... Ps, typename Make>
    Variants& tuple(std::string_view name, Make make) {
        Variant variant{name, Shape::Tuple, {}, {}, {}};
        variant.from_access = [make](VariantAccess& access, T& out) {
            std::tuple<Ps...> payload{};
            detail::TupleVisitor<std::tuple<Ps...>> visitor(payload);
            access.tuple_variant(sizeof...(Ps), visitor);
            out = make(std::move(payload));
        };
        variant.from_content = [make](Deserializer& d, T& out) {
            std::tuple<Ps...> payload{};
            Deserialize<std::tuple<Ps...>>::deserialize(d, payload);
            out = make(std::move(payload));
        };
        return add(std::move(variant));
    }

    template <typename P, typename Make>
    Variants& structure(std::string_view name, const Fields<P>& fields, Make make) {
        Variant variant{name, Shape::Struct, {}, {}, {}};
        variant.from_access = [fields, make](VariantAccess& access, T& out) {
            P payload{};
            typename Fields<P>::StructVisitor visitor(fields, payload);
            access.struct_variant(fields.names(), visitor);
            out = make(std::move(payload));
        };
        variant.from_content = [fields, make](Deserializer& d, T& out) {
            P payload{};
            fields.deserialize(d, payload);
            out = make(std::move(payload));
        };
        return add(std::move(variant));
    }

    std::string_view name() const noexcept { return name_; }
    const Names& names() const noexcept { return names_; }

    void deserialize(Deserializer& deserializer, T& out) const {
        switch (tagging_) {
        case Tagging::External: {
            ExternalVisitor visitor(*this, out);
            deserializer.deserialize_enum(name_, names_, visitor);
            break;
        }
        case Tagging::Internal: {
            InternalVisitor visitor(*this, out);
            deserializer.deserialize_any(visitor);
            break;
        }
        case Tagging::Adjacent: {
            AdjacentVisitor visitor(*this, out);
            const Names keys{tag_, content_};
            deserializer.deserialize_struct(name_, keys, visitor);
            break;
        }
        }
    }

private:
    enum class Shape { Unit, Newtype, Tuple, Struct };

    struct Variant {
        std::string_view name;
        Shape shape;
        std::function<void(VariantAccess&, T&)> from_access;
        std::function<void(Deserializer&, T&)> from_content;
        std::function<void(T&)> make_unit;
    };

    Variants& add(Variant&& variant) {
        names_.push_back(variant.name);
        variants_.push_back(std::move(variant));
        return *this;
    }

    std::size_t find(std::string_view name) const {
        for (std::size_t i = 0; i < variants_.size(); ++i) {
            if (variants_[i].name == name) {
                return i;
            }
        }
        return variants_.size();
    }

    // ========================================================================
    // Variant identifier
    // ========================================================================

    class IdentifierVisitor : public Visitor {
    public:
        IdentifierVisitor(const Variants& variants, std::size_t& index)
            : variants_(variants), index_(index) {}

        std::string expecting() const override { return "variant identifier"; }

        void visit_str(std::string_view v) override {
            const std::size_t index = variants_.find(v);
            if (index == variants_.variants_.size()) {
                throw DecodeError::unknown_variant(v, variants_.names_);
            }
            index_ = index;
        }

        void visit_u64(std::uint64_t v) override {
            if (v >= variants_.variants_.size()) {
                throw DecodeError::invalid_value(
                    Unexpected::unsigned_integer(v),
                    "variant index 0 <= i < " + std::to_string(variants_.variants_.size()));
            }
            index_ = static_cast<std::size_t>(v);
        }

    private:
        const Variants& variants_;
        std::size_t& index_;
    };

    class IdentifierSeed : public Seed {
    public:
        IdentifierSeed(const Variants& variants, std::size_t& index)
            : variants_(variants), index_(index) {}

        void deserialize(Deserializer& deserializer) override {
            IdentifierVisitor visitor(variants_, index_);
            deserializer.deserialize_identifier(visitor);
        }

    private:
        const Variants& variants_;
        std::size_t& index_;
    };

    /// Decodes a variant payload from a deserializer positioned on it
    class ContentSeed : public Seed {
    public:
        ContentSeed(const Variant& variant, T& out) : variant_(variant), out_(out) {}

        void deserialize(Deserializer& deserializer) override {
            variant_.from_content(deserializer, out_);
        }

    private:
        const Variant& variant_;
        T& out_;
    };

    // ========================================================================
    // Representations
    // ========================================================================

    class ExternalVisitor : public Visitor {
    public:
        ExternalVisitor(const Variants& variants, T& out) : variants_(variants), out_(out) {}

        std::string expecting() const override {
            return "enum " + std::string(variants_.name_);
        }

        void visit_enum(EnumAccess& data) override {
            std::size_t index = 0;
            IdentifierSeed seed(variants_, index);
            VariantAccess& access = data.variant_seed(seed);
            variants_.variants_[index].from_access(access, out_);
        }

    private:
        const Variants& variants_;
        T& out_;
    };

    /**
     * The tag may appear anywhere among the entries, so every other entry is
     * buffered into a Value and the payload is decoded afterwards.
     */
    class InternalVisitor : public Visitor {
    public:
        InternalVisitor(const Variants& variants, T& out) : variants_(variants), out_(out) {}

        std::string expecting() const override {
            return "internally tagged enum " + std::string(variants_.name_);
        }

        void visit_map(MapAccess& map) override {
            std::optional<std::size_t> index;
            Value rest = Value::object();
            for (;;) {
                std::string key;
                TypedSeed<std::string> key_seed(key);
                if (!map.next_key_seed(key_seed)) {
                    break;
                }
                if (key == variants_.tag_) {
                    if (index) {
                        throw DecodeError::duplicate_field(variants_.tag_);
                    }
                    std::size_t found = 0;
                    IdentifierSeed seed(variants_, found);
                    map.next_value_seed(seed);
                    index = found;
                } else {
                    Value value;
                    TypedSeed<Value> seed(value);
                    map.next_value_seed(seed);
                    if (rest.contains(key)) {
                        throw DecodeError::duplicate_field(key);
                    }
                    rest[key] = std::move(value);
                }
            }
            if (!index) {
                throw DecodeError::missing_field(variants_.tag_);
            }

            const Variant& variant = variants_.variants_[*index];
            switch (variant.shape) {
            case Shape::Unit:
                // Entries beside the tag are ignored
                variant.make_unit(out_);
                break;
            case Shape::Tuple:
                throw DecodeError::invalid_type(Unexpected::tuple_variant(),
                                                "internally tagged variant");
            default: {
                ValueDeserializer content(rest);
                ContentSeed seed(variant, out_);
                map.replay_seed(seed, content);
                break;
            }
            }
        }

    private:
        const Variants& variants_;
        T& out_;
    };

    /**
     * When the tag precedes the content, the payload is decoded in place.
     * Otherwise the content is buffered until the tag is known.
     */
    class AdjacentVisitor : public Visitor {
    public:
        AdjacentVisitor(const Variants& variants, T& out) : variants_(variants), out_(out) {}

        std::string expecting() const override {
            return "adjacently tagged enum " + std::string(variants_.name_);
        }

        void visit_map(MapAccess& map) override {
            std::optional<std::size_t> index;
            std::optional<Value> buffered;
            bool decoded = false;
            for (;;) {
                std::string key;
                TypedSeed<std::string> key_seed(key);
                if (!map.next_key_seed(key_seed)) {
                    break;
                }
                if (key == variants_.tag_) {
                    if (index) {
                        throw DecodeError::duplicate_field(variants_.tag_);
                    }
                    std::size_t found = 0;
                    IdentifierSeed seed(variants_, found);
                    map.next_value_seed(seed);
                    index = found;
                } else if (key == variants_.content_) {
                    if (decoded || buffered) {
                        throw DecodeError::duplicate_field(variants_.content_);
                    }
                    if (index) {
                        ContentSeed seed(variants_.variants_[*index], out_);
                        map.next_value_seed(seed);
                        decoded = true;
                    } else {
                        Value value;
                        TypedSeed<Value> seed(value);
                        map.next_value_seed(seed);
                        buffered = std::move(value);
                    }
                } else {
                    IgnoredAny ignored;
                    TypedSeed<IgnoredAny> skip(ignored);
                    map.next_value_seed(skip);
                }
            }
            if (!index) {
                throw DecodeError::missing_field(variants_.tag_);
            }
            if (decoded) {
                return;
            }

            const Variant& variant = variants_.variants_[*index];
            if (buffered) {
                ValueDeserializer content(*buffered);
                ContentSeed seed(variant, out_);
                map.replay_entry_seed(variants_.content_, seed, content);
            } else if (variant.shape == Shape::Unit) {
                variant.make_unit(out_);
            } else {
                throw DecodeError::missing_field(variants_.content_);
            }
        }

        void visit_seq(SeqAccess& seq) override {
            std::size_t index = 0;
            IdentifierSeed tag(variants_, index);
            if (!seq.next_element_seed(tag)) {
                throw DecodeError::invalid_length(0, "tuple struct " + std::string(variants_.name_) +
                                                         " with 2 elements");
            }
            const Variant& variant = variants_.variants_[index];
            ContentSeed content(variant, out_);
            if (!seq.next_element_seed(content)) {
                if (variant.shape != Shape::Unit) {
                    throw DecodeError::invalid_length(
                        1, "tuple struct " + std::string(variants_.name_) + " with 2 elements");
                }
                variant.make_unit(out_);
            }
        }

    private:
        const Variants& variants_;
        T& out_;
    };

    std::string_view name_;
    Tagging tagging_ = Tagging::External;
    std::string_view tag_;
    std::string_view content_;
    std::vector<Variant> variants_;
    Names names_;
};

} // namespace locus

#endif // LOCUS_ENUM_HPP
