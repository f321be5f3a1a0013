/**
 * @file Struct.hpp
 * @brief Struct decoding from a field table
 *
 * Fields<T> binds field names to data members of T and decodes T from either
 * a map (`{"name": ..., "version": ...}`) or a sequence in declaration order.
 *
 * Example:
 * ```cpp
 * struct Package {
 *     std::string name;
 *     std::optional<std::string> license;
 * };
 *
 * static const auto fields = locus::Fields<Package>("Package")
 *     .required("name", &Package::name)
 *     .optional("license", &Package::license);
 * ```
 *
 * Field names are stored as std::string_view and must outlive the table
 * (string literals in practice).
 */

#ifndef LOCUS_STRUCT_HPP
#define LOCUS_STRUCT_HPP

#include "locus/Deserialize.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Errors.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace locus {

/**
 * @brief Struct decoding policy
 */
struct FieldPolicy {
    /// Reject keys that name no field (default: skip their values)
    bool deny_unknown_fields = false;
};

template <typename T>
class Fields {
public:
    explicit Fields(std::string_view name, FieldPolicy policy = {})
        : name_(name), policy_(policy) {}

    /// Field that must be present
    template <typename F>
    Fields& required(std::string_view name, F T::*member) {
        add(name, member, true);
        return *this;
    }

    /// Field that keeps its default value when absent
    template <typename F>
    Fields& optional(std::string_view name, F T::*member) {
        add(name, member, false);
        return *this;
    }

    Fields& policy(FieldPolicy policy) {
        policy_ = policy;
        return *this;
    }

    std::string_view name() const noexcept { return name_; }
    const Names& names() const noexcept { return names_; }

    /// Decode a T through deserialize_struct
    void deserialize(Deserializer& deserializer, T& out) const {
        StructVisitor visitor(*this, out);
        deserializer.deserialize_struct(name_, names_, visitor);
    }

    /**
     * @brief Visitor filling @p out from a map or a sequence
     *
     * Exposed for callers that hold an accessor rather than a Deserializer
     * (struct variants).
     */
    class StructVisitor : public Visitor {
    public:
        StructVisitor(const Fields& fields, T& out) : fields_(fields), out_(out) {}

        std::string expecting() const override {
            return "struct " + std::string(fields_.name_);
        }

        void visit_map(MapAccess& map) override {
            std::vector<bool> seen(fields_.fields_.size(), false);
            for (;;) {
                std::size_t index = npos;
                IdentifierSeed key(fields_, index);
                if (!map.next_key_seed(key)) {
                    break;
                }
                if (index == npos) {
                    IgnoredAny ignored;
                    TypedSeed<IgnoredAny> skip(ignored);
                    map.next_value_seed(skip);
                    continue;
                }
                const Field& field = fields_.fields_[index];
                if (seen[index]) {
                    throw DecodeError::duplicate_field(field.name);
                }
                FieldSeed value(field, out_);
                map.next_value_seed(value);
                seen[index] = true;
            }

            for (std::size_t i = 0; i < seen.size(); ++i) {
                if (!seen[i] && fields_.fields_[i].required) {
                    throw DecodeError::missing_field(fields_.fields_[i].name);
                }
            }
        }

        void visit_seq(SeqAccess& seq) override {
            const std::size_t count = fields_.fields_.size();
            for (std::size_t i = 0; i < count; ++i) {
                const Field& field = fields_.fields_[i];
                FieldSeed element(field, out_);
                if (!seq.next_element_seed(element)) {
                    // The sequence ended: every field from i onward must be optional
                    for (std::size_t j = i; j < count; ++j) {
                        if (fields_.fields_[j].required) {
                            throw DecodeError::invalid_length(
                                i, expecting() + " with " + std::to_string(count) + " elements");
                        }
                    }
                    return;
                }
            }
        }

    private:
        const Fields& fields_;
        T& out_;
    };

private:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    struct Field {
        std::string_view name;
        bool required;
        std::function<void(Deserializer&, T&)> decode;
    };

    template <typename F>
    void add(std::string_view name, F T::*member, bool required) {
        fields_.push_back(Field{name, required, [member](Deserializer& d, T& out) {
                                    Deserialize<F>::deserialize(d, out.*member);
                                }});
        names_.push_back(name);
    }

    std::size_t find(std::string_view name) const {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].name == name) {
                return i;
            }
        }
        return npos;
    }

    class FieldSeed : public Seed {
    public:
        FieldSeed(const Field& field, T& out) : field_(field), out_(out) {}

        void deserialize(Deserializer& deserializer) override {
            field_.decode(deserializer, out_);
        }

    private:
        const Field& field_;
        T& out_;
    };

    /// Resolves a key to a field index; npos for ignored keys
    class IdentifierVisitor : public Visitor {
    public:
        IdentifierVisitor(const Fields& fields, std::size_t& index)
            : fields_(fields), index_(index) {}

        std::string expecting() const override { return "field identifier"; }

        void visit_str(std::string_view v) override {
            index_ = fields_.find(v);
            if (index_ == npos && fields_.policy_.deny_unknown_fields) {
                throw DecodeError::unknown_field(v, fields_.names_);
            }
        }

        void visit_u64(std::uint64_t v) override {
            if (v >= fields_.fields_.size()) {
                throw DecodeError::invalid_value(
                    Unexpected::unsigned_integer(v),
                    "field index 0 <= i < " + std::to_string(fields_.fields_.size()));
            }
            index_ = static_cast<std::size_t>(v);
        }

    private:
        const Fields& fields_;
        std::size_t& index_;
    };

    class IdentifierSeed : public Seed {
    public:
        IdentifierSeed(const Fields& fields, std::size_t& index)
            : fields_(fields), index_(index) {}

        void deserialize(Deserializer& deserializer) override {
            IdentifierVisitor visitor(fields_, index_);
            deserializer.deserialize_identifier(visitor);
        }

    private:
        const Fields& fields_;
        std::size_t& index_;
    };

    std::string_view name_;
    FieldPolicy policy_;
    std::vector<Field> fields_;
    Names names_;
};

} // namespace locus

#endif // LOCUS_STRUCT_HPP
