/**
 * @file test_support.hpp
 * @brief Shared test helpers
 *
 * locus::Value objects keep keys sorted and unique. EntriesDeserializer
 * presents a map exactly as listed, so tests can control entry order and
 * produce duplicate keys.
 *
 * failure<T>() decodes with tracking and reports where and why it failed.
 */

#ifndef LOCUS_TEST_SUPPORT_HPP
#define LOCUS_TEST_SUPPORT_HPP

#include "locus/Locus.hpp"

#include <string>
#include <utility>
#include <vector>

namespace locus_test {

using Entries = std::vector<std::pair<std::string, locus::Value>>;

class EntriesAccess : public locus::MapAccess {
public:
    explicit EntriesAccess(const Entries& entries) : entries_(entries) {}

    bool next_key_seed(locus::Seed& seed) override {
        if (index_ >= entries_.size()) {
            return false;
        }
        const locus::Value key = entries_[index_].first;
        locus::ValueDeserializer deserializer(key);
        seed.deserialize(deserializer);
        return true;
    }

    void next_value_seed(locus::Seed& seed) override {
        locus::ValueDeserializer deserializer(entries_[index_].second);
        ++index_;
        seed.deserialize(deserializer);
    }

private:
    const Entries& entries_;
    std::size_t index_ = 0;
};

/// Map-only backend; every other request goes to the Value backend on null
class EntriesDeserializer : public locus::ValueDeserializer {
public:
    explicit EntriesDeserializer(Entries entries)
        : locus::ValueDeserializer(null_value()), entries_(std::move(entries)) {}

    void deserialize_any(locus::Visitor& visitor) override { visit(visitor); }
    void deserialize_map(locus::Visitor& visitor) override { visit(visitor); }

    void deserialize_struct(std::string_view, const locus::Names&,
                            locus::Visitor& visitor) override {
        visit(visitor);
    }

private:
    static const locus::Value& null_value() {
        static const locus::Value null;
        return null;
    }

    void visit(locus::Visitor& visitor) {
        EntriesAccess access(entries_);
        visitor.visit_map(access);
    }

    Entries entries_;
};

/// Location and message of a tracked decode failure
struct Failure {
    std::string path;
    std::string message;
};

template <typename T>
Failure failure(locus::Deserializer& backend) {
    try {
        locus::deserialize<T>(backend);
    } catch (const locus::PathError& err) {
        return {err.path().to_string(), err.original().what()};
    }
    return {"<no error>", "<no error>"};
}

template <typename T>
Failure failure(const locus::Value& value) {
    locus::ValueDeserializer backend(value);
    return failure<T>(backend);
}

} // namespace locus_test

#endif // LOCUS_TEST_SUPPORT_HPP
