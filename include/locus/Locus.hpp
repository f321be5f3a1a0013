/**
 * @file Locus.hpp
 * @brief Main header: decode with error locations
 *
 * Example:
 * ```cpp
 * #include <locus/Locus.hpp>
 *
 * try {
 *     auto manifest = locus::from_json<Manifest>(text);
 * } catch (const locus::PathError& e) {
 *     // e.what(): "dependencies.serde.version: invalid type: integer `1`,
 *     //            expected a string"
 *     std::cerr << e.path() << ": " << e.original().what() << "\n";
 * }
 * ```
 */

#ifndef LOCUS_LOCUS_HPP
#define LOCUS_LOCUS_HPP

#include "locus/Chain.hpp"
#include "locus/Deserialize.hpp"
#include "locus/Deserializer.hpp"
#include "locus/Enum.hpp"
#include "locus/Errors.hpp"
#include "locus/Loader.hpp"
#include "locus/Path.hpp"
#include "locus/Struct.hpp"
#include "locus/Track.hpp"
#include "locus/TrackingDeserializer.hpp"
#include "locus/Value.hpp"
#include "locus/ValueDeserializer.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace locus {

/**
 * @brief Run @p seed on a tracked @p deserializer
 *
 * @throws PathError wrapping the backend's DecodeError and its Path
 */
inline void deserialize_seed(Deserializer& deserializer, Seed& seed) {
    Track track;
    TrackingDeserializer tracked(deserializer, track);
    try {
        seed.deserialize(tracked);
    } catch (DecodeError& err) {
        throw PathError(std::move(track).path(), std::move(err));
    }
}

/**
 * @brief Decode a T from any backend, with error location
 *
 * @throws PathError wrapping the backend's DecodeError and its Path
 */
template <typename T>
T deserialize(Deserializer& deserializer) {
    T value{};
    TypedSeed<T> seed(value);
    deserialize_seed(deserializer, seed);
    return value;
}

/**
 * @brief Decode a T from an in-memory document
 * @throws PathError on decode failure
 */
template <typename T>
T from_value(const Value& value) {
    ValueDeserializer backend(value);
    return deserialize<T>(backend);
}

/**
 * @brief Decode a T from JSON text
 * @throws ParseError on JSON syntax errors
 * @throws PathError on decode failure
 */
template <typename T>
T from_json(std::string_view text, const LoadOptions& options = {}) {
    const Value document = parse_json(text, options);
    return from_value<T>(document);
}

/**
 * @brief Decode a T from TOML text
 * @throws ParseError on TOML syntax errors
 * @throws PathError on decode failure
 */
template <typename T>
T from_toml(std::string_view text) {
    const Value document = parse_toml(text);
    return from_value<T>(document);
}

/**
 * @brief Decode a T from a JSON or TOML file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError on syntax errors
 * @throws PathError on decode failure
 */
template <typename T>
T from_file(const std::string& path, const LoadOptions& options = {}) {
    const Value document = load_document(path, options);
    return from_value<T>(document);
}

} // namespace locus

#endif // LOCUS_LOCUS_HPP
