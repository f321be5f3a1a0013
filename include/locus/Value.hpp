/**
 * @file Value.hpp
 * @brief In-memory document type for decoding
 *
 * Uses nlohmann::json as the underlying value model. It is the tree walked by
 * ValueDeserializer and the buffer tagged enums replay their content from:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Binary (byte array)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef LOCUS_VALUE_HPP
#define LOCUS_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace locus {

/**
 * @brief JSON-like document value
 *
 * This is an alias for nlohmann::json. Documents loaded from JSON or TOML
 * (see Loader.hpp) are represented as a Value before being decoded.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "binary", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_binary()) return "binary";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace locus

#endif // LOCUS_VALUE_HPP
