/**
 * @file Errors.hpp
 * @brief Exception types for locus
 *
 * Error taxonomy:
 * - Error: Base class
 * - DecodeError: A backend or visitor rejected the input
 * - PathError: A DecodeError together with the Path at which it occurred
 * - FileNotFoundError: Document file not found
 * - ParseError: JSON/TOML syntax errors
 */

#ifndef LOCUS_ERRORS_HPP
#define LOCUS_ERRORS_HPP

#include "locus/Path.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace locus {

/**
 * @brief Base class for all locus exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Description of a value that a visitor did not expect
 *
 * Used to build "invalid type" and "invalid value" messages, e.g.
 * `string "500"` or ``integer `300` ``.
 */
class Unexpected {
public:
    static Unexpected boolean(bool v);
    static Unexpected signed_integer(std::int64_t v);
    static Unexpected unsigned_integer(std::uint64_t v);
    static Unexpected floating(double v);
    static Unexpected character(char32_t v);
    static Unexpected str(std::string_view v);
    static Unexpected bytes();
    static Unexpected unit();
    static Unexpected option();
    static Unexpected newtype_struct();
    static Unexpected sequence();
    static Unexpected map();
    static Unexpected enumeration();
    static Unexpected unit_variant();
    static Unexpected newtype_variant();
    static Unexpected tuple_variant();
    static Unexpected struct_variant();
    static Unexpected other(std::string description);

    const std::string& description() const noexcept { return description_; }

private:
    explicit Unexpected(std::string description)
        : description_(std::move(description)) {}

    std::string description_;
};

/**
 * @brief Decoding failed
 *
 * Raised by backends and visitors. The tracking decorators never alter it;
 * they only record where it happened.
 */
class DecodeError : public Error {
public:
    enum class Kind {
        Custom,
        InvalidType,
        InvalidValue,
        InvalidLength,
        UnknownVariant,
        UnknownField,
        MissingField,
        DuplicateField
    };

    /**
     * @brief Construct with kind and complete message
     * @param kind Failure class
     * @param message Human-readable message (what())
     * @param field Field or variant name for the field/variant kinds
     */
    DecodeError(Kind kind, const std::string& message, std::string field = {})
        : Error(message)
        , kind_(kind)
        , field_(std::move(field))
    {}

    static DecodeError custom(const std::string& message);

    /// "invalid type: <unexpected>, expected <expected>"
    static DecodeError invalid_type(const Unexpected& unexpected, std::string_view expected);

    /// "invalid value: <unexpected>, expected <expected>"
    static DecodeError invalid_value(const Unexpected& unexpected, std::string_view expected);

    /// "invalid length <len>, expected <expected>"
    static DecodeError invalid_length(std::size_t len, std::string_view expected);

    /// "unknown variant `<variant>`, expected one of `A`, `B`"
    static DecodeError unknown_variant(std::string_view variant,
                                       const std::vector<std::string_view>& expected);

    /// "unknown field `<field>`, expected one of `a`, `b`"
    static DecodeError unknown_field(std::string_view field,
                                     const std::vector<std::string_view>& expected);

    /// "missing field `<field>`"
    static DecodeError missing_field(std::string_view field);

    /// "duplicate field `<field>`"
    static DecodeError duplicate_field(std::string_view field);

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Field or variant name the error refers to
     *
     * Empty unless kind() is UnknownVariant, UnknownField, MissingField or
     * DuplicateField.
     */
    const std::string& field() const noexcept { return field_; }

private:
    Kind kind_;
    std::string field_;
};

/**
 * @brief Decode error annotated with its location
 *
 * what() renders as "<path>: <original message>", e.g.
 * "dependencies.serde.version: invalid type: integer `1`, expected a string".
 */
class PathError : public Error {
public:
    PathError(Path path, DecodeError original)
        : Error(path.to_string() + ": " + original.what())
        , path_(std::move(path))
        , original_(std::move(original))
    {}

    /// Location of the failing value
    const Path& path() const noexcept {
        return path_;
    }

    /// The backend's error, unchanged
    const DecodeError& original() const noexcept {
        return original_;
    }

private:
    Path path_;
    DecodeError original_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Document file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document syntax error (JSON/TOML)
 */
class ParseError : public Error {
public:
    /**
     * @brief Construct with source name and error details
     * @param source File path, or "<string>" for in-memory text
     * @param details Detailed error message from parser
     */
    ParseError(std::string source, std::string details)
        : Error("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the source with the parse error
     */
    const std::string& source() const noexcept {
        return source_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

} // namespace locus

#endif // LOCUS_ERRORS_HPP
