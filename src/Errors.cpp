/**
 * @file Errors.cpp
 * @brief Message formatting for decode errors
 */

#include "locus/Errors.hpp"
#include "locus/Deserializer.hpp"

#include <cmath>
#include <sstream>

namespace locus {

namespace {
    /**
     * @brief Format a float so it always reads as one ("1.0", not "1")
     */
    std::string format_float(double v) {
        if (std::isnan(v)) return "NaN";
        if (std::isinf(v)) return v < 0 ? "-inf" : "inf";

        std::ostringstream oss;
        oss.precision(17);
        oss << v;
        std::string text = oss.str();
        if (text.find_first_of(".eE") == std::string::npos) {
            text += ".0";
        }
        return text;
    }

    /**
     * @brief Render "`a`", "`a` or `b`", "one of `a`, `b`, `c`"
     */
    std::string one_of(const std::vector<std::string_view>& names) {
        std::ostringstream oss;
        if (names.size() == 1) {
            oss << '`' << names[0] << '`';
        } else if (names.size() == 2) {
            oss << '`' << names[0] << "` or `" << names[1] << '`';
        } else {
            oss << "one of ";
            for (size_t i = 0; i < names.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << '`' << names[i] << '`';
            }
        }
        return oss.str();
    }
}

// ============================================================================
// Unexpected
// ============================================================================

Unexpected Unexpected::boolean(bool v) {
    return Unexpected(std::string("boolean `") + (v ? "true" : "false") + "`");
}

Unexpected Unexpected::signed_integer(std::int64_t v) {
    return Unexpected("integer `" + std::to_string(v) + "`");
}

Unexpected Unexpected::unsigned_integer(std::uint64_t v) {
    return Unexpected("integer `" + std::to_string(v) + "`");
}

Unexpected Unexpected::floating(double v) {
    return Unexpected("floating point `" + format_float(v) + "`");
}

Unexpected Unexpected::character(char32_t v) {
    return Unexpected("character `" + utf8_encode(v) + "`");
}

Unexpected Unexpected::str(std::string_view v) {
    return Unexpected("string \"" + std::string(v) + "\"");
}

Unexpected Unexpected::bytes() { return Unexpected("byte array"); }
Unexpected Unexpected::unit() { return Unexpected("unit value"); }
Unexpected Unexpected::option() { return Unexpected("Option value"); }
Unexpected Unexpected::newtype_struct() { return Unexpected("newtype struct"); }
Unexpected Unexpected::sequence() { return Unexpected("sequence"); }
Unexpected Unexpected::map() { return Unexpected("map"); }
Unexpected Unexpected::enumeration() { return Unexpected("enum"); }
Unexpected Unexpected::unit_variant() { return Unexpected("unit variant"); }
Unexpected Unexpected::newtype_variant() { return Unexpected("newtype variant"); }
Unexpected Unexpected::tuple_variant() { return Unexpected("tuple variant"); }
Unexpected Unexpected::struct_variant() { return Unexpected("struct variant"); }

Unexpected Unexpected::other(std::string description) {
    return Unexpected(std::move(description));
}

// ============================================================================
// DecodeError
// ============================================================================

DecodeError DecodeError::custom(const std::string& message) {
    return DecodeError(Kind::Custom, message);
}

DecodeError DecodeError::invalid_type(const Unexpected& unexpected, std::string_view expected) {
    return DecodeError(Kind::InvalidType,
                       "invalid type: " + unexpected.description() +
                       ", expected " + std::string(expected));
}

DecodeError DecodeError::invalid_value(const Unexpected& unexpected, std::string_view expected) {
    return DecodeError(Kind::InvalidValue,
                       "invalid value: " + unexpected.description() +
                       ", expected " + std::string(expected));
}

DecodeError DecodeError::invalid_length(std::size_t len, std::string_view expected) {
    return DecodeError(Kind::InvalidLength,
                       "invalid length " + std::to_string(len) +
                       ", expected " + std::string(expected));
}

DecodeError DecodeError::unknown_variant(std::string_view variant,
                                         const std::vector<std::string_view>& expected) {
    std::string message = "unknown variant `" + std::string(variant) + "`, ";
    if (expected.empty()) {
        message += "there are no variants";
    } else {
        message += "expected " + one_of(expected);
    }
    return DecodeError(Kind::UnknownVariant, message, std::string(variant));
}

DecodeError DecodeError::unknown_field(std::string_view field,
                                       const std::vector<std::string_view>& expected) {
    std::string message = "unknown field `" + std::string(field) + "`, ";
    if (expected.empty()) {
        message += "there are no fields";
    } else {
        message += "expected " + one_of(expected);
    }
    return DecodeError(Kind::UnknownField, message, std::string(field));
}

DecodeError DecodeError::missing_field(std::string_view field) {
    return DecodeError(Kind::MissingField,
                       "missing field `" + std::string(field) + "`",
                       std::string(field));
}

DecodeError DecodeError::duplicate_field(std::string_view field) {
    return DecodeError(Kind::DuplicateField,
                       "duplicate field `" + std::string(field) + "`",
                       std::string(field));
}

} // namespace locus
