/**
 * @file Loader.cpp
 * @brief Document loading implementation
 */

#include "locus/Loader.hpp"
#include "locus/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace locus {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value stringify(const T& value) {
    std::ostringstream ss;
    ss << value;
    return Value(ss.str());
}

Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return stringify(node.as_date()->get());

        case toml::node_type::time:
            return stringify(node.as_time()->get());

        case toml::node_type::date_time:
            return stringify(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Text
// ============================================================================

Value parse_json(std::string_view text, const LoadOptions& options, const std::string& source) {
    try {
        return Value::parse(text.begin(), text.end(), nullptr, true, options.ignore_comments);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(source, e.what());
    }
}

Value parse_toml(std::string_view text, const std::string& source) {
    toml::table table;
    try {
        table = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line << ", column " << e.source().begin.column
                << ": " << e.description();
        throw ParseError(source, details.str());
    }
    return toml_value_to_json(table);
}

// ============================================================================
// Files
// ============================================================================

Value load_json_file(const std::string& path, const LoadOptions& options) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    const std::string content = read_file(path);
    return parse_json(content, options, path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    const std::string content = read_file(path);
    return parse_toml(content, path);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document(const std::string& path, const LoadOptions& options) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    switch (options.format) {
    case Format::Json:
        return load_json_file(path, options);
    case Format::Toml:
        return load_toml_file(path);
    case Format::Auto:
        break;
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path, options);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw Error("Unsupported document type: " + ext + " (expected .json or .toml)");
}

} // namespace locus
