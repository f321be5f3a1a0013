/**
 * @file test_loader.cpp
 * @brief Tests for document loading and the from_* entry points
 *
 * Tests cover:
 * - JSON text and file loading (optionally with comments)
 * - TOML text and file loading (tables, arrays, dates)
 * - Format detection by extension and explicit format selection
 * - Syntax errors (ParseError) versus decode errors (PathError)
 */

#include <gtest/gtest.h>
#include "locus/Errors.hpp"
#include "locus/Loader.hpp"
#include "locus/Locus.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace locus;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("locus_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

struct Database {
    std::string host;
    std::uint16_t port = 0;
};

struct Service {
    std::string name;
    Database database;
    std::vector<std::string> tags;
};

} // anonymous namespace

namespace locus {

template <>
struct Deserialize<Database> {
    static void deserialize(Deserializer& deserializer, Database& out) {
        static const auto fields = Fields<Database>("Database")
            .required("host", &Database::host)
            .required("port", &Database::port);
        fields.deserialize(deserializer, out);
    }
};

template <>
struct Deserialize<Service> {
    static void deserialize(Deserializer& deserializer, Service& out) {
        static const auto fields = Fields<Service>("Service")
            .required("name", &Service::name)
            .required("database", &Service::database)
            .required("tags", &Service::tags);
        fields.deserialize(deserializer, out);
    }
};

} // namespace locus

// ============================================================================
// JSON
// ============================================================================

TEST(ParseJsonTest, Object) {
    const Value result = parse_json(R"({
        "string": "hello",
        "integer": 42,
        "float": 3.14,
        "boolean": true,
        "null_value": null,
        "array": [1, 2, 3],
        "nested": {"key": "value"}
    })");

    EXPECT_EQ(result["string"], "hello");
    EXPECT_EQ(result["integer"], 42);
    EXPECT_LT(std::abs(result["float"].get<double>() - 3.14), 0.001);
    EXPECT_EQ(result["boolean"], true);
    EXPECT_TRUE(result["null_value"].is_null());
    EXPECT_EQ(result["array"].size(), 3u);
    EXPECT_EQ(result["nested"]["key"], "value");
}

TEST(ParseJsonTest, InvalidSyntax) {
    EXPECT_THROW(parse_json("{ invalid json }"), ParseError);
    EXPECT_THROW(parse_json(R"({"key": "value)"), ParseError);
}

TEST(ParseJsonTest, ErrorNamesSource) {
    try {
        parse_json("[1, 2", {}, "inline.json");
        FAIL() << "expected ParseError";
    } catch (const ParseError& err) {
        EXPECT_EQ(err.source(), "inline.json");
        EXPECT_FALSE(err.details().empty());
    }
}

TEST(ParseJsonTest, CommentsRejectedByDefault) {
    const std::string text = "{\n  // port\n  \"port\": 80\n}";
    EXPECT_THROW(parse_json(text), ParseError);

    LoadOptions options;
    options.ignore_comments = true;
    EXPECT_EQ(parse_json(text, options)["port"], 80);
}

// ============================================================================
// TOML
// ============================================================================

TEST(ParseTomlTest, TablesAndArrays) {
    const Value result = parse_toml(R"(
name = "hello"
count = 42
ratio = 0.5
enabled = true
ports = [80, 443]

[nested]
key = "value"

[[servers]]
name = "first"

[[servers]]
name = "second"
)");

    EXPECT_EQ(result["name"], "hello");
    EXPECT_EQ(result["count"], 42);
    EXPECT_DOUBLE_EQ(result["ratio"].get<double>(), 0.5);
    EXPECT_EQ(result["enabled"], true);
    EXPECT_EQ(result["ports"], Value::array({80, 443}));
    EXPECT_EQ(result["nested"]["key"], "value");
    ASSERT_TRUE(result["servers"].is_array());
    EXPECT_EQ(result["servers"][1]["name"], "second");
}

TEST(ParseTomlTest, DatesBecomeStrings) {
    const Value result = parse_toml("released = 1979-05-27\n");
    ASSERT_TRUE(result["released"].is_string());
    EXPECT_EQ(result["released"], "1979-05-27");
}

TEST(ParseTomlTest, MultilineStrings) {
    const Value result = parse_toml("text = \"\"\"\nLine 1\nLine 2\n\"\"\"\n");
    const std::string text = result["text"];
    EXPECT_NE(text.find('\n'), std::string::npos);
}

TEST(ParseTomlTest, InvalidSyntax) {
    try {
        parse_toml("key = ", "broken.toml");
        FAIL() << "expected ParseError";
    } catch (const ParseError& err) {
        EXPECT_EQ(err.source(), "broken.toml");
        EXPECT_EQ(err.details().rfind("line 1", 0), 0u);
    }
}

// ============================================================================
// Files
// ============================================================================

TEST(LoadFileTest, JsonFile) {
    TempFile file(R"({"database": {"host": "localhost", "port": 5432}})");
    const Value result = load_json_file(file.path());
    EXPECT_EQ(result["database"]["host"], "localhost");
    EXPECT_EQ(result["database"]["port"], 5432);
}

TEST(LoadFileTest, TomlFile) {
    TempFile file("[database]\nhost = \"localhost\"\nport = 5432\n", ".toml");
    const Value result = load_toml_file(file.path());
    EXPECT_EQ(result["database"]["port"], 5432);
}

TEST(LoadFileTest, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/path.json"), FileNotFoundError);
    EXPECT_THROW(load_toml_file("/nonexistent/path.toml"), FileNotFoundError);
    EXPECT_THROW(load_document("/nonexistent/file.json"), FileNotFoundError);
}

TEST(LoadFileTest, ParseErrorNamesFile) {
    TempFile file("{ invalid json }");
    try {
        load_json_file(file.path());
        FAIL() << "expected ParseError";
    } catch (const ParseError& err) {
        EXPECT_EQ(err.source(), file.path());
    }
}

TEST(LoadDocumentTest, DetectsFormatByExtension) {
    TempFile json(R"({"key": "json"})", ".json");
    TempFile toml("key = \"toml\"", ".toml");
    EXPECT_EQ(load_document(json.path())["key"], "json");
    EXPECT_EQ(load_document(toml.path())["key"], "toml");
}

TEST(LoadDocumentTest, CaseInsensitiveExtension) {
    TempFile json(R"({"key": "json"})", ".JSON");
    TempFile toml("key = \"toml\"", ".TOML");
    EXPECT_EQ(load_document(json.path())["key"], "json");
    EXPECT_EQ(load_document(toml.path())["key"], "toml");
}

TEST(LoadDocumentTest, ExplicitFormatOverridesExtension) {
    TempFile file("key = \"toml\"", ".conf");

    LoadOptions options;
    options.format = Format::Toml;
    EXPECT_EQ(load_document(file.path(), options)["key"], "toml");
}

TEST(LoadDocumentTest, UnknownExtension) {
    TempFile file("content", ".yaml");
    EXPECT_THROW(load_document(file.path()), Error);
}

TEST(LoadDocumentTest, FileExtension) {
    EXPECT_EQ(get_file_extension("file.json"), ".json");
    EXPECT_EQ(get_file_extension("file.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("path/to/file.json"), ".json");
    EXPECT_EQ(get_file_extension("noextension"), "");
    EXPECT_EQ(get_file_extension("file.tar.gz"), ".gz");
}

// ============================================================================
// Decoding entry points
// ============================================================================

TEST(FromTextTest, FromJson) {
    const Service service = from_json<Service>(R"({
        "name": "api",
        "database": {"host": "db", "port": 5432},
        "tags": ["a", "b"]
    })");
    EXPECT_EQ(service.name, "api");
    EXPECT_EQ(service.database.port, 5432);
    EXPECT_EQ(service.tags, (std::vector<std::string>{"a", "b"}));
}

TEST(FromTextTest, FromToml) {
    const Service service = from_toml<Service>(R"(
name = "api"
tags = ["x"]

[database]
host = "db"
port = 5432
)");
    EXPECT_EQ(service.database.host, "db");
    EXPECT_EQ(service.tags.size(), 1u);
}

TEST(FromTextTest, DecodeErrorCarriesPath) {
    try {
        from_toml<Service>("name = \"api\"\ntags = []\n[database]\nhost = \"db\"\nport = 70000\n");
        FAIL() << "expected PathError";
    } catch (const PathError& err) {
        EXPECT_EQ(err.path().to_string(), "database.port");
        EXPECT_STREQ(err.original().what(), "invalid value: integer `70000`, expected u16");
    }
}

TEST(FromTextTest, SyntaxErrorIsNotAPathError) {
    EXPECT_THROW(from_json<Service>("{"), ParseError);
}

TEST(FromFileTest, DecodesEitherFormat) {
    TempFile json(R"({"name": "a", "database": {"host": "h", "port": 1}, "tags": []})");
    TempFile toml("name = \"b\"\ntags = []\n[database]\nhost = \"h\"\nport = 2\n", ".toml");

    EXPECT_EQ(from_file<Service>(json.path()).name, "a");
    EXPECT_EQ(from_file<Service>(toml.path()).database.port, 2);
}

TEST(FromFileTest, PathErrorFromFile) {
    TempFile file(R"({"name": "a", "database": {"host": "h", "port": 1}, "tags": [1]})");
    try {
        from_file<Service>(file.path());
        FAIL() << "expected PathError";
    } catch (const PathError& err) {
        EXPECT_EQ(err.path().to_string(), "tags[0]");
    }
}
