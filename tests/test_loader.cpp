/**
 * @file test_loader.cpp
 * @brief Tests for document loading (GoogleTest)
 *
 * Tests cover:
 * - JSON loading with member order preserved
 * - TOML loading, including dates
 * - Format detection by extension
 * - Missing files, syntax errors, unsupported extensions
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "pathflat/Loader.hpp"
#include "pathflat/Flatten.hpp"
#include "pathflat/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace pathflat;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension)
        : path_(fs::temp_directory_path() /
                ("pathflat_test_" + std::to_string(std::rand()) + extension)) {
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

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonFile, PreservesMemberOrder) {
    TempFile file(R"({"zeta": 1, "alpha": {"k": "v"}, "mid": [true, null]})", ".json");

    Value doc = load_json_file(file.path());

    ASSERT_TRUE(doc.is_object());
    auto it = doc.begin();
    EXPECT_EQ(it.key(), "zeta");
    ++it;
    EXPECT_EQ(it.key(), "alpha");
    ++it;
    EXPECT_EQ(it.key(), "mid");
}

TEST(LoadJsonFile, NonObjectRoot) {
    TempFile file(R"([{"name": "Item1"}, {"name": "Item2"}])", ".json");

    Value doc = load_json_file(file.path());

    ASSERT_TRUE(doc.is_array());
    auto flat = flatten(doc);
    EXPECT_EQ(flat.at("/1/name"), "Item2");
}

TEST(LoadJsonFile, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/pathflat/input.json"), DocumentNotFoundError);
}

TEST(LoadJsonFile, SyntaxError) {
    TempFile file(R"({"a": 1,,})", ".json");

    try {
        load_json_file(file.path());
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_FALSE(e.details().empty());
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, TablesAndArrays) {
    TempFile file(
        "title = \"shop\"\n"
        "[user]\n"
        "name = \"Alice\"\n"
        "tags = [\"admin\", \"editor\"]\n"
        "age = 30\n"
        "ratio = 0.5\n"
        "active = true\n",
        ".toml");

    Value doc = load_toml_file(file.path());

    EXPECT_EQ(doc["title"], "shop");
    EXPECT_EQ(doc["user"]["name"], "Alice");
    EXPECT_EQ(doc["user"]["tags"][1], "editor");
    EXPECT_EQ(doc["user"]["age"], 30);
    EXPECT_EQ(doc["user"]["ratio"], 0.5);
    EXPECT_EQ(doc["user"]["active"], true);
}

TEST(LoadTomlFile, DatesBecomeText) {
    TempFile file("born = 1979-05-27\n", ".toml");

    Value doc = load_toml_file(file.path());

    ASSERT_TRUE(doc["born"].is_string());
    EXPECT_EQ(doc["born"], "1979-05-27");
}

TEST(LoadTomlFile, ArrayOfTables) {
    TempFile file(
        "[[items]]\n"
        "name = \"Item1\"\n"
        "[[items]]\n"
        "name = \"Item2\"\n",
        ".toml");

    auto flat = flatten(load_toml_file(file.path()), "/store");

    FlatMap expected{{"/store/items/0/name", "Item1"}, {"/store/items/1/name", "Item2"}};
    EXPECT_EQ(flat, expected);
}

TEST(LoadTomlFile, SyntaxErrorReportsPosition) {
    TempFile file("ok = 1\nbroken = \n", ".toml");

    try {
        load_toml_file(file.path());
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_GT(e.column(), 0);
    }
}

TEST(LoadTomlFile, MissingFile) {
    EXPECT_THROW(load_toml_file("/nonexistent/pathflat/input.toml"), DocumentNotFoundError);
}

// ============================================================================
// Auto-detect
// ============================================================================

TEST(LoadDocument, DetectsJson) {
    TempFile file(R"({"a": {"b": 1}})", ".json");
    EXPECT_EQ(load_document(file.path())["a"]["b"], 1);
}

TEST(LoadDocument, DetectsToml) {
    TempFile file("[a]\nb = 1\n", ".toml");
    EXPECT_EQ(load_document(file.path())["a"]["b"], 1);
}

TEST(LoadDocument, ExtensionIsCaseInsensitive) {
    TempFile file(R"({"a": 1})", ".JSON");
    EXPECT_EQ(load_document(file.path())["a"], 1);
}

TEST(LoadDocument, UnsupportedExtension) {
    TempFile file("a: 1\n", ".yaml");

    try {
        load_document(file.path());
        FAIL() << "Expected UnsupportedFormatError";
    } catch (const UnsupportedFormatError& e) {
        EXPECT_EQ(e.extension(), ".yaml");
    }
}

TEST(LoadDocument, MissingFileCheckedBeforeExtension) {
    EXPECT_THROW(load_document("/nonexistent/pathflat/input.yaml"), DocumentNotFoundError);
}

TEST(FormatOf, KnownExtensions) {
    EXPECT_EQ(format_of("a/b/c.json"), DocumentFormat::Json);
    EXPECT_EQ(format_of("c.Toml"), DocumentFormat::Toml);
    EXPECT_THROW(format_of("noext"), UnsupportedFormatError);
}

TEST(GetFileExtension, Lowercases) {
    EXPECT_EQ(get_file_extension("/tmp/x.JSON"), ".json");
    EXPECT_EQ(get_file_extension("/tmp/x"), "");
}

// ============================================================================
// In-memory parsing
// ============================================================================

TEST(ParseDocument, JsonText) {
    Value doc = parse_document(R"({"b": null, "a": ""})", DocumentFormat::Json);

    EXPECT_EQ(doc.begin().key(), "b");
    EXPECT_TRUE(flatten(doc, false).empty());
}

TEST(ParseDocument, TomlText) {
    Value doc = parse_document("x = 1\n", DocumentFormat::Toml);
    EXPECT_EQ(doc["x"], 1);
}

TEST(ParseDocument, ErrorUsesSourceName) {
    try {
        parse_document("{", DocumentFormat::Json, "<stdin>");
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.file(), "<stdin>");
        EXPECT_NE(std::string(e.what()).find("<stdin>"), std::string::npos);
    }
}
