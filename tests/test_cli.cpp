/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI functionality (GoogleTest)
 *
 * Tests covering the steps behind each CLI command:
 * - get: read a document from a stream, resolve a pointer
 * - set: parse the value argument, write it, dump or save the document
 * - delete: splice or null an element, save the document
 * - list: "pointer = value" lines for every leaf
 * - split / join: pointer string handling
 *
 * Note: These tests verify the underlying functions used by the CLI,
 * not the full CLI binary.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "jptr/Errors.hpp"
#include "jptr/Loader.hpp"
#include "jptr/Parse.hpp"
#include "jptr/Pointer.hpp"
#include "jptr/Traverse.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace jptr;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for an output file path that is removed afterwards
 */
class TempPath {
public:
    TempPath()
        : path_(fs::temp_directory_path() /
                ("jptr_cli_" + std::to_string(std::rand()) + ".json")) {}

    ~TempPath() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

class CliTest : public ::testing::Test {
protected:
    Value read_input(const std::string& text) {
        std::istringstream in(text);
        return load_json_stream(in);
    }

    std::vector<std::string> list_lines(const Value& doc, bool fragment = false) {
        std::vector<std::string> lines;
        for (const auto& [pointer, value] : flatten_to_pointers(doc, fragment)) {
            lines.push_back(pointer + " = " + value.dump());
        }
        return lines;
    }
};

// ============================================================================
// get
// ============================================================================

TEST_F(CliTest, GetPrintsResolvedValue) {
    Value doc = read_input(R"({"db": {"hosts": ["a", "b"]}})");

    const Value* found = get(doc, "/db/hosts");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->dump(), R"(["a","b"])");
}

TEST_F(CliTest, GetMissingReportsAbsent) {
    Value doc = read_input(R"({"db": {}})");
    EXPECT_EQ(get(doc, "/db/port"), nullptr);
}

TEST_F(CliTest, InvalidInputThrows) {
    EXPECT_THROW(read_input("{oops"), DocumentParseError);
}

// ============================================================================
// set
// ============================================================================

TEST_F(CliTest, SetParsesValueArgument) {
    Value doc = read_input(R"({"server": {"port": 80}})");

    set(doc, "/server/port", parse_value("8080"));
    set(doc, "/server/debug", parse_value("TRUE"));
    set(doc, "/server/name", parse_value("edge 1"));
    set(doc, "/server/tags", parse_value(R"(["a","b"])"));

    EXPECT_EQ(doc["server"]["port"], 8080);
    EXPECT_EQ(doc["server"]["debug"], true);
    EXPECT_EQ(doc["server"]["name"], "edge 1");
    EXPECT_EQ(doc["server"]["tags"], Value::array({"a", "b"}));
}

TEST_F(CliTest, SetAppendsAndWritesFile) {
    Value doc = read_input(R"({"list": [1]})");
    TempPath out;

    write_json_file(out.path(), set(doc, "/list/[]", parse_value("2")), -1);

    EXPECT_EQ(load_json_file(out.path()), (Value{{"list", {1, 2}}}));
}

TEST_F(CliTest, SetIntoScalarDocumentThrows) {
    Value doc = read_input("42");
    EXPECT_THROW(set(doc, "/a", parse_value("1")), TypeError);
}

// ============================================================================
// delete
// ============================================================================

TEST_F(CliTest, DeleteSplicesByDefault) {
    Value doc = read_input(R"({"list": [1, 2, 3]})");
    EXPECT_EQ(remove(doc, "/list/0").dump(), R"({"list":[2,3]})");
}

TEST_F(CliTest, DeleteKeepIndices) {
    Value doc = read_input(R"({"list": [1, 2, 3]})");
    EXPECT_EQ(remove(doc, "/list/0", true).dump(), R"({"list":[null,2,3]})");
}

// ============================================================================
// list
// ============================================================================

TEST_F(CliTest, ListPrintsEveryLeaf) {
    Value doc = read_input(R"({"a": {"b": 1, "c d": [true]}, "e": {}})");

    std::vector<std::string> expected = {"/a/b = 1", "/a/c d/0 = true", "/e = {}"};
    EXPECT_EQ(list_lines(doc), expected);
}

TEST_F(CliTest, ListFragmentForm) {
    Value doc = read_input(R"({"c d": 1})");

    std::vector<std::string> expected = {"#/c%20d = 1"};
    EXPECT_EQ(list_lines(doc, true), expected);
}

// ============================================================================
// split / join
// ============================================================================

TEST_F(CliTest, SplitPrintsDecodedSegments) {
    Segments expected = {"a/b", "m~n", ""};
    EXPECT_EQ(split("/a~1b/m~0n/"), expected);
}

TEST_F(CliTest, JoinArgumentsRelative) {
    EXPECT_EQ(join_pointers({"/a/b", "../c", "[]"}), "/a/c/[]");
    EXPECT_EQ(join_pointers({"#/my value/to%20parent", "../to~1child"}),
              "#/my%20value/to~1child");
}
