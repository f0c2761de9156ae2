/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI commands (GoogleTest)
 *
 * Tests covering the diff, patch and merge commands through the command
 * functions used by the docpatch binary:
 * - output documents and patches
 * - exit codes for each failure class
 * - inputs read from a stream ("-")
 */

#include <gtest/gtest.h>

#include "docpatch/Commands.hpp"
#include "docpatch/Errors.hpp"
#include "docpatch/Loader.hpp"
#include "docpatch/Value.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace docpatch;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
        f.close();
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief Runs commands against in-memory streams
 */
class CommandTest : public ::testing::Test {
protected:
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    CommandOptions options;

    int run(const std::string& command, const std::string& left, const std::string& right) {
        return run_command(command, {left, right}, options, {in, out, err});
    }

    Value output() const {
        return Value::parse(out.str());
    }
};

// ============================================================================
// diff
// ============================================================================

TEST_F(CommandTest, DiffPrintsPatch) {
    TempFile left("docpatch_cli_left.json", R"({"title": "Goodbye!", "tags": ["a", "b"]})");
    TempFile right("docpatch_cli_right.json", R"({"title": "Hello!", "tags": ["a"]})");

    EXPECT_EQ(run("diff", left.path(), right.path()), kExitSuccess);
    EXPECT_EQ(output(), Value::parse(R"([
        {"op": "remove", "path": "/tags/1"},
        {"op": "replace", "path": "/title", "value": "Hello!"}
    ])"));
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CommandTest, DiffOfEqualDocumentsIsEmpty) {
    TempFile doc("docpatch_cli_same.json", R"({"a": 1})");
    EXPECT_EQ(run("diff", doc.path(), doc.path()), kExitSuccess);
    EXPECT_EQ(output(), Value::array());
}

TEST_F(CommandTest, DiffCompactOutput) {
    in.str(R"({"a": 1} {"a": 2})");
    options.indent = -1;
    EXPECT_EQ(run("diff", "-", "-"), kExitSuccess);
    EXPECT_EQ(out.str(), "[{\"op\":\"replace\",\"path\":\"/a\",\"value\":2}]\n");
}

TEST_F(CommandTest, DiffMissingFile) {
    EXPECT_EQ(run("diff", "/nonexistent/a.json", "/nonexistent/b.json"), kExitUsageError);
    EXPECT_NE(err.str().find("not found"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// patch
// ============================================================================

TEST_F(CommandTest, PatchAppliesAndPrints) {
    TempFile doc("docpatch_cli_doc.json", R"({"title": "Old"})");
    TempFile patch("docpatch_cli_patch.json", R"([
        {"op": "test", "path": "/title", "value": "Old"},
        {"op": "replace", "path": "/title", "value": "New"}
    ])");

    EXPECT_EQ(run("patch", doc.path(), patch.path()), kExitSuccess);
    EXPECT_EQ(output(), Value({{"title", "New"}}));
}

TEST_F(CommandTest, PatchFromStdin) {
    TempFile doc("docpatch_cli_stdin_doc.json", R"({"n": [1]})");
    in.str(R"([{"op": "add", "path": "/n/-", "value": 2}])");

    EXPECT_EQ(run("patch", doc.path(), "-"), kExitSuccess);
    EXPECT_EQ(output(), Value::parse(R"({"n": [1, 2]})"));
}

TEST_F(CommandTest, PatchBothFromStdin) {
    in.str(R"({"a": 1}
              [{"op": "remove", "path": "/a"}])");
    EXPECT_EQ(run("patch", "-", "-"), kExitSuccess);
    EXPECT_EQ(output(), Value::object());
}

TEST_F(CommandTest, PatchThatDoesNotApply) {
    in.str(R"({"title": "Other"}
              [{"op": "test", "path": "/title", "value": "Old"}])");
    EXPECT_EQ(run("patch", "-", "-"), kExitPatchFailed);
    EXPECT_NE(err.str().find("Patch did not apply"), std::string::npos);
    EXPECT_NE(err.str().find("test failed at operation 0"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandTest, InvalidPatchDocument) {
    in.str(R"({"a": 1} [{"op": "explode", "path": "/a"}])");
    EXPECT_EQ(run("patch", "-", "-"), kExitInvalidPatch);
    EXPECT_NE(err.str().find("unknown operation 'explode'"), std::string::npos);
}

TEST_F(CommandTest, PatchNotAnArray) {
    in.str(R"({"a": 1} {"op": "remove", "path": "/a"})");
    EXPECT_EQ(run("patch", "-", "-"), kExitInvalidPatch);
}

TEST_F(CommandTest, UnsafePatchKeepsPrefixButFails) {
    in.str(R"({"a": 1} [{"op": "remove", "path": "/a"}, {"op": "remove", "path": "/a"}])");
    options.unsafe = true;
    EXPECT_EQ(run("patch", "-", "-"), kExitPatchFailed);
    EXPECT_NE(err.str().find("at operation 1"), std::string::npos);
}

TEST_F(CommandTest, PatchOutputAsToml) {
    in.str(R"({"server": {"port": 80}} [{"op": "replace", "path": "/server/port", "value": 8080}])");
    options.format = OutputFormat::Toml;
    EXPECT_EQ(run("patch", "-", "-"), kExitSuccess);

    TempFile written("docpatch_cli_out.toml", out.str());
    EXPECT_EQ(load_document(written.path()), Value::parse(R"({"server": {"port": 8080}})"));
}

TEST_F(CommandTest, TomlOutputNeedsObject) {
    in.str(R"([1] [{"op": "add", "path": "/-", "value": 2}])");
    options.format = OutputFormat::Toml;
    EXPECT_EQ(run("patch", "-", "-"), kExitUsageError);
}

// ============================================================================
// merge
// ============================================================================

TEST_F(CommandTest, MergePrintsResult) {
    TempFile doc("docpatch_cli_merge_doc.toml", "title = \"Goodbye!\"\n[author]\ngivenName = \"John\"\nfamilyName = \"Doe\"\n");
    TempFile overlay("docpatch_cli_merge_overlay.json", R"({"title": "Hello!", "author": {"familyName": null}})");

    EXPECT_EQ(run("merge", doc.path(), overlay.path()), kExitSuccess);
    EXPECT_EQ(output(), Value::parse(R"({"title": "Hello!", "author": {"givenName": "John"}})"));
}

TEST_F(CommandTest, MergeUnparsableInput) {
    in.str(R"({"a": 1} {broken)");
    EXPECT_EQ(run("merge", "-", "-"), kExitUsageError);
    EXPECT_NE(err.str().find("Parse error"), std::string::npos);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(CommandTest, UnknownCommand) {
    EXPECT_EQ(run("convert", "a", "b"), kExitUsageError);
    EXPECT_NE(err.str().find("Unknown command: convert"), std::string::npos);
}

TEST_F(CommandTest, WrongArgumentCount) {
    EXPECT_EQ(run_command("diff", {"only-one"}, options, {in, out, err}), kExitUsageError);
    EXPECT_EQ(run_command("merge", {"a", "b", "c"}, options, {in, out, err}), kExitUsageError);
    EXPECT_NE(err.str().find("expects exactly two inputs"), std::string::npos);
}

TEST(OutputFormatName, Parses) {
    EXPECT_EQ(parse_output_format("json"), OutputFormat::Json);
    EXPECT_EQ(parse_output_format("toml"), OutputFormat::Toml);
    EXPECT_THROW(parse_output_format("yaml"), Error);
}
