#include <doctest/doctest.h>
#include <unbox/reconciler.hpp>

#include "../test_helpers.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

using namespace unbox;
using unbox_test::TempDir;
using unbox_test::exists;
using unbox_test::read_text;
using unbox_test::write_text;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

// ============================================================================
// Enumeration
// ============================================================================

TEST_CASE("list_files_recursive returns sorted relative file paths") {
    TempDir dir;
    write_text(dir.path(), "b.txt", "b");
    write_text(dir.path(), "a/z.txt", "z");
    write_text(dir.path(), "a/deep/y.txt", "y");
    fs::create_directories(dir.path("empty"));

    auto files = list_files_recursive(dir.path());
    REQUIRE(files.isOk());
    REQUIRE(files.value().size() == 3);
    CHECK(files.value()[0] == "a/deep/y.txt");
    CHECK(files.value()[1] == "a/z.txt");
    CHECK(files.value()[2] == "b.txt");
}

TEST_CASE("list_files_recursive reports symlinks as files without following them") {
    TempDir dir;
    write_text(dir.path(), "real/file.txt", "x");
    fs::create_directory_symlink(dir.path("real"), dir.path("link"));

    auto files = list_files_recursive(dir.path());
    REQUIRE(files.isOk());
    REQUIRE(files.value().size() == 2);
    CHECK(files.value()[0] == "link");
    CHECK(files.value()[1] == "real/file.txt");
}

TEST_CASE("list_files_recursive fails for a missing directory") {
    TempDir dir;
    auto files = list_files_recursive(dir.path("missing"));
    CHECK(files.isErr());
}

// ============================================================================
// Empty Directory Pruning
// ============================================================================

TEST_CASE("remove_empty_dirs removes nested empty directories bottom-up") {
    TempDir dir;
    fs::create_directories(dir.path("a/b/c"));
    write_text(dir.path(), "keep/file.txt", "x");
    fs::create_directories(dir.path("keep/empty"));

    auto removed = remove_empty_dirs(dir.path());
    REQUIRE(removed.isOk());
    CHECK(contains(removed.value(), "a/b/c"));
    CHECK(contains(removed.value(), "a/b"));
    CHECK(contains(removed.value(), "a"));
    CHECK(contains(removed.value(), "keep/empty"));
    CHECK(removed.value().size() == 4);

    CHECK_FALSE(exists(dir.path(), "a"));
    CHECK(exists(dir.path(), "keep/file.txt"));
    CHECK_FALSE(exists(dir.path(), "keep/empty"));
}

TEST_CASE("remove_empty_dirs never removes the root") {
    TempDir dir;
    fs::create_directories(dir.path("only/empty"));

    auto removed = remove_empty_dirs(dir.path());
    REQUIRE(removed.isOk());
    CHECK(fs::is_directory(dir.path()));
    CHECK(fs::is_empty(dir.path()));
}

TEST_CASE("remove_empty_dirs on a file is a no-op") {
    TempDir dir;
    write_text(dir.path(), "file.txt", "x");

    auto removed = remove_empty_dirs(dir.path("file.txt"));
    REQUIRE(removed.isOk());
    CHECK(removed.value().empty());
    CHECK(exists(dir.path(), "file.txt"));
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_CASE("reconcile deletes files outside the manifest and applies moves") {
    TempDir dir;
    write_text(dir.path(), "a.js", "js");
    write_text(dir.path(), "a.ts", "ts");
    write_text(dir.path(), "tpl.txt", "template");
    write_text(dir.path(), "README.md", "readme");
    write_text(dir.path(), "extra.md", "extra");
    write_text(dir.path(), "old/stale.txt", "stale");

    TargetManifest manifest;
    manifest.paths = {"a.ts", "tpl.txt", "README.md"};
    manifest.moves = {MoveSpec{"tpl.txt", "src/tpl.txt"}};

    auto report = reconcile(dir.path(), manifest);
    REQUIRE(report.isOk());

    CHECK_FALSE(exists(dir.path(), "a.js"));
    CHECK_FALSE(exists(dir.path(), "extra.md"));
    CHECK_FALSE(exists(dir.path(), "old"));
    CHECK_FALSE(exists(dir.path(), "tpl.txt"));
    CHECK(read_text(dir.path(), "src/tpl.txt") == "template");
    CHECK(exists(dir.path(), "a.ts"));
    CHECK(exists(dir.path(), "README.md"));

    CHECK(report.value().deleted.size() == 3);
    CHECK(contains(report.value().deleted, "old/stale.txt"));
    REQUIRE(report.value().moved.size() == 1);
    CHECK(report.value().moved[0].to == "src/tpl.txt");
    CHECK(contains(report.value().removed_dirs, "old"));
}

TEST_CASE("after reconcile only manifest paths and move targets remain") {
    TempDir dir;
    write_text(dir.path(), "keep.txt", "1");
    write_text(dir.path(), "nested/keep.txt", "2");
    write_text(dir.path(), "nested/drop.txt", "3");
    write_text(dir.path(), "move/me.txt", "4");
    write_text(dir.path(), "x/y/z.txt", "5");

    TargetManifest manifest;
    manifest.paths = {"keep.txt", "nested/keep.txt", "move/me.txt"};
    manifest.moves = {MoveSpec{"move/me.txt", "moved/me.txt"}};

    REQUIRE(reconcile(dir.path(), manifest).isOk());

    auto files = list_files_recursive(dir.path());
    REQUIRE(files.isOk());
    for (const auto& file : files.value()) {
        bool expected = manifest.contains(file) || file == "moved/me.txt";
        CHECK_MESSAGE(expected, "unexpected file left behind: " << file);
    }
    CHECK(files.value().size() == 3);
    CHECK_FALSE(exists(dir.path(), "move"));
    CHECK_FALSE(exists(dir.path(), "x"));
}

TEST_CASE("reconcile twice is idempotent") {
    TempDir dir;
    write_text(dir.path(), "a.ts", "ts");
    write_text(dir.path(), "a.js", "js");
    write_text(dir.path(), "tpl.txt", "template");

    TargetManifest manifest;
    manifest.paths = {"a.ts", "tpl.txt"};
    manifest.moves = {MoveSpec{"tpl.txt", "src/tpl.txt"}};

    REQUIRE(reconcile(dir.path(), manifest).isOk());

    auto second = reconcile(dir.path(), manifest);
    REQUIRE(second.isOk());
    CHECK(second.value().deleted.empty());
    CHECK(second.value().moved.empty());
    CHECK(second.value().removed_dirs.empty());
    REQUIRE(second.value().already_applied.size() == 1);
    CHECK(second.value().already_applied[0] == (MoveSpec{"tpl.txt", "src/tpl.txt"}));
    CHECK(read_text(dir.path(), "src/tpl.txt") == "template");
    CHECK(exists(dir.path(), "a.ts"));
}

TEST_CASE("reconcile reports a move whose target already exists as already applied") {
    TempDir dir;
    write_text(dir.path(), "a.ts", "ts");
    write_text(dir.path(), "src/tpl.txt", "shipped");

    TargetManifest manifest;
    manifest.paths = {"a.ts", "tpl.txt"};
    manifest.moves = {MoveSpec{"tpl.txt", "src/tpl.txt"}};

    auto report = reconcile(dir.path(), manifest);
    REQUIRE(report.isOk());
    CHECK(report.value().moved.empty());
    CHECK(report.value().deleted.empty());
    REQUIRE(report.value().already_applied.size() == 1);
    CHECK(report.value().already_applied[0].from == "tpl.txt");
    CHECK(report.value().already_applied[0].to == "src/tpl.txt");
    CHECK(read_text(dir.path(), "src/tpl.txt") == "shipped");
}

TEST_CASE("reconcile fails when a move source is missing") {
    TempDir dir;
    write_text(dir.path(), "a.ts", "ts");

    TargetManifest manifest;
    manifest.paths = {"a.ts", "missing.txt"};
    manifest.moves = {MoveSpec{"missing.txt", "src/missing.txt"}};

    auto report = reconcile(dir.path(), manifest);
    REQUIRE(report.isErr());
    CHECK(report.error().code() == ErrorCode::CONFIG_MISMATCH);
    CHECK(report.error().message().find("move missing.txt -> src/missing.txt") == 0);
}

TEST_CASE("reconcile with an empty manifest empties the destination") {
    TempDir dir;
    write_text(dir.path(), "a/b.txt", "x");
    write_text(dir.path(), "c.txt", "y");

    auto report = reconcile(dir.path(), TargetManifest{});
    REQUIRE(report.isOk());
    CHECK(fs::is_directory(dir.path()));
    CHECK(fs::is_empty(dir.path()));
}
