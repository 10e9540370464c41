#include <doctest/doctest.h>
#include <unbox/path_utils.hpp>

using unbox::PathError;
using unbox::normalize_relative_path;
using unbox::normalize_under_root;

TEST_CASE("normalize plain relative path") {
    auto r = normalize_relative_path("src/index.ts");
    REQUIRE(r.ok);
    CHECK(r.path == "src/index.ts");
}

TEST_CASE("collapse dot, empty and dotdot segments") {
    auto r = normalize_relative_path("./src//lib/../tpl.txt/");
    REQUIRE(r.ok);
    CHECK(r.path == "src/tpl.txt");
}

TEST_CASE("backslashes become forward slashes") {
    auto r = normalize_relative_path("contracts\\Migrations.sol");
    REQUIRE(r.ok);
    CHECK(r.path == "contracts/Migrations.sol");
}

TEST_CASE("the root itself normalizes to an empty path") {
    auto r = normalize_relative_path("./");
    REQUIRE(r.ok);
    CHECK(r.path.empty());
}

TEST_CASE("reject escape above root") {
    auto r = normalize_relative_path("src/../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute paths") {
    auto r = normalize_relative_path("/etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject drive letter paths") {
    auto r = normalize_relative_path("C:/Windows");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("src/\0a.js", 9);
    auto r = normalize_relative_path(bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

// ============================================================================
// Paths Under a Root
// ============================================================================

TEST_CASE("normalize under root joins onto the root") {
    auto r = normalize_under_root("/tmp/box", "./a/./b.txt");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/box/a/b.txt");
}

TEST_CASE("normalize under root of the root is the root") {
    auto r = normalize_under_root("/tmp/box", ".");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/box");
}

TEST_CASE("normalize under root rejects escapes") {
    auto r = normalize_under_root("/tmp/box", "../other");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("path errors have readable descriptions") {
    CHECK(std::string(unbox::path_error_to_string(PathError::EscapesRoot)) == "path escapes root");
    CHECK(std::string(unbox::path_error_to_string(PathError::None)) == "none");
}
