#include <doctest/doctest.h>
#include <unbox/target_manifest.hpp>

using namespace unbox;

TEST_CASE("build_target_manifest unions leaf and common paths") {
    std::vector<FileSpec> leaf = {FileSpec::file("a.ts"), FileSpec::file("README.md")};
    std::vector<FileSpec> common = {FileSpec::file("README.md"), FileSpec::file("LICENSE")};

    auto manifest = build_target_manifest(leaf, common);
    CHECK(manifest.paths.size() == 3);
    CHECK(manifest.contains("a.ts"));
    CHECK(manifest.contains("README.md"));
    CHECK(manifest.contains("LICENSE"));
    CHECK(manifest.moves.empty());
}

TEST_CASE("build_target_manifest keeps move sources and move order") {
    std::vector<FileSpec> leaf = {FileSpec::move("tpl.txt", "src/tpl.txt")};
    std::vector<FileSpec> common = {FileSpec::move("env.example", ".env")};

    auto manifest = build_target_manifest(leaf, common);
    CHECK(manifest.contains("tpl.txt"));
    CHECK(manifest.contains("env.example"));
    CHECK_FALSE(manifest.contains("src/tpl.txt"));

    REQUIRE(manifest.moves.size() == 2);
    CHECK(manifest.moves[0].from == "tpl.txt");
    CHECK(manifest.moves[0].to == "src/tpl.txt");
    CHECK(manifest.moves[1].from == "env.example");
    CHECK(manifest.moves[1].to == ".env");
}

TEST_CASE("build_target_manifest of nothing is empty") {
    auto manifest = build_target_manifest({}, {});
    CHECK(manifest.paths.empty());
    CHECK(manifest.moves.empty());
}
