#include <doctest/doctest.h>
#include <unbox/box_config.hpp>
#include <unbox/navigator.hpp>

#include "../test_helpers.hpp"

using namespace unbox;
using unbox_test::ScriptedChoiceProvider;

namespace {

// language -> framework -> files
Recipe two_level_recipe() {
    auto config = parse_box_config(R"({
        "recipes": {
            "specs": {
                "js": {
                    "hardhat": ["hardhat.config.js"],
                    "truffle": ["truffle-config.js"]
                },
                "ts": {
                    "hardhat": ["hardhat.config.ts"],
                    "truffle": ["truffle-config.ts"]
                }
            },
            "prompts": [{"message": "Language?"}, {"message": "Framework?"}]
        }
    })");
    REQUIRE(config.isOk());
    return *config.value().recipes;
}

} // namespace

// ============================================================================
// Option Splitting
// ============================================================================

TEST_CASE("split_recipe_option splits on commas") {
    auto tokens = split_recipe_option("ts,hardhat");
    REQUIRE(tokens.size() == 2);
    CHECK(tokens[0] == "ts");
    CHECK(tokens[1] == "hardhat");
}

TEST_CASE("split_recipe_option keeps empty tokens and does not trim") {
    auto tokens = split_recipe_option(",ts , ");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0] == "");
    CHECK(tokens[1] == "ts ");
    CHECK(tokens[2] == " ");
}

TEST_CASE("split_recipe_option of an empty string yields no presets") {
    CHECK(split_recipe_option("").empty());
}

// ============================================================================
// Navigation
// ============================================================================

TEST_CASE("valid presets resolve without prompting") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;

    auto result = resolve_recipe(recipe, {"ts", "truffle"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 0);
    CHECK(provider.choice_prompts.empty());
    REQUIRE(result.value().choices.size() == 2);
    CHECK(result.value().choices[0] == "ts");
    CHECK(result.value().choices[1] == "truffle");
    REQUIRE(result.value().files.size() == 1);
    CHECK(result.value().files[0].path == "truffle-config.ts");
}

TEST_CASE("an invalid first preset prompts at every depth") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("js"), std::string("hardhat")};

    // "truffle" would be valid at depth 1 but is never reused out of order
    auto result = resolve_recipe(recipe, {"rust", "truffle"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 2);
    REQUIRE(provider.choice_prompts.size() == 2);
    CHECK(provider.choice_prompts[0].message == "Language?");
    CHECK(provider.choice_prompts[1].message == "Framework?");
    CHECK(result.value().files[0].path == "hardhat.config.js");
}

TEST_CASE("prompted choices are offered in declaration order") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("ts"), std::string("hardhat")};

    auto result = resolve_recipe(recipe, {}, provider);
    REQUIRE(result.isOk());
    REQUIRE(provider.choice_prompts.size() == 2);
    const auto& offered = provider.choice_prompts[0].choices;
    REQUIRE(offered.size() == 2);
    CHECK(offered[0] == "js");
    CHECK(offered[1] == "ts");
}

TEST_CASE("a preset list shorter than the tree switches to prompting") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("hardhat")};

    auto result = resolve_recipe(recipe, {"ts"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 1);
    CHECK(result.value().files[0].path == "hardhat.config.ts");
}

TEST_CASE("an invalid second preset prompts only for the second depth") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("truffle")};

    auto result = resolve_recipe(recipe, {"js", "foundry"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 1);
    CHECK(result.value().files[0].path == "truffle-config.js");
}

TEST_CASE("extra preset tokens are ignored") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;

    auto result = resolve_recipe(recipe, {"js", "hardhat", "extra"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 0);
}

TEST_CASE("a leaf at depth zero resolves immediately") {
    auto config = parse_box_config(R"({"recipes": {"specs": ["only.txt"]}})");
    REQUIRE(config.isOk());
    ScriptedChoiceProvider provider;

    auto result = resolve_recipe(*config.value().recipes, {"ignored"}, provider);
    REQUIRE(result.isOk());
    CHECK(result.value().prompts_issued == 0);
    CHECK(result.value().choices.empty());
    REQUIRE(result.value().files.size() == 1);
    CHECK(result.value().files[0].path == "only.txt");
}

TEST_CASE("missing prompt messages fall back to the default") {
    auto config = parse_box_config(R"({"recipes": {"specs": {"a": ["a.txt"], "b": ["b.txt"]}}})");
    REQUIRE(config.isOk());
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("b")};

    auto result = resolve_recipe(*config.value().recipes, {}, provider);
    REQUIRE(result.isOk());
    REQUIRE(provider.choice_prompts.size() == 1);
    CHECK(provider.choice_prompts[0].message == DEFAULT_RECIPE_PROMPT);
}

TEST_CASE("a cancelled prompt aborts resolution") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;

    auto result = resolve_recipe(recipe, {}, provider);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PROMPT_ABORTED);
}

TEST_CASE("an answer outside the offered choices is rejected") {
    Recipe recipe = two_level_recipe();
    ScriptedChoiceProvider provider;
    provider.choice_answers = {std::string("rust")};

    auto result = resolve_recipe(recipe, {}, provider);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_CHOICE);
}
