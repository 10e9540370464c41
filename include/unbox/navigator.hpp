#pragma once

#include "unbox/box_config.hpp"
#include "unbox/choice_provider.hpp"
#include "unbox/result.hpp"

#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Recipe Tree Navigation
// ============================================================================

// Prompt used at depths the recipe declares no message for
constexpr const char* DEFAULT_RECIPE_PROMPT = "Select an option:";

struct ResolvedVariant {
    std::vector<std::string> choices;   // label selected at each depth
    std::vector<FileSpec> files;        // the reached leaf, without common files
    size_t prompts_issued = 0;
};

// Split a CLI recipe option ("ts,hardhat") into preset choices.
// No trimming; empty tokens are kept; an empty string yields no presets.
std::vector<std::string> split_recipe_option(const std::string& option);

// Walk recipe.specs down to a leaf.
// presets[depth] is taken without prompting while every preset so far has been
// a valid choice. The first invalid or missing preset switches to prompting
// for that depth and all deeper ones. Tokens beyond the tree depth are unused.
Result<ResolvedVariant> resolve_recipe(const Recipe& recipe,
                                       const std::vector<std::string>& presets,
                                       ChoiceProvider& provider);

} // namespace unbox
