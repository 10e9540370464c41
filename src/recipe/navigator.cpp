#include "unbox/navigator.hpp"

#include <algorithm>

namespace unbox {

std::vector<std::string> split_recipe_option(const std::string& option) {
    std::vector<std::string> tokens;
    if (option.empty()) {
        return tokens;
    }

    size_t start = 0;
    while (true) {
        size_t comma = option.find(',', start);
        if (comma == std::string::npos) {
            tokens.push_back(option.substr(start));
            break;
        }
        tokens.push_back(option.substr(start, comma - start));
        start = comma + 1;
    }
    return tokens;
}

Result<ResolvedVariant> resolve_recipe(const Recipe& recipe,
                                       const std::vector<std::string>& presets,
                                       ChoiceProvider& provider) {
    ResolvedVariant resolved;

    bool using_presets = !presets.empty();
    const RecipeScope* current = &recipe.specs;
    size_t depth = 0;

    while (!current->isLeaf()) {
        const auto& choices = current->choice_labels;
        std::string selected;

        if (using_presets && depth < presets.size() &&
            std::find(choices.begin(), choices.end(), presets[depth]) != choices.end()) {
            selected = presets[depth];
        } else {
            using_presets = false;

            const std::string& message = depth < recipe.prompts.size()
                ? recipe.prompts[depth]
                : std::string(DEFAULT_RECIPE_PROMPT);

            auto answer = provider.askChoice(message, choices);
            ++resolved.prompts_issued;
            if (!answer) {
                return Result<ResolvedVariant>::err(
                    Error(ErrorCode::PROMPT_ABORTED, "recipe selection cancelled"));
            }
            if (std::find(choices.begin(), choices.end(), *answer) == choices.end()) {
                return Result<ResolvedVariant>::err(
                    Error(ErrorCode::INVALID_CHOICE, "not a recipe choice: " + *answer));
            }
            selected = *answer;
        }

        resolved.choices.push_back(selected);
        current = current->child(selected);
        ++depth;
    }

    resolved.files = current->files;
    return Result<ResolvedVariant>::ok(std::move(resolved));
}

} // namespace unbox
