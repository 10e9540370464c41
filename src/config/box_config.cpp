#include "unbox/box_config.hpp"
#include "unbox/path_utils.hpp"
#include "unbox/platform.hpp"

#include <nlohmann/json.hpp>

namespace unbox {

// Recipe choices are presented in declaration order, so keys must not be sorted
using json = nlohmann::ordered_json;

namespace {

Error mismatch(const std::string& where, const std::string& what) {
    return Error(ErrorCode::CONFIG_MISMATCH, where + ": " + what);
}

Result<std::string> parse_path(const json& value, const std::string& where) {
    if (!value.is_string()) {
        return Result<std::string>::err(mismatch(where, "expected a path string"));
    }

    std::string raw = value.get<std::string>();
    auto normalized = normalize_relative_path(raw);
    if (!normalized.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::PATH_TRAVERSAL,
                  where + ": " + path_error_to_string(normalized.error) + ": " + raw));
    }
    if (normalized.path.empty()) {
        return Result<std::string>::err(mismatch(where, "empty path"));
    }
    return Result<std::string>::ok(normalized.path);
}

Result<FileSpec> parse_file_spec(const json& value, const std::string& where) {
    if (value.is_string()) {
        auto path = parse_path(value, where);
        if (path.isErr()) return Result<FileSpec>::err(path.error());
        return Result<FileSpec>::ok(FileSpec::file(path.value()));
    }

    if (value.is_object() && value.contains("from") && value.contains("to")) {
        auto from = parse_path(value["from"], where + ".from");
        if (from.isErr()) return Result<FileSpec>::err(from.error());
        auto to = parse_path(value["to"], where + ".to");
        if (to.isErr()) return Result<FileSpec>::err(to.error());
        return Result<FileSpec>::ok(FileSpec::move(from.value(), to.value()));
    }

    return Result<FileSpec>::err(
        mismatch(where, "expected a path string or {\"from\", \"to\"} object"));
}

Result<std::vector<FileSpec>> parse_file_specs(const json& value, const std::string& where) {
    std::vector<FileSpec> specs;
    if (!value.is_array()) {
        return Result<std::vector<FileSpec>>::err(mismatch(where, "expected an array"));
    }
    for (size_t i = 0; i < value.size(); ++i) {
        auto spec = parse_file_spec(value[i], where + "[" + std::to_string(i) + "]");
        if (spec.isErr()) return Result<std::vector<FileSpec>>::err(spec.error());
        specs.push_back(std::move(spec.value()));
    }
    return Result<std::vector<FileSpec>>::ok(std::move(specs));
}

Result<RecipeScope> parse_scope(const json& value, const std::string& where) {
    RecipeScope scope;

    if (value.is_array()) {
        auto files = parse_file_specs(value, where);
        if (files.isErr()) return Result<RecipeScope>::err(files.error());
        scope.kind = ScopeKind::Leaf;
        scope.files = std::move(files.value());
        return Result<RecipeScope>::ok(std::move(scope));
    }

    if (!value.is_object()) {
        return Result<RecipeScope>::err(
            mismatch(where, "expected a file list or an object of choices"));
    }
    if (value.empty()) {
        return Result<RecipeScope>::err(mismatch(where, "has no choices"));
    }

    scope.kind = ScopeKind::Branch;
    for (auto& [label, child_json] : value.items()) {
        auto child = parse_scope(child_json, where + "." + label);
        if (child.isErr()) return child;
        scope.choice_labels.push_back(label);
        scope.children.push_back(std::move(child.value()));
    }
    return Result<RecipeScope>::ok(std::move(scope));
}

Result<std::vector<std::string>> parse_prompts(const json& value) {
    std::vector<std::string> prompts;
    if (!value.is_array()) {
        return Result<std::vector<std::string>>::err(
            mismatch("recipes.prompts", "expected an array"));
    }
    for (size_t i = 0; i < value.size(); ++i) {
        const auto& prompt = value[i];
        if (prompt.is_string()) {
            prompts.push_back(prompt.get<std::string>());
        } else if (prompt.is_object() && prompt.contains("message") &&
                   prompt["message"].is_string()) {
            prompts.push_back(prompt["message"].get<std::string>());
        } else {
            return Result<std::vector<std::string>>::err(
                mismatch("recipes.prompts[" + std::to_string(i) + "]",
                         "expected {\"message\": string}"));
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(prompts));
}

Result<std::optional<Recipe>> parse_recipes(const json& value) {
    using RecipeResult = Result<std::optional<Recipe>>;

    if (!value.is_object()) {
        return RecipeResult::err(mismatch("recipes", "expected an object"));
    }
    // No scopes at all: the recipe stage is skipped
    if (value.empty()) {
        return RecipeResult::ok(std::nullopt);
    }
    if (!value.contains("specs")) {
        return RecipeResult::err(mismatch("recipes", "specs missing"));
    }

    Recipe recipe;

    auto specs = parse_scope(value["specs"], "recipes.specs");
    if (specs.isErr()) return RecipeResult::err(specs.error());
    recipe.specs = std::move(specs.value());

    if (value.contains("common")) {
        auto common = parse_file_specs(value["common"], "recipes.common");
        if (common.isErr()) return RecipeResult::err(common.error());
        recipe.common = std::move(common.value());
    }

    if (value.contains("prompts")) {
        auto prompts = parse_prompts(value["prompts"]);
        if (prompts.isErr()) return RecipeResult::err(prompts.error());
        recipe.prompts = std::move(prompts.value());
    }

    return RecipeResult::ok(std::move(recipe));
}

} // namespace

const RecipeScope* RecipeScope::child(const std::string& label) const {
    for (size_t i = 0; i < choice_labels.size(); ++i) {
        if (choice_labels[i] == label) {
            return &children[i];
        }
    }
    return nullptr;
}

Result<BoxConfig> parse_box_config(const std::string& json_str,
                                   const std::string& source_path) {
    BoxConfig config;
    config.source_path = source_path;

    auto with_source = [&source_path](Error error) {
        if (!source_path.empty()) {
            error.withContext(source_path);
        }
        return Result<BoxConfig>::err(std::move(error));
    };

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return with_source(Error(ErrorCode::CONFIG_PARSE_ERROR, e.what()));
    }

    if (!j.is_object()) {
        return with_source(mismatch("box config", "JSON must be an object"));
    }

    // "ignore" section
    if (j.contains("ignore")) {
        const auto& ignore = j["ignore"];
        if (!ignore.is_array()) {
            return with_source(mismatch("ignore", "expected an array"));
        }
        for (const auto& entry : ignore) {
            if (!entry.is_string()) {
                return with_source(mismatch("ignore", "entries must be strings"));
            }
            config.ignore.push_back(entry.get<std::string>());
        }
    }

    // "commands" section
    if (j.contains("commands")) {
        const auto& commands = j["commands"];
        if (!commands.is_object()) {
            return with_source(mismatch("commands", "expected an object"));
        }
        for (auto& [label, command] : commands.items()) {
            if (!command.is_string()) {
                return with_source(mismatch("commands." + label, "expected a string"));
            }
            config.commands.emplace_back(label, command.get<std::string>());
        }
    }

    // "hooks" section
    if (j.contains("hooks")) {
        const auto& hooks = j["hooks"];
        if (!hooks.is_object()) {
            return with_source(mismatch("hooks", "expected an object"));
        }
        if (hooks.contains("post-unpack")) {
            if (!hooks["post-unpack"].is_string()) {
                return with_source(mismatch("hooks.post-unpack", "expected a string"));
            }
            config.hooks.post_unpack = hooks["post-unpack"].get<std::string>();
        }
    }

    // "recipes" section (OPTIONAL)
    if (j.contains("recipes")) {
        auto recipes = parse_recipes(j["recipes"]);
        if (recipes.isErr()) {
            return with_source(recipes.error());
        }
        config.recipes = std::move(recipes.value());
    }

    return Result<BoxConfig>::ok(std::move(config));
}

Result<BoxConfig> read_box_config(const std::string& box_dir) {
    std::string config_path = join_path(box_dir, BOX_CONFIG_FILE);

    auto content = read_file(config_path);
    if (!content) {
        return Result<BoxConfig>::err(
            Error(ErrorCode::SOURCE_NOT_FOUND, "box configuration not found: " + config_path));
    }

    return parse_box_config(*content, config_path);
}

} // namespace unbox
