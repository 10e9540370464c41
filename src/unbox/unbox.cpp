#include "unbox/unbox.hpp"
#include "unbox/box_config.hpp"
#include "unbox/hooks.hpp"
#include "unbox/navigator.hpp"
#include "unbox/platform.hpp"
#include "unbox/target_manifest.hpp"

namespace unbox {

namespace {

ConfirmOverwriteFn collision_prompt(ChoiceProvider& provider) {
    return [&provider](const std::string& name) -> std::optional<bool> {
        provider.notify(name + " already exists in this directory...");
        return provider.askConfirm("Overwrite " + name + "?", false);
    };
}

} // namespace

Result<UnboxReport> unbox(const UnboxOptions& options, ChoiceProvider& provider) {
    UnboxReport report;
    report.destination = absolute_path(options.destination.empty() ? "." : options.destination);

    // Source
    auto parsed = parse_box_source(options.source, options.endpoints);
    if (parsed.isErr()) {
        return Result<UnboxReport>::err(parsed.error());
    }
    report.source = parsed.value();

    auto verified = verify_box_source(report.source, options.endpoints);
    if (verified.isErr()) {
        return Result<UnboxReport>::err(verified.error());
    }

    // Scratch directory
    auto temp_path = create_temp_directory(options.temp_root);
    if (temp_path.isErr()) {
        return Result<UnboxReport>::err(temp_path.error().withContext("temp directory"));
    }
    ScopedDirectory scratch(temp_path.value());

    auto fetched = fetch_box(report.source, scratch.path(), options.expected_sha256,
                             options.endpoints);
    if (fetched.isErr()) {
        return Result<UnboxReport>::err(fetched.error());
    }
    report.archive_sha256 = fetched.value().archive_sha256;
    report.warnings = std::move(fetched.value().warnings);

    auto config = read_box_config(scratch.path());
    if (config.isErr()) {
        return Result<UnboxReport>::err(config.error());
    }
    const BoxConfig& box = config.value();
    report.commands = box.commands;

    auto prepared = prepare_box_files(scratch.path(), box);
    if (prepared.isErr()) {
        return Result<UnboxReport>::err(prepared.error());
    }

    // Merge
    auto merged = merge_into_destination(scratch.path(), report.destination, options.force,
                                         collision_prompt(provider));
    if (merged.isErr()) {
        return Result<UnboxReport>::err(merged.error());
    }
    report.merge = std::move(merged.value());

    // Recipe
    if (box.recipes) {
        std::vector<std::string> presets;
        if (options.recipe_option) {
            presets = split_recipe_option(*options.recipe_option);
        }

        auto variant = resolve_recipe(*box.recipes, presets, provider);
        if (variant.isErr()) {
            return Result<UnboxReport>::err(variant.error().withContext("recipe"));
        }
        report.recipe_choices = variant.value().choices;
        report.prompts_issued = variant.value().prompts_issued;

        auto manifest = build_target_manifest(variant.value().files, box.recipes->common);

        auto reconciled = reconcile(report.destination, manifest);
        if (reconciled.isErr()) {
            return Result<UnboxReport>::err(reconciled.error().withContext("recipe"));
        }
        report.reconcile = std::move(reconciled.value());
        for (const auto& mv : report.reconcile.already_applied) {
            report.warnings.push_back("move " + mv.from + " -> " + mv.to +
                                      " skipped: " + mv.from + " is missing and " + mv.to +
                                      " already exists");
        }
        report.recipe_applied = true;
    }

    // Hook
    if (options.run_hooks && !box.hooks.post_unpack.empty()) {
        report.hook_command = box.hooks.post_unpack;
        auto hook = run_post_unpack_hook(box.hooks.post_unpack, report.destination);
        if (hook.isErr()) {
            return Result<UnboxReport>::err(hook.error());
        }
        report.hook_ran = true;
    }

    return Result<UnboxReport>::ok(std::move(report));
}

} // namespace unbox
