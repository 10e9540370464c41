#include "unbox/merger.hpp"
#include "unbox/path_utils.hpp"
#include "unbox/platform.hpp"

#include <algorithm>
#include <set>

namespace unbox {

Result<std::vector<std::string>> find_collisions(const std::string& temp_dir,
                                                 const std::string& destination) {
    auto box_contents = list_directory(temp_dir);
    if (box_contents.isErr()) {
        return box_contents;
    }

    std::vector<std::string> collisions;
    if (!path_exists(destination)) {
        return Result<std::vector<std::string>>::ok(std::move(collisions));
    }

    auto destination_contents = list_directory(destination);
    if (destination_contents.isErr()) {
        return destination_contents;
    }

    std::set<std::string> existing(destination_contents.value().begin(),
                                   destination_contents.value().end());
    for (const auto& name : box_contents.value()) {
        if (existing.count(name) != 0) {
            collisions.push_back(name);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(collisions));
}

Result<MergeReport> merge_into_destination(const std::string& temp_dir,
                                           const std::string& destination,
                                           bool force,
                                           const ConfirmOverwriteFn& ask) {
    MergeReport report;

    auto created = ensure_directory(destination);
    if (created.isErr()) {
        return Result<MergeReport>::err(created.error());
    }

    auto box_contents = list_directory(temp_dir);
    if (box_contents.isErr()) {
        return Result<MergeReport>::err(box_contents.error());
    }

    auto collisions = find_collisions(temp_dir, destination);
    if (collisions.isErr()) {
        return Result<MergeReport>::err(collisions.error());
    }
    std::set<std::string> colliding(collisions.value().begin(), collisions.value().end());

    for (const auto& name : box_contents.value()) {
        std::string src = join_path(temp_dir, name);
        std::string dst = join_path(destination, name);
        bool collides = colliding.count(name) != 0;

        if (collides && !force) {
            if (!ask) {
                report.skipped.push_back(name);
                continue;
            }

            auto overwrite = ask(name);
            if (!overwrite) {
                return Result<MergeReport>::err(
                    Error(ErrorCode::PROMPT_ABORTED, "overwrite prompt cancelled for " + name));
            }
            if (!*overwrite) {
                report.skipped.push_back(name);
                continue;
            }

            auto removed = remove_path(dst);
            if (removed.isErr()) {
                return Result<MergeReport>::err(removed.error().withContext("merge"));
            }
        }

        auto copied = copy_recursive(src, dst);
        if (copied.isErr()) {
            return Result<MergeReport>::err(copied.error().withContext("merge"));
        }

        if (collides) {
            report.overwritten.push_back(name);
        } else {
            report.copied.push_back(name);
        }
    }

    return Result<MergeReport>::ok(std::move(report));
}

Result<void> prepare_box_files(const std::string& temp_dir, const BoxConfig& config) {
    std::vector<std::string> needing_removal = config.ignore;
    needing_removal.push_back(BOX_CONFIG_FILE);
    needing_removal.push_back(BOX_INIT_FILE);

    for (const auto& entry : needing_removal) {
        auto target = normalize_under_root(temp_dir, entry);
        if (!target.ok) {
            return Result<void>::err(
                Error(ErrorCode::PATH_TRAVERSAL,
                      std::string(path_error_to_string(target.error)) + ": " + entry)
                    .withContext("ignore"));
        }
        // Never remove the box root itself
        if (target.path == to_portable_path(temp_dir)) {
            continue;
        }

        auto removed = remove_path(target.path);
        if (removed.isErr()) {
            return Result<void>::err(removed.error().withContext("ignore"));
        }
    }
    return Result<void>::ok();
}

} // namespace unbox
