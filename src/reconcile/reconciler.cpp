#include "unbox/reconciler.hpp"
#include "unbox/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

namespace unbox {

namespace fs = std::filesystem;

namespace {

Result<void> collect_files(const std::string& dir, const std::string& relative_dir,
                           std::vector<std::string>& out) {
    auto entries = list_directory(dir);
    if (entries.isErr()) {
        return Result<void>::err(entries.error());
    }

    for (const auto& name : entries.value()) {
        std::string abs_path = join_path(dir, name);
        std::string rel_path = relative_dir.empty() ? name : relative_dir + "/" + name;

        if (is_directory(abs_path)) {
            auto nested = collect_files(abs_path, rel_path, out);
            if (nested.isErr()) return nested;
        } else {
            out.push_back(rel_path);
        }
    }
    return Result<void>::ok();
}

Result<void> prune_empty(const std::string& dir, const std::string& relative_dir,
                         bool is_root, std::vector<std::string>& removed) {
    if (!is_directory(dir)) {
        return Result<void>::ok();
    }

    auto entries = list_directory(dir);
    if (entries.isErr()) {
        return Result<void>::err(entries.error());
    }

    for (const auto& name : entries.value()) {
        std::string rel_path = relative_dir.empty() ? name : relative_dir + "/" + name;
        auto pruned = prune_empty(join_path(dir, name), rel_path, false, removed);
        if (pruned.isErr()) return pruned;
    }

    if (is_root) {
        return Result<void>::ok();
    }

    // Re-evaluate: children may have just been removed
    auto remaining = list_directory(dir);
    if (remaining.isErr()) {
        return Result<void>::err(remaining.error());
    }
    if (remaining.value().empty()) {
        std::error_code ec;
        fs::remove(dir, ec);
        if (ec) {
            return Result<void>::err(filesystem_error(ec, dir));
        }
        removed.push_back(relative_dir);
    }
    return Result<void>::ok();
}

bool move_already_applied(const std::string& destination, const MoveSpec& mv) {
    return !path_exists(join_path(destination, mv.from)) &&
           path_exists(join_path(destination, mv.to));
}

} // namespace

Result<std::vector<std::string>> list_files_recursive(const std::string& dir) {
    std::vector<std::string> files;
    auto collected = collect_files(dir, "", files);
    if (collected.isErr()) {
        return Result<std::vector<std::string>>::err(collected.error());
    }
    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Result<std::vector<std::string>> remove_empty_dirs(const std::string& dir) {
    std::vector<std::string> removed;
    auto pruned = prune_empty(dir, "", true, removed);
    if (pruned.isErr()) {
        return Result<std::vector<std::string>>::err(pruned.error());
    }
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

Result<ReconcileReport> reconcile(const std::string& destination,
                                  const TargetManifest& manifest) {
    ReconcileReport report;

    // Targets of moves that already happened must survive the prune
    std::set<std::string> keep = manifest.paths;
    std::vector<bool> applied;
    applied.reserve(manifest.moves.size());
    for (const auto& mv : manifest.moves) {
        bool done = move_already_applied(destination, mv);
        applied.push_back(done);
        if (done) {
            keep.insert(mv.to);
        }
    }

    // Phase 1: prune extras
    auto files = list_files_recursive(destination);
    if (files.isErr()) {
        return Result<ReconcileReport>::err(files.error().withContext("prune"));
    }
    for (const auto& file : files.value()) {
        if (keep.count(file) != 0) continue;

        auto removed = remove_path(join_path(destination, file));
        if (removed.isErr()) {
            return Result<ReconcileReport>::err(removed.error().withContext("prune"));
        }
        report.deleted.push_back(file);
    }

    // Phase 2: apply moves
    for (size_t i = 0; i < manifest.moves.size(); ++i) {
        const auto& mv = manifest.moves[i];
        if (applied[i]) {
            report.already_applied.push_back(mv);
            continue;
        }

        std::string from = join_path(destination, mv.from);
        std::string to = join_path(destination, mv.to);
        std::string context = "move " + mv.from + " -> " + mv.to;

        if (!path_exists(from)) {
            return Result<ReconcileReport>::err(
                Error(ErrorCode::CONFIG_MISMATCH, "source does not exist: " + mv.from)
                    .withContext(context));
        }

        auto parent = ensure_directory(get_parent_directory(to));
        if (parent.isErr()) {
            return Result<ReconcileReport>::err(parent.error().withContext(context));
        }

        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            return Result<ReconcileReport>::err(
                filesystem_error(ec, mv.from).withContext(context));
        }
        report.moved.push_back(mv);
    }

    // Phase 3: prune empty directories
    auto removed_dirs = remove_empty_dirs(destination);
    if (removed_dirs.isErr()) {
        return Result<ReconcileReport>::err(removed_dirs.error().withContext("cleanup"));
    }
    report.removed_dirs = std::move(removed_dirs.value());

    return Result<ReconcileReport>::ok(std::move(report));
}

} // namespace unbox
