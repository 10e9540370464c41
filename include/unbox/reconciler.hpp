#pragma once

#include "unbox/result.hpp"
#include "unbox/target_manifest.hpp"

#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Filesystem Reconciliation
// ============================================================================

struct ReconcileReport {
    std::vector<std::string> deleted;        // files removed as not in the manifest
    std::vector<MoveSpec> moved;             // moves actually performed
    std::vector<MoveSpec> already_applied;   // source gone, target present; skipped
    std::vector<std::string> removed_dirs;   // directories left empty and removed
};

// Every non-directory entry below dir as a sorted, portable relative path.
// Symlinks are reported as files and never followed.
Result<std::vector<std::string>> list_files_recursive(const std::string& dir);

// Remove directories below dir that are empty once their children are
// processed (bottom-up). dir itself is never removed; a non-directory dir is a
// no-op. Returns the removed directories relative to dir.
Result<std::vector<std::string>> remove_empty_dirs(const std::string& dir);

// Make destination match manifest:
//   1. delete files not in manifest.paths
//   2. apply manifest.moves (creating parents of each target)
//   3. remove directories left empty
// A move whose source is gone but whose target exists counts as already
// applied: its target is kept and the move is listed in already_applied
// instead of moved. Any other missing move source is CONFIG_MISMATCH.
// Phases are not rolled back on failure.
Result<ReconcileReport> reconcile(const std::string& destination,
                                  const TargetManifest& manifest);

} // namespace unbox
