#pragma once

#include "unbox/box_config.hpp"

#include <set>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Target Manifest
// ============================================================================

// The exact file set a destination must end up with for one recipe variant.
// paths holds every plain path and every move source; moves keep recipe order.
struct TargetManifest {
    std::set<std::string> paths;
    std::vector<MoveSpec> moves;

    bool contains(const std::string& path) const { return paths.count(path) != 0; }
};

// Flatten leaf + common into a manifest
TargetManifest build_target_manifest(const std::vector<FileSpec>& leaf,
                                     const std::vector<FileSpec>& common);

} // namespace unbox
