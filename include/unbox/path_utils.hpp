#pragma once

#include <string>

namespace unbox {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok;
    std::string path;  // normalized portable path when ok
    PathError error;
};

// Normalize a box-relative path without touching the filesystem.
// - Rejects NUL bytes
// - Rejects absolute paths
// - Collapses ".", empty and ".." segments
// - Fails if a ".." would climb above the root
// The result never has a leading or trailing slash; the root itself is "".
PathResult normalize_relative_path(const std::string& relative_path);

// Normalize relative_path and join it onto root.
PathResult normalize_under_root(const std::string& root, const std::string& relative_path);

} // namespace unbox
