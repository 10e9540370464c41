#pragma once

#include "unbox/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// .gitignore-style Filtering
// ============================================================================

struct IgnorePattern {
    std::string glob;       // without leading '!', leading '/' or trailing '/'
    bool negated = false;
    bool anchored = false;  // matched against the whole path, not any suffix
};

class IgnoreRules {
public:
    IgnoreRules() = default;

    // Parse .gitignore text: blank lines and '#' comments are skipped,
    // trailing '/' is dropped, '!' negates, '/' anchors.
    static IgnoreRules parse(const std::string& content);

    void add(const std::string& line);

    // relative_path uses '/' separators. A path is ignored when it, or any of
    // its parent directories, matches; the last matching pattern wins.
    bool ignores(const std::string& relative_path) const;

    const std::vector<IgnorePattern>& patterns() const { return patterns_; }

private:
    bool matchesSelf(const std::string& relative_path) const;

    std::vector<IgnorePattern> patterns_;
};

// Glob match where '*' and '?' stay within one path segment and '**' spans any
// number of segments.
bool glob_match(const std::string& pattern, const std::string& path);

// Load <dir>/.gitignore. A missing file is an empty optional, not an error.
Result<std::optional<IgnoreRules>> load_ignore_rules(const std::string& dir);

} // namespace unbox
