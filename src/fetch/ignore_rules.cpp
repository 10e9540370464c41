#include "unbox/ignore_rules.hpp"
#include "unbox/platform.hpp"

#include <cctype>
#include <sstream>

namespace unbox {

namespace {

bool glob_match_at(const std::string& p, size_t pi, const std::string& s, size_t si) {
    while (pi < p.size()) {
        char c = p[pi];

        if (c == '*') {
            bool double_star = pi + 1 < p.size() && p[pi + 1] == '*';
            if (double_star) {
                size_t next = pi + 2;
                // "**/" also matches zero directories
                if (next < p.size() && p[next] == '/') {
                    if (glob_match_at(p, next + 1, s, si)) return true;
                }
                for (size_t k = si; k <= s.size(); ++k) {
                    if (glob_match_at(p, next, s, k)) return true;
                }
                return false;
            }

            for (size_t k = si; k <= s.size(); ++k) {
                if (glob_match_at(p, pi + 1, s, k)) return true;
                if (k < s.size() && s[k] == '/') break;
            }
            return false;
        }

        if (si >= s.size()) return false;

        if (c == '?') {
            if (s[si] == '/') return false;
        } else if (c == '\\' && pi + 1 < p.size()) {
            ++pi;
            if (p[pi] != s[si]) return false;
        } else if (c != s[si]) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == s.size();
}

std::string rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(0, end);
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& path) {
    return glob_match_at(pattern, 0, path, 0);
}

IgnoreRules IgnoreRules::parse(const std::string& content) {
    IgnoreRules rules;
    std::istringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        rules.add(line);
    }
    return rules;
}

void IgnoreRules::add(const std::string& raw_line) {
    std::string line = rtrim(raw_line);
    if (line.empty() || line[0] == '#') {
        return;
    }

    IgnorePattern pattern;
    if (line[0] == '!') {
        pattern.negated = true;
        line.erase(0, 1);
    } else if (line[0] == '\\' && line.size() > 1 && (line[1] == '#' || line[1] == '!')) {
        line.erase(0, 1);
    }

    while (!line.empty() && line.back() == '/') {
        line.pop_back();
    }
    if (!line.empty() && line[0] == '/') {
        pattern.anchored = true;
        line.erase(0, 1);
    }
    if (line.empty()) {
        return;
    }
    if (line.find('/') != std::string::npos) {
        pattern.anchored = true;
    }

    pattern.glob = line;
    patterns_.push_back(std::move(pattern));
}

bool IgnoreRules::matchesSelf(const std::string& relative_path) const {
    std::string basename = relative_path;
    auto slash = relative_path.rfind('/');
    if (slash != std::string::npos) {
        basename = relative_path.substr(slash + 1);
    }

    bool ignored = false;
    for (const auto& pattern : patterns_) {
        bool matched = pattern.anchored
            ? glob_match(pattern.glob, relative_path)
            : glob_match(pattern.glob, basename);
        if (matched) {
            ignored = !pattern.negated;
        }
    }
    return ignored;
}

bool IgnoreRules::ignores(const std::string& relative_path) const {
    if (relative_path.empty() || patterns_.empty()) {
        return false;
    }

    std::string path = to_portable_path(relative_path);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    // An ignored parent directory hides everything below it
    size_t pos = 0;
    while ((pos = path.find('/', pos)) != std::string::npos) {
        if (matchesSelf(path.substr(0, pos))) {
            return true;
        }
        ++pos;
    }
    return matchesSelf(path);
}

Result<std::optional<IgnoreRules>> load_ignore_rules(const std::string& dir) {
    using LoadResult = Result<std::optional<IgnoreRules>>;

    std::string path = join_path(dir, ".gitignore");
    if (!path_exists(path)) {
        return LoadResult::ok(std::nullopt);
    }

    auto content = read_file(path);
    if (!content) {
        return LoadResult::err(Error(ErrorCode::IO_ERROR, "failed to read " + path));
    }
    return LoadResult::ok(IgnoreRules::parse(*content));
}

} // namespace unbox
