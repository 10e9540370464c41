#include "unbox/path_utils.hpp"
#include "unbox/platform.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace unbox {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
    }
    return "unknown";
}

PathResult normalize_relative_path(const std::string& relative_path) {
    if (contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string portable = to_portable_path(relative_path);
    if (!portable.empty() && portable[0] == '/') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }
    // Windows drive letters ("C:/...") are absolute as well
    if (portable.size() >= 2 && portable[1] == ':') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out;
    for (const auto& part : normalized) {
        if (!out.empty()) out += '/';
        out += part;
    }
    return {true, out, PathError::None};
}

PathResult normalize_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root)) {
        return {false, {}, PathError::ContainsNul};
    }

    auto rel = normalize_relative_path(relative_path);
    if (!rel.ok) {
        return rel;
    }
    if (rel.path.empty()) {
        return {true, to_portable_path(root), PathError::None};
    }
    return {true, join_path(root, rel.path), PathError::None};
}

} // namespace unbox
