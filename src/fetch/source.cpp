#include "unbox/source.hpp"
#include "unbox/archive.hpp"
#include "unbox/box_config.hpp"
#include "unbox/ignore_rules.hpp"
#include "unbox/platform.hpp"
#include "unbox/transport.hpp"

#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace unbox {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool valid_name(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return false;
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) slash = s.size();
        if (slash > start) {
            parts.push_back(s.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

std::string trim_trailing_slash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

Result<BoxSource> invalid(const std::string& source, const std::string& reason) {
    return Result<BoxSource>::err(
        Error(ErrorCode::INVALID_SOURCE, "unrecognized box source '" + source + "': " + reason));
}

Result<void> copy_filtered(const std::string& src_root,
                           const std::string& relative,
                           const std::string& dst_root,
                           const std::optional<IgnoreRules>& rules) {
    std::string src_dir = relative.empty() ? src_root : join_path(src_root, relative);

    auto entries = list_directory(src_dir);
    if (entries.isErr()) {
        return Result<void>::err(entries.error());
    }

    for (const auto& name : entries.value()) {
        std::string rel = relative.empty() ? name : relative + "/" + name;
        if (rules && rules->ignores(rel)) {
            continue;
        }

        std::string src = join_path(src_root, rel);
        std::string dst = join_path(dst_root, rel);

        if (is_directory(src)) {
            auto created = ensure_directory(dst);
            if (created.isErr()) return created;
            auto nested = copy_filtered(src_root, rel, dst_root, rules);
            if (nested.isErr()) return nested;
        } else {
            auto copied = copy_recursive(src, dst);
            if (copied.isErr()) return copied;
        }
    }
    return Result<void>::ok();
}

Error remote_failure(const std::string& url, const FetchResult& fetched,
                     const std::string& not_found_message) {
    if (!fetched.transport_error && fetched.http_status == 404) {
        return Error(ErrorCode::SOURCE_NOT_FOUND, not_found_message);
    }
    return Error(ErrorCode::CONNECTIVITY_ERROR,
                 "Error connecting to " + url +
                 ". Please check your internet connection and try again.\n\n" + fetched.error);
}

} // namespace

// ============================================================================
// BoxSource / SourceEndpoints
// ============================================================================

std::string BoxSource::display() const {
    if (kind == SourceKind::Local) {
        return local_path;
    }
    return owner + "/" + repo + "#" + ref;
}

SourceEndpoints SourceEndpoints::fromEnvironment() {
    SourceEndpoints endpoints;
    if (auto raw = get_env("UNBOX_GITHUB_RAW_BASE"); raw && !raw->empty()) {
        endpoints.raw_base = trim_trailing_slash(*raw);
    }
    if (auto archive = get_env("UNBOX_GITHUB_ARCHIVE_BASE"); archive && !archive->empty()) {
        endpoints.archive_base = trim_trailing_slash(*archive);
    }
    if (auto org = get_env("UNBOX_DEFAULT_ORG"); org && !org->empty()) {
        endpoints.default_org = *org;
    }
    return endpoints;
}

std::string SourceEndpoints::configUrl(const BoxSource& source) const {
    return raw_base + "/" + source.owner + "/" + source.repo + "/" + source.ref + "/" +
           BOX_CONFIG_FILE;
}

std::string SourceEndpoints::archiveUrl(const BoxSource& source) const {
    return archive_base + "/" + source.owner + "/" + source.repo + "/tar.gz/" + source.ref;
}

// ============================================================================
// Parsing
// ============================================================================

Result<BoxSource> parse_box_source(const std::string& source, const SourceEndpoints& endpoints) {
    BoxSource result;
    result.original = source;

    if (source.empty()) {
        return invalid(source, "empty source");
    }

    // Local paths
    if (starts_with(source, "file:")) {
        std::string path = source.substr(5);
        if (path.empty()) {
            return invalid(source, "empty file path");
        }
        result.kind = SourceKind::Local;
        result.local_path = absolute_path(path);
        return Result<BoxSource>::ok(std::move(result));
    }
    if (source[0] == '/' || source == "." || source == ".." ||
        starts_with(source, "./") || starts_with(source, "../")) {
        result.kind = SourceKind::Local;
        result.local_path = absolute_path(source);
        return Result<BoxSource>::ok(std::move(result));
    }

    // Remote references
    std::string rest = source;
    bool has_ref = false;
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        result.ref = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
        if (result.ref.empty()) {
            return invalid(source, "empty ref after '#'");
        }
        has_ref = true;
    }

    bool explicit_repo = false;
    for (const char* prefix : {"https://github.com/", "http://github.com/",
                               "git://github.com/", "git@github.com:", "github:"}) {
        if (starts_with(rest, prefix)) {
            rest = rest.substr(std::string(prefix).size());
            explicit_repo = true;
            break;
        }
    }
    if (!explicit_repo && rest.find("://") != std::string::npos) {
        return invalid(source, "only GitHub repositories are supported");
    }

    auto segments = split_segments(rest);
    result.kind = SourceKind::GitHub;

    if (segments.size() == 1 && !explicit_repo) {
        // Bare box name
        result.owner = endpoints.default_org;
        result.repo = segments[0] + "-box";
    } else if (segments.size() == 2) {
        result.owner = segments[0];
        result.repo = segments[1];
    } else if (segments.size() == 4 && segments[2] == "tree" && !has_ref) {
        // https://github.com/o/r/tree/<branch>
        result.owner = segments[0];
        result.repo = segments[1];
        result.ref = segments[3];
    } else {
        return invalid(source, "expected owner/repo");
    }

    if (result.repo.size() > 4 && result.repo.compare(result.repo.size() - 4, 4, ".git") == 0) {
        result.repo.erase(result.repo.size() - 4);
    }

    if (!valid_name(result.owner) || !valid_name(result.repo)) {
        return invalid(source, "invalid owner or repository name");
    }

    return Result<BoxSource>::ok(std::move(result));
}

// ============================================================================
// Verification
// ============================================================================

Result<void> verify_box_source(const BoxSource& source, const SourceEndpoints& endpoints) {
    if (source.kind == SourceKind::Local) {
        std::string config_path = join_path(source.local_path, BOX_CONFIG_FILE);
        if (!is_directory(source.local_path) || !path_exists(config_path)) {
            return Result<void>::err(
                Error(ErrorCode::SOURCE_NOT_FOUND,
                      "Box at path " + source.local_path + " doesn't exist."));
        }
        return Result<void>::ok();
    }

    std::string url = endpoints.configUrl(source);
    auto probed = probe_url(url);
    if (probed.ok) {
        return Result<void>::ok();
    }

    return Result<void>::err(remote_failure(
        url, probed,
        "Box at URL " + source.original + " doesn't exist. If you believe this is an error, "
        "please contact the box maintainer."));
}

// ============================================================================
// Fetching
// ============================================================================

Result<FetchReport> fetch_box(const BoxSource& source,
                              const std::string& into,
                              const std::string& expected_sha256,
                              const SourceEndpoints& endpoints) {
    FetchReport report;

    if (source.kind == SourceKind::Local) {
        auto rules = load_ignore_rules(source.local_path);
        if (rules.isErr()) {
            return Result<FetchReport>::err(rules.error().withContext("fetch"));
        }

        auto created = ensure_directory(into);
        if (created.isErr()) {
            return Result<FetchReport>::err(created.error().withContext("fetch"));
        }

        auto copied = copy_filtered(source.local_path, "", into, rules.value());
        if (copied.isErr()) {
            return Result<FetchReport>::err(copied.error().withContext("fetch"));
        }
        return Result<FetchReport>::ok(std::move(report));
    }

    std::string url = endpoints.archiveUrl(source);
    auto fetched = fetch_url(url);
    if (!fetched.ok) {
        return Result<FetchReport>::err(remote_failure(
            url, fetched, "Box archive " + source.display() + " doesn't exist."));
    }

    auto digest = compute_sha256(fetched.data);
    if (!digest.ok) {
        return Result<FetchReport>::err(Error(ErrorCode::IO_ERROR, digest.error));
    }
    report.archive_sha256 = digest.hex_digest;

    if (!expected_sha256.empty()) {
        auto verified = verify_sha256(fetched.data, expected_sha256);
        if (!verified.ok) {
            return Result<FetchReport>::err(
                Error(ErrorCode::INTEGRITY_MISMATCH, verified.error).withContext(url));
        }
    }

    auto unpacked = extract_tarball(fetched.data, into, 1);
    if (!unpacked.ok) {
        return Result<FetchReport>::err(
            Error(ErrorCode::IO_ERROR, unpacked.error).withContext("extract " + url));
    }
    report.warnings = std::move(unpacked.warnings);

    return Result<FetchReport>::ok(std::move(report));
}

} // namespace unbox
