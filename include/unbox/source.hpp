#pragma once

#include "unbox/result.hpp"

#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Box Sources
// ============================================================================

enum class SourceKind {
    Local,      // directory on this machine
    GitHub,     // owner/repo at a ref
};

struct BoxSource {
    SourceKind kind = SourceKind::Local;
    std::string original;   // as given by the user

    // Local
    std::string local_path;     // absolute

    // GitHub
    std::string owner;
    std::string repo;
    std::string ref = "master";

    std::string display() const;
};

// Remote endpoints, overridable for mirrors
struct SourceEndpoints {
    std::string raw_base = "https://raw.githubusercontent.com";
    std::string archive_base = "https://codeload.github.com";
    std::string default_org = "truffle-box";

    // Defaults overridden by UNBOX_GITHUB_RAW_BASE, UNBOX_GITHUB_ARCHIVE_BASE
    // and UNBOX_DEFAULT_ORG
    static SourceEndpoints fromEnvironment();

    std::string configUrl(const BoxSource& source) const;
    std::string archiveUrl(const BoxSource& source) const;
};

// Classify a source string.
//   /abs, ./rel, ../rel, file:<path>            -> Local
//   https://github.com/o/r[.git][#ref]
//   git@github.com:o/r[.git][#ref]
//   github:o/r[#ref], o/r[#ref]                  -> GitHub
//   name                                         -> GitHub <default_org>/<name>-box
Result<BoxSource> parse_box_source(const std::string& source,
                                   const SourceEndpoints& endpoints = SourceEndpoints{});

// Check that the box exists before anything is written.
// Local: <path>/box.json must exist. GitHub: HEAD of the raw box.json.
// 404 -> SOURCE_NOT_FOUND, any other failure -> CONNECTIVITY_ERROR.
Result<void> verify_box_source(const BoxSource& source,
                               const SourceEndpoints& endpoints = SourceEndpoints{});

struct FetchReport {
    std::vector<std::string> warnings;
    std::string archive_sha256;     // remote sources only
};

// Fetch the box's files into an existing empty directory.
// Local sources honour the source root's .gitignore. Remote archives are
// checked against expected_sha256 when it is non-empty.
Result<FetchReport> fetch_box(const BoxSource& source,
                              const std::string& into,
                              const std::string& expected_sha256 = "",
                              const SourceEndpoints& endpoints = SourceEndpoints{});

} // namespace unbox
