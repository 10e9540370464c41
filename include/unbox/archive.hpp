#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Tarball Extraction
// ============================================================================

// Safety rules:
//   - absolute paths and ".." escapes fail the whole extraction
//   - symlinks and hardlinks are skipped with a warning
//   - only regular files and directories are materialized

struct UnpackResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;   // extracted paths, after stripping
    std::vector<std::string> warnings;
};

// Inflate gzip data; nullopt on corrupt input
std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed);

// Extract a gzip-compressed tar archive into dest_dir.
// strip_components leading path segments are dropped from every entry
// (repository archives wrap their contents in one top-level directory);
// entries left with an empty path are skipped.
// On failure dest_dir is removed.
UnpackResult extract_tarball(const std::vector<uint8_t>& archive_data,
                             const std::string& dest_dir,
                             size_t strip_components = 0);

} // namespace unbox
