#pragma once

#include "unbox/result.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace unbox {

// ============================================================================
// Error Conversion
// ============================================================================

// Map a filesystem error_code onto an unbox Error, naming the offending path
Error filesystem_error(const std::error_code& ec, const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
// unbox compares recipe paths and enumerated destination paths in this form.
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Make a path absolute against the current working directory
std::string absolute_path(const std::string& path);

// Check if a path exists (a dangling symlink counts as existing)
bool path_exists(const std::string& path);

// Check if a path is a directory (symlinks are not followed)
bool is_directory(const std::string& path);

// ============================================================================
// Directory Operations
// ============================================================================

// List the names of a directory's entries, sorted
Result<std::vector<std::string>> list_directory(const std::string& path);

// Create a directory and any missing parents
Result<void> ensure_directory(const std::string& path);

// Remove a file, symlink or directory tree
Result<void> remove_path(const std::string& path);

// Copy a file or directory tree into dst, overwriting existing files
// Directories are merged into an existing destination directory.
Result<void> copy_recursive(const std::string& src, const std::string& dst);

// ============================================================================
// File Contents
// ============================================================================

// Read entire file contents as string
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Temporary Directories
// ============================================================================

// Create a uniquely named directory below root
// An empty root selects the system temporary directory.
Result<std::string> create_temp_directory(const std::string& root,
                                          const std::string& prefix = "unbox-");

// Owns a directory tree and removes it on destruction
class ScopedDirectory {
public:
    ScopedDirectory() = default;
    explicit ScopedDirectory(std::string path) : path_(std::move(path)) {}
    ~ScopedDirectory();

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    ScopedDirectory(ScopedDirectory&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
std::string generate_uuid();

} // namespace unbox
