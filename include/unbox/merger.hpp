#pragma once

#include "unbox/box_config.hpp"
#include "unbox/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Destination Merge
// ============================================================================

// Asked once per colliding top-level name; nullopt cancels the merge
using ConfirmOverwriteFn = std::function<std::optional<bool>(const std::string& name)>;

struct MergeReport {
    std::vector<std::string> copied;        // names that did not exist in the destination
    std::vector<std::string> overwritten;   // colliding names replaced by the box's version
    std::vector<std::string> skipped;       // colliding names left untouched
};

// Top-level names present in both directories, sorted
Result<std::vector<std::string>> find_collisions(const std::string& temp_dir,
                                                 const std::string& destination);

// Copy the top-level entries of temp_dir into destination (created if
// missing), in sorted name order.
// - names new to destination are copied unconditionally
// - collisions with force are copied over the existing entry in place
// - collisions without force go through ask: yes removes the existing entry
//   and copies the incoming one, no keeps the destination untouched
Result<MergeReport> merge_into_destination(const std::string& temp_dir,
                                           const std::string& destination,
                                           bool force,
                                           const ConfirmOverwriteFn& ask);

// Remove config.ignore entries and the box configuration files from a
// freshly fetched box. Entries escaping temp_dir are PATH_TRAVERSAL.
Result<void> prepare_box_files(const std::string& temp_dir, const BoxConfig& config);

} // namespace unbox
