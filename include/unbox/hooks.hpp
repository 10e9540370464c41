#pragma once

#include "unbox/result.hpp"

#include <string>

namespace unbox {

// ============================================================================
// Hooks
// ============================================================================

/**
 * Run a box's post-unpack command through /bin/sh -c in cwd.
 *
 * The child inherits this process's environment and standard streams.
 * An empty command does nothing and yields 0. A non-zero exit status, or
 * termination by a signal (reported as 128 + signal), is HOOK_FAILED.
 */
Result<int> run_post_unpack_hook(const std::string& command, const std::string& cwd);

} // namespace unbox
