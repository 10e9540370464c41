#pragma once

#include "unbox/choice_provider.hpp"
#include "unbox/merger.hpp"
#include "unbox/reconciler.hpp"
#include "unbox/result.hpp"
#include "unbox/source.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unbox {

// ============================================================================
// Unbox Pipeline
// ============================================================================

struct UnboxOptions {
    std::string source;
    std::string destination = ".";
    bool force = false;

    // Comma separated recipe choices, e.g. "ts,hardhat"
    std::optional<std::string> recipe_option;

    bool run_hooks = true;

    // Parent of the scratch directory; empty selects the system temp dir
    std::string temp_root;

    // Pin for remote archives; empty disables the check
    std::string expected_sha256;

    SourceEndpoints endpoints;
};

struct UnboxReport {
    BoxSource source;
    std::string destination;        // absolute

    MergeReport merge;

    bool recipe_applied = false;
    std::vector<std::string> recipe_choices;
    size_t prompts_issued = 0;
    ReconcileReport reconcile;

    std::string hook_command;       // empty when no hook ran
    bool hook_ran = false;

    std::vector<std::pair<std::string, std::string>> commands;
    std::string archive_sha256;
    std::vector<std::string> warnings;
};

/**
 * Unpack a box into options.destination.
 *
 * Phases run in order and the first failure aborts the rest:
 *   parse source -> verify -> fetch into a scratch dir -> read box.json
 *   -> drop ignored files -> merge -> recipe -> post-unpack hook
 *
 * Nothing is written to the destination before the box has been fetched and
 * its configuration parsed. The scratch directory is removed on every path.
 * The destination is not rolled back when a later phase fails.
 */
Result<UnboxReport> unbox(const UnboxOptions& options, ChoiceProvider& provider);

} // namespace unbox
