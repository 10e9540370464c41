#pragma once

#include "unbox/result.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unbox {

// ============================================================================
// Box Configuration File Names
// ============================================================================

constexpr const char* BOX_CONFIG_FILE = "box.json";
constexpr const char* BOX_INIT_FILE = "box-init.json";

// ============================================================================
// File Specifications
// ============================================================================

// A rename / move of one destination file, both sides box-relative
struct MoveSpec {
    std::string from;
    std::string to;
};

inline bool operator==(const MoveSpec& a, const MoveSpec& b) {
    return a.from == b.from && a.to == b.to;
}

// Either a plain path that must survive, or a move.
// Paths are normalized at parse time (see normalize_relative_path).
struct FileSpec {
    std::string path;                 // the file itself, or a move's source
    std::optional<std::string> to;    // set for moves

    static FileSpec file(std::string p) { return FileSpec{std::move(p), std::nullopt}; }
    static FileSpec move(std::string from, std::string to) {
        return FileSpec{std::move(from), std::move(to)};
    }

    bool isMove() const { return to.has_value(); }
    MoveSpec asMove() const { return MoveSpec{path, to.value_or("")}; }
};

// ============================================================================
// Recipe Tree
// ============================================================================

enum class ScopeKind {
    Branch,
    Leaf
};

// One node of the recipe decision tree.
// Branch: choice_labels[i] selects children[i], labels in declaration order.
// Leaf:   files is one fully-resolved variant.
struct RecipeScope {
    ScopeKind kind = ScopeKind::Leaf;

    std::vector<std::string> choice_labels;
    std::vector<RecipeScope> children;

    std::vector<FileSpec> files;

    bool isLeaf() const { return kind == ScopeKind::Leaf; }

    // Child scope for a label, nullptr if the label is not a choice here
    const RecipeScope* child(const std::string& label) const;
};

struct Recipe {
    RecipeScope specs;
    std::vector<FileSpec> common;
    std::vector<std::string> prompts;   // one message per tree depth
};

// ============================================================================
// Box Configuration
// ============================================================================

struct BoxConfig {
    // Box-relative paths removed from the fetched box before merging
    std::vector<std::string> ignore;

    // Label -> command line, shown to the user after unboxing
    std::vector<std::pair<std::string, std::string>> commands;

    struct {
        std::string post_unpack;
    } hooks;

    // Empty when the box declares no recipe; the recipe stage is then skipped
    std::optional<Recipe> recipes;

    std::string source_path;
};

// Parse box.json contents. source_path is only used in error messages.
Result<BoxConfig> parse_box_config(const std::string& json_str,
                                   const std::string& source_path = "");

// Read and parse <box_dir>/box.json
Result<BoxConfig> read_box_config(const std::string& box_dir);

} // namespace unbox
