/**
 * unbox CLI - Common utilities and types
 */

#pragma once

#include <unbox/result.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <iostream>
#include <cstdlib>

namespace unbox::cli {

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Options shared by every command.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the parent directory for scratch space.
 * Priority: --temp-dir flag > UNBOX_TMPDIR env > system temp dir (empty)
 */
inline std::string resolve_temp_root(const std::string& flag_value) {
    if (!flag_value.empty()) {
        return flag_value;
    }

    std::string env_root = safe_getenv("UNBOX_TMPDIR");
    if (!env_root.empty()) {
        return env_root;
    }

    return "";
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) {
            j["code"] = code;
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    print_error(error.message(), json_mode, error_code_to_string(error.code()));
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void print_verbose(const std::string& msg, const GlobalOptions& opts) {
    if (opts.verbose && !opts.json && !opts.quiet) {
        std::cout << "  " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::ordered_json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::ordered_json output = j;
        output["warnings"] = collector.warnings;
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

} // namespace unbox::cli
