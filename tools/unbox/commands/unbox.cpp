/**
 * unbox CLI - unbox command
 *
 * Fetch a box, merge it into a directory and apply its recipe.
 */

#include "../common.hpp"
#include <unbox/choice_provider.hpp>
#include <unbox/transport.hpp>
#include <unbox/unbox.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstdlib>

namespace unbox::cli::commands {

namespace {

struct UnboxCommandOptions {
    std::string source;
    std::string destination = ".";
    bool force = false;
    std::string recipe_option;
    bool no_hooks = false;
    std::string sha256;
    std::string temp_dir;
};

nlohmann::ordered_json moves_to_json(const std::vector<MoveSpec>& moves) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& move : moves) {
        arr.push_back({{"from", move.from}, {"to", move.to}});
    }
    return arr;
}

// Key order follows the box's declaration order for commands
nlohmann::ordered_json report_to_json(const UnboxReport& report) {
    nlohmann::ordered_json commands = nlohmann::ordered_json::object();
    for (const auto& [label, command] : report.commands) {
        commands[label] = command;
    }

    nlohmann::ordered_json j;
    j["ok"] = true;
    j["source"] = report.source.display();
    j["destination"] = report.destination;
    j["merge"] = {
        {"copied", report.merge.copied},
        {"overwritten", report.merge.overwritten},
        {"skipped", report.merge.skipped},
    };

    if (report.recipe_applied) {
        j["recipe"] = {
            {"choices", report.recipe_choices},
            {"prompts", report.prompts_issued},
            {"deleted", report.reconcile.deleted},
            {"moved", moves_to_json(report.reconcile.moved)},
            {"already_applied", moves_to_json(report.reconcile.already_applied)},
            {"removed_dirs", report.reconcile.removed_dirs},
        };
    } else {
        j["recipe"] = nullptr;
    }

    j["hook"] = report.hook_ran ? nlohmann::ordered_json(report.hook_command)
                                : nlohmann::ordered_json(nullptr);
    j["commands"] = commands;
    if (!report.archive_sha256.empty()) {
        j["archive_sha256"] = report.archive_sha256;
    }
    return j;
}

void print_report(const GlobalOptions& opts, const UnboxReport& report) {
    for (const auto& name : report.merge.copied) print_verbose("copied " + name, opts);
    for (const auto& name : report.merge.overwritten) print_verbose("overwrote " + name, opts);
    for (const auto& name : report.merge.skipped) print_verbose("kept existing " + name, opts);

    if (report.recipe_applied) {
        std::string path;
        for (const auto& choice : report.recipe_choices) {
            if (!path.empty()) path += ",";
            path += choice;
        }
        print_verbose("recipe " + path, opts);
        for (const auto& file : report.reconcile.deleted) print_verbose("deleted " + file, opts);
        for (const auto& move : report.reconcile.moved) {
            print_verbose("moved " + move.from + " -> " + move.to, opts);
        }
        for (const auto& move : report.reconcile.already_applied) {
            print_verbose("already moved " + move.from + " -> " + move.to, opts);
        }
        for (const auto& dir : report.reconcile.removed_dirs) {
            print_verbose("removed directory " + dir, opts);
        }
    }

    if (opts.quiet) {
        return;
    }

    std::cout << "Unbox successful: " << report.source.display() << " -> "
              << report.destination << std::endl;

    if (!report.commands.empty()) {
        size_t width = 0;
        for (const auto& entry : report.commands) {
            width = std::max(width, entry.first.size());
        }

        std::cout << "\nCommands:\n\n";
        for (const auto& [label, command] : report.commands) {
            std::cout << "  " << label << ":" << std::string(width - label.size() + 1, ' ')
                      << command << "\n";
        }
        std::cout << std::flush;
    }
}

int cmd_unbox(const GlobalOptions& opts, const UnboxCommandOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (!cmd_opts.sha256.empty() && !is_sha256_hex(cmd_opts.sha256)) {
        print_error("--sha256 must be 64 hexadecimal characters", opts.json, "INVALID_SOURCE");
        return 1;
    }

    UnboxOptions options;
    options.source = cmd_opts.source;
    options.destination = cmd_opts.destination;
    options.force = cmd_opts.force;
    if (!cmd_opts.recipe_option.empty()) {
        options.recipe_option = cmd_opts.recipe_option;
    }
    options.run_hooks = !cmd_opts.no_hooks;
    options.temp_root = resolve_temp_root(cmd_opts.temp_dir);
    options.expected_sha256 = cmd_opts.sha256;
    options.endpoints = SourceEndpoints::fromEnvironment();

    // Keep stdout clean for the JSON document
    TerminalPrompter prompter(std::cin, opts.json ? std::cerr : std::cout);

    if (!opts.quiet && !opts.json) {
        std::cout << "Unboxing " << cmd_opts.source << "..." << std::endl;
    }

    auto result = ::unbox::unbox(options, prompter);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    const UnboxReport& report = result.value();
    for (const auto& warning : report.warnings) {
        print_warning(warning, opts.json);
    }

    if (opts.json) {
        output_json(report_to_json(report));
    } else {
        print_report(opts, report);
    }

    return 0;
}

} // anonymous namespace

void setup_unbox(CLI::App* app, GlobalOptions& opts) {
    static UnboxCommandOptions cmd_opts;

    app->add_option("source", cmd_opts.source,
                    "Box to unpack (path, owner/repo[#ref], GitHub URL or box name)")
        ->required();
    app->add_option("destination", cmd_opts.destination, "Directory to unpack into")
        ->capture_default_str();
    app->add_flag("-f,--force", cmd_opts.force, "Overwrite existing files without asking");
    app->add_option("-o,--option", cmd_opts.recipe_option,
                    "Recipe choices, comma separated (e.g. ts,hardhat)");
    app->add_flag("--no-hooks", cmd_opts.no_hooks, "Do not run the box's post-unpack hook");
    app->add_option("--sha256", cmd_opts.sha256, "Expected SHA-256 of the remote archive");
    app->add_option("--temp-dir", cmd_opts.temp_dir,
                    "Parent directory for scratch files (env: UNBOX_TMPDIR)");

    app->callback([&opts]() {
        std::exit(cmd_unbox(opts, cmd_opts));
    });
}

} // namespace unbox::cli::commands
