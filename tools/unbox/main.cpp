/**
 * unbox CLI - Entry Point
 *
 * Unpack a project template ("box") into a directory.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace unbox::cli::commands {
    void setup_unbox(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace unbox::cli;

    CLI::App app{"unbox - unpack a project template"};
    app.set_version_flag("-V,--version", UNBOX_VERSION);

    GlobalOptions opts;

    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    commands::setup_unbox(&app, opts);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
