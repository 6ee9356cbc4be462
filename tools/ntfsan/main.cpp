/**
 * ntfsan CLI - Entry Point
 *
 * Rename files and directories so their names are valid on NTFS.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <exception>

namespace ntfsan::cli::commands {
    void setup_sanitize(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace ntfsan::cli;

    CLI::App app{"ntfsan - Sanitize filenames to be NTFS-compliant"};
    app.set_version_flag("-V,--version", NTFSAN_VERSION);
    app.footer("\nExamples:\n"
               "  ntfsan                     Process current directory\n"
               "  ntfsan /path/to/folder     Process specific directory\n"
               "  ntfsan --dry-run           Show what would be changed\n"
               "  ntfsan --max-length 100    Set custom max filename length");

    GlobalOptions opts;

    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug diagnostics on stderr");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only on stderr");

    commands::setup_sanitize(&app, opts);

    try {
        CLI11_PARSE(app, argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "\nUnexpected error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
