/**
 * ntfsan CLI - sanitize command
 *
 * Walk a directory tree and rename entries whose names NTFS rejects.
 */

#include "../common.hpp"
#include <ntfsan/report.hpp>
#include <ntfsan/tree_walker.hpp>
#include <CLI/CLI.hpp>

#include <csignal>
#include <filesystem>
#include <system_error>

namespace ntfsan::cli::commands {

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void handle_cancel_signal(int) {
    g_cancel_requested = 1;
}

struct SanitizeOptions {
    std::string directory;
    bool dry_run = false;
    std::size_t max_length = kDefaultMaxLength;
    CLI::Option* max_length_opt = nullptr;
    std::vector<std::string> ignore;
    std::string config;
};

int cmd_sanitize(const GlobalOptions& opts, const SanitizeOptions& sanitize_opts) {
    init_warning_collector(opts.json, opts.quiet);

    // Config file: --config > NTFSAN_CONFIG
    RunConfig config;
    auto config_path = resolve_config_path(
        sanitize_opts.config.empty() ? std::nullopt : std::make_optional(sanitize_opts.config));
    if (config_path) {
        auto loaded = load_run_config(*config_path);
        if (!loaded.ok) {
            print_error("Invalid config " + *config_path + ": " + loaded.error, opts.json);
            return 1;
        }
        for (const auto& w : loaded.warnings) {
            print_warning(w + " (" + *config_path + ")");
        }
        config = loaded.config;
    }

    init_logging(resolve_log_level(opts, config));

    // Command line wins over the config file
    WalkOptions walk_opts;
    walk_opts.root = sanitize_opts.directory;
    if (walk_opts.root.empty()) {
        std::error_code ec;
        walk_opts.root = std::filesystem::current_path(ec).string();
        if (ec) {
            print_error("Cannot determine current directory: " + ec.message(), opts.json);
            return 1;
        }
    }
    walk_opts.dry_run = sanitize_opts.dry_run || config.dry_run;
    walk_opts.max_length = (sanitize_opts.max_length_opt && sanitize_opts.max_length_opt->count() > 0)
                               ? sanitize_opts.max_length
                               : config.max_length;
    walk_opts.ignore = config.ignore;
    walk_opts.ignore.insert(walk_opts.ignore.end(),
                            sanitize_opts.ignore.begin(), sanitize_opts.ignore.end());

    TreeWalker walker(walk_opts);

    auto validation = walker.validate();
    if (!validation.ok) {
        print_error(validation.error, opts.json);
        return 1;
    }

    JsonReport report;

    WalkHandlers handlers;
    handlers.on_outcome = [&](const RenameOutcome& outcome) {
        if (opts.json) {
            report.add_outcome(outcome);
        } else {
            std::cout << format_outcome(outcome);
        }
    };
    handlers.on_skipped = [&](const SkippedEntry& entry) {
        if (opts.json) {
            report.add_skipped(entry);
        } else {
            std::cout << format_skipped(entry);
        }
    };
    handlers.on_error = [&](const EntryError& error) {
        if (opts.json) {
            report.add_error(error);
        } else {
            std::cout << format_entry_error(error);
        }
    };
    handlers.should_cancel = []() { return g_cancel_requested != 0; };

    g_cancel_requested = 0;
    std::signal(SIGINT, handle_cancel_signal);
    std::signal(SIGTERM, handle_cancel_signal);

    if (!opts.json) {
        std::cout << format_header(walk_opts.root, walk_opts.dry_run);
    }

    auto result = walker.run(handlers);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!result.ok) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (result.interrupted) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = "Operation cancelled by user.";
            j["changes"] = report.changes();
            j["skipped"] = report.skipped();
            j["errors"] = report.errors();
            j["summary"] = summary_to_json(result.summary);
            output_json(j);
        } else {
            std::cout << std::flush;
            std::cerr << "\n\nOperation cancelled by user." << std::endl;
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["directory"] = walk_opts.root;
        j["dry_run"] = walk_opts.dry_run;
        j["max_length"] = walk_opts.max_length;
        j["changes"] = report.changes();
        j["skipped"] = report.skipped();
        j["errors"] = report.errors();
        j["summary"] = summary_to_json(result.summary);
        output_json(j);
    } else {
        std::cout << format_summary(result.summary, walk_opts.dry_run);
    }

    return 0;
}

} // anonymous namespace

void setup_sanitize(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("directory", sanitize_opts.directory,
                    "Directory to process (default: current directory)");
    app->add_flag("--dry-run", sanitize_opts.dry_run,
                  "Show what would be changed without actually renaming");
    sanitize_opts.max_length_opt =
        app->add_option("--max-length", sanitize_opts.max_length,
                        "Maximum filename length (default: 255)")
            ->check(CLI::PositiveNumber);
    app->add_option("--ignore", sanitize_opts.ignore,
                    "Entry name or relative path to leave untouched (repeatable)");
    app->add_option("--config", sanitize_opts.config,
                    "JSON config file (default: $NTFSAN_CONFIG)");

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts));
    });
}

} // namespace ntfsan::cli::commands
