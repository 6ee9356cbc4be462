/**
 * Integration tests: config file driving a walk
 */

#include <doctest/doctest.h>
#include <ntfsan/report.hpp>
#include <ntfsan/run_config.hpp>
#include <ntfsan/tree_walker.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using namespace ntfsan;

namespace {

class ConfigTestRoot {
public:
    ConfigTestRoot() {
        static unsigned counter = 0;
        root_ = fs::temp_directory_path() /
                ("ntfsan_config_" + std::to_string(std::time(nullptr)) + "_" + std::to_string(counter++));
        fs::create_directories(root_ / "tree");
    }

    ~ConfigTestRoot() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string tree() const { return (root_ / "tree").string(); }

    std::string write_config(const std::string& content) const {
        auto path = root_ / "ntfsan.json";
        std::ofstream(path) << content;
        return path.string();
    }

    void touch(const std::string& rel) const {
        fs::path p = root_ / "tree" / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "x";
    }

    bool exists(const std::string& rel) const {
        return fs::exists(root_ / "tree" / rel);
    }

private:
    fs::path root_;
};

WalkOptions walk_options_from(const RunConfig& config, const std::string& root) {
    WalkOptions opts;
    opts.root = root;
    opts.dry_run = config.dry_run;
    opts.max_length = config.max_length;
    opts.ignore = config.ignore;
    return opts;
}

} // namespace

TEST_CASE("config file sets limit and ignore list") {
    ConfigTestRoot env;
    env.touch("vendor/lib?.a");
    env.touch("notes?.txt");
    env.touch("very-long-name?.txt");

    auto loaded = load_run_config(env.write_config(R"({
        "$schema": "ntfsan.config.v1",
        "max_length": 12,
        "ignore": ["vendor"]
    })"));
    REQUIRE(loaded.ok);

    auto result = TreeWalker(walk_options_from(loaded.config, env.tree())).run();

    REQUIRE(result.ok);
    CHECK(env.exists("vendor/lib?.a"));
    CHECK(env.exists("notes_.txt"));
    CHECK(env.exists("very-long-name?.txt"));
    CHECK(result.summary.renamed == 1);
    CHECK(result.summary.skipped_too_long == 1);
    CHECK(result.summary.ignored == 1);
}

TEST_CASE("config file dry run renders a dry-run report") {
    ConfigTestRoot env;
    env.touch("what?.txt");

    auto loaded = load_run_config(env.write_config(
        R"({"$schema": "ntfsan.config.v1", "dry_run": true})"));
    REQUIRE(loaded.ok);

    std::string report;
    WalkHandlers handlers;
    handlers.on_outcome = [&](const RenameOutcome& o) { report += format_outcome(o); };

    auto opts = walk_options_from(loaded.config, env.tree());
    auto result = TreeWalker(opts).run(handlers);
    report += format_summary(result.summary, opts.dry_run);

    REQUIRE(result.ok);
    CHECK(env.exists("what?.txt"));
    CHECK(report.find("[WOULD CHANGE]") == 0);
    CHECK(report.find("  Modified: what_.txt\n") != std::string::npos);
    CHECK(report.find("Total renamed: 1\n") != std::string::npos);
    CHECK(report.find("Note: This was a dry run.") != std::string::npos);
}

TEST_CASE("invalid config never reaches the walker") {
    ConfigTestRoot env;
    auto loaded = load_run_config(env.write_config(
        R"({"$schema": "ntfsan.config.v1", "max_length": 0})"));
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.error == "max_length must be a positive integer");
}
