#include "ntfsan/tree_walker.hpp"
#include "ntfsan/name_sanitizer.hpp"
#include "ntfsan/path_utils.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ntfsan {

namespace {

// "./docs/README/" -> "docs/README"
std::string normalize_ignore_entry(const std::string& entry) {
    std::string out = entry;
    while (out.size() >= 2 && out.compare(0, 2, "./") == 0) {
        out.erase(0, 2);
    }
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

bool path_occupied(const fs::path& p) {
    // lstat semantics: a dangling symlink still occupies the name
    std::error_code ec;
    auto status = fs::symlink_status(p, ec);
    return fs::exists(status);
}

} // namespace

TreeWalker::TreeWalker(WalkOptions options) : options_(std::move(options)) {
    for (auto& entry : options_.ignore) {
        entry = normalize_ignore_entry(entry);
    }
}

RootValidation TreeWalker::validate() const {
    std::error_code ec;
    fs::path root(options_.root);
    if (options_.root.empty() || !fs::exists(root, ec)) {
        return {false, "Directory '" + options_.root + "' does not exist."};
    }
    if (!fs::is_directory(root, ec)) {
        return {false, "'" + options_.root + "' is not a directory."};
    }
    return {true, ""};
}

RunResult TreeWalker::run(const WalkHandlers& handlers) const {
    RunResult result;

    auto validation = validate();
    if (!validation.ok) {
        result.error = validation.error;
        return result;
    }
    fs::path root(options_.root);

    spdlog::info("Sanitizing {} (dry run: {}, max length: {})",
                 options_.root, options_.dry_run, options_.max_length);

    WalkState state{handlers, {}, false};
    walk_directory(root, "", state);

    if (state.interrupted) {
        spdlog::warn("Walk interrupted after {} entries", state.summary.visited);
    } else {
        spdlog::info("Walk complete: {} renamed, {} skipped, {} errors",
                     state.summary.renamed, state.summary.skipped_too_long, state.summary.errors);
    }

    result.ok = true;
    result.interrupted = state.interrupted;
    result.summary = state.summary;
    return result;
}

void TreeWalker::walk_directory(const fs::path& dir,
                                const std::string& location,
                                WalkState& state) const {
    // Snapshot the listing; renames below must not disturb iteration
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        report_error(state, location.empty() ? "." : location,
                     "cannot read directory: " + ec.message());
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        report_error(state, location.empty() ? "." : location,
                     "directory listing incomplete: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    // Subtrees first
    for (const auto& entry : entries) {
        if (cancel_requested(state)) {
            return;
        }
        std::error_code type_ec;
        if (entry.is_symlink(type_ec) || !entry.is_directory(type_ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        std::string relative = join_relative(location, name);
        if (is_ignored(name, relative)) {
            continue;
        }
        walk_directory(entry.path(), relative, state);
    }

    // Then this level's own entries, files and directories alike
    for (const auto& entry : entries) {
        if (cancel_requested(state)) {
            return;
        }
        process_entry(entry, location, state);
    }
}

void TreeWalker::process_entry(const fs::directory_entry& entry,
                               const std::string& location,
                               WalkState& state) const {
    std::string name = entry.path().filename().string();
    std::string relative = join_relative(location, name);

    if (is_ignored(name, relative)) {
        spdlog::debug("Ignoring {}", relative);
        ++state.summary.ignored;
        return;
    }

    ++state.summary.visited;
    spdlog::debug("Checking {}", relative);

    try {
        auto sanitized = sanitize(SanitizeRequest{name, options_.max_length});

        if (sanitized.exceeds_max_length) {
            spdlog::debug("Name too long ({} chars), skipping: {}", sanitized.original_length, relative);
            ++state.summary.skipped_too_long;
            if (state.handlers.on_skipped) {
                state.handlers.on_skipped(SkippedEntry{relative, name, sanitized.original_length});
            }
            return;
        }

        if (!sanitized.changed) {
            return;
        }

        fs::path parent = entry.path().parent_path();
        auto new_name = resolve_collision(parent, sanitized.new_name);
        if (!new_name) {
            report_error(state, relative,
                         "no free name for '" + sanitized.new_name + "' within " +
                             std::to_string(options_.max_length) + " characters");
            return;
        }

        std::error_code type_ec;
        RenameOutcome outcome;
        outcome.location = location;
        outcome.original_name = name;
        outcome.new_name = *new_name;
        outcome.original_path = relative;
        outcome.new_path = join_relative(location, *new_name);
        outcome.is_directory = !entry.is_symlink(type_ec) && entry.is_directory(type_ec);
        outcome.applied = !options_.dry_run;
        outcome.reasons = sanitized.reasons;

        if (!options_.dry_run) {
            std::error_code rename_ec;
            fs::rename(entry.path(), parent / *new_name, rename_ec);
            if (rename_ec) {
                spdlog::debug("Could not rename '{}': {}", relative, rename_ec.message());
                outcome.error = rename_ec.message();
            } else {
                spdlog::debug("Renamed {} -> {}", outcome.original_path, outcome.new_path);
            }
        }

        // Counted after the handler returns; a throwing handler is counted
        // once, as an error, by the catch below
        if (state.handlers.on_outcome) {
            state.handlers.on_outcome(outcome);
        }
        if (outcome.error) {
            ++state.summary.errors;
        } else {
            ++state.summary.renamed;
        }
    } catch (const std::exception& e) {
        report_error(state, relative, e.what());
    }
}

std::optional<std::string> TreeWalker::resolve_collision(const fs::path& parent,
                                                         const std::string& candidate) const {
    std::string name = candidate;
    for (std::size_t n = 1; path_occupied(parent / name); ++n) {
        name = with_collision_suffix(candidate, n, options_.max_length);
        if (name.empty()) {
            return std::nullopt;
        }
    }
    return name;
}

bool TreeWalker::is_ignored(const std::string& name, const std::string& relative_path) const {
    return std::any_of(options_.ignore.begin(), options_.ignore.end(),
                       [&](const std::string& entry) {
                           return entry == name || entry == relative_path;
                       });
}

bool TreeWalker::cancel_requested(WalkState& state) const {
    if (!state.interrupted && state.handlers.should_cancel && state.handlers.should_cancel()) {
        state.interrupted = true;
    }
    return state.interrupted;
}

void TreeWalker::report_error(WalkState& state, const std::string& path, const std::string& message) const {
    spdlog::debug("Processing '{}': {}", path, message);
    ++state.summary.errors;
    if (state.handlers.on_error) {
        state.handlers.on_error(EntryError{path, message});
    }
}

} // namespace ntfsan
