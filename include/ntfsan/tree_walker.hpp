#pragma once

#include "ntfsan/types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ntfsan {

// ============================================================================
// Walk Options
// ============================================================================

struct WalkOptions {
    std::string root;
    bool dry_run = false;
    std::size_t max_length = kDefaultMaxLength;

    // Entry names or root-relative paths to leave alone. An ignored
    // directory is not descended into.
    std::vector<std::string> ignore;
};

// Notifications streamed while walking. All members are optional.
struct WalkHandlers {
    std::function<void(const RenameOutcome&)> on_outcome = nullptr;
    std::function<void(const SkippedEntry&)> on_skipped = nullptr;

    // Failures that are not a rename attempt (unreadable directory,
    // unexpected exception while processing an entry)
    std::function<void(const EntryError&)> on_error = nullptr;

    // Polled before each entry; returning true stops the walk
    std::function<bool()> should_cancel = nullptr;
};

struct RootValidation {
    bool ok = false;
    std::string error;
};

struct RunResult {
    bool ok = false;
    std::string error;         // set when the run could not start
    bool interrupted = false;
    RunSummary summary;
};

// ============================================================================
// Tree Walker
// ============================================================================

// Renames entries under a root so every name satisfies NTFS rules.
// Subtrees are finished before their directory entry is evaluated, so a
// directory rename never invalidates paths computed for its descendants.
// Collisions are resolved against the live filesystem at rename time; in
// dry-run mode nothing is renamed and simulated renames do not occupy names.
class TreeWalker {
public:
    explicit TreeWalker(WalkOptions options);

    // The root must exist and be a directory; checked again by run()
    RootValidation validate() const;

    RunResult run(const WalkHandlers& handlers = {}) const;

    const WalkOptions& options() const { return options_; }

private:
    struct WalkState {
        const WalkHandlers& handlers;
        RunSummary summary;
        bool interrupted = false;
    };

    void walk_directory(const std::filesystem::path& dir,
                        const std::string& location,
                        WalkState& state) const;

    void process_entry(const std::filesystem::directory_entry& entry,
                       const std::string& location,
                       WalkState& state) const;

    // nullopt once no suffixed name fits within max_length
    std::optional<std::string> resolve_collision(const std::filesystem::path& parent,
                                                 const std::string& candidate) const;

    bool is_ignored(const std::string& name, const std::string& relative_path) const;

    bool cancel_requested(WalkState& state) const;

    void report_error(WalkState& state, const std::string& path, const std::string& message) const;

    WalkOptions options_;
};

} // namespace ntfsan
