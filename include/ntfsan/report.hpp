#pragma once

#include "ntfsan/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ntfsan {

// ============================================================================
// Text Report
// ============================================================================
//
// Console layout:
//
//   --- Starting NTFS Sanitization ---
//   Directory: /data
//   Dry run: true
//   --------------------------------------------------
//   [WOULD CHANGE]
//     Location: ./photos
//     Original: a:b.jpg
//     Modified: a_b.jpg
//     Reason: Contains invalid NTFS characters
//   ------------------------------
//   ...
//   --- Process Complete ---
//   Total renamed: 1
//   Skipped (too long): 0
//   Errors: 0

std::string format_header(const std::string& directory, bool dry_run);

// Change block; a failed rename is followed by an [ERROR] line
std::string format_outcome(const RenameOutcome& outcome);

std::string format_skipped(const SkippedEntry& skipped);

std::string format_entry_error(const EntryError& error);

// Summary counters plus the dry-run reminder when applicable
std::string format_summary(const RunSummary& summary, bool dry_run);

// ============================================================================
// JSON Report
// ============================================================================

nlohmann::json reasons_to_json(const std::vector<Violation>& reasons);
nlohmann::json outcome_to_json(const RenameOutcome& outcome);
nlohmann::json skipped_to_json(const SkippedEntry& skipped);
nlohmann::json entry_error_to_json(const EntryError& error);
nlohmann::json summary_to_json(const RunSummary& summary);

// Serialize for output; invalid UTF-8 in names becomes U+FFFD
std::string dump_json(const nlohmann::json& j, int indent = 2);

// Collects walker events for the --json document. Rename failures land in
// both changes and errors so errors matches the summary count.
class JsonReport {
public:
    void add_outcome(const RenameOutcome& outcome);
    void add_skipped(const SkippedEntry& skipped);
    void add_error(const EntryError& error);

    const nlohmann::json& changes() const { return changes_; }
    const nlohmann::json& skipped() const { return skipped_; }
    const nlohmann::json& errors() const { return errors_; }

private:
    nlohmann::json changes_ = nlohmann::json::array();
    nlohmann::json skipped_ = nlohmann::json::array();
    nlohmann::json errors_ = nlohmann::json::array();
};

} // namespace ntfsan
