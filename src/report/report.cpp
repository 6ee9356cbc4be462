#include "ntfsan/report.hpp"
#include "ntfsan/path_utils.hpp"

#include <sstream>

namespace ntfsan {

namespace {

constexpr std::size_t kPreviewLength = 50;

} // namespace

// ============================================================================
// Text Report
// ============================================================================

std::string format_header(const std::string& directory, bool dry_run) {
    std::ostringstream out;
    out << "--- Starting NTFS Sanitization ---\n";
    out << "Directory: " << directory << "\n";
    out << "Dry run: " << (dry_run ? "true" : "false") << "\n";
    out << std::string(50, '-') << "\n";
    return out.str();
}

std::string format_outcome(const RenameOutcome& outcome) {
    std::ostringstream out;
    out << (outcome.applied ? "[CHANGED]" : "[WOULD CHANGE]") << "\n";
    out << "  Location: ./" << outcome.location << "\n";
    out << "  Original: " << outcome.original_name << "\n";
    out << "  Modified: " << outcome.new_name << "\n";
    for (auto reason : outcome.reasons) {
        out << "  Reason: " << violation_description(reason) << "\n";
    }
    out << std::string(30, '-') << "\n";
    if (outcome.error) {
        out << "[ERROR] Could not rename '" << outcome.original_name << "': "
            << *outcome.error << "\n";
    }
    return out.str();
}

std::string format_skipped(const SkippedEntry& skipped) {
    std::ostringstream out;
    out << "[WARNING] Name too long (" << skipped.length << " chars): "
        << utf8_truncate(skipped.name, kPreviewLength) << "...\n";
    return out.str();
}

std::string format_entry_error(const EntryError& error) {
    return "[UNEXPECTED ERROR] Processing '" + error.path + "': " + error.message + "\n";
}

std::string format_summary(const RunSummary& summary, bool dry_run) {
    std::ostringstream out;
    out << "\n--- Process Complete ---\n";
    out << "Total renamed: " << summary.renamed << "\n";
    out << "Skipped (too long): " << summary.skipped_too_long << "\n";
    out << "Errors: " << summary.errors << "\n";
    if (dry_run) {
        out << "\nNote: This was a dry run. No files were actually changed.\n";
        out << "Run without --dry-run to apply changes.\n";
    }
    return out.str();
}

// ============================================================================
// JSON Report
// ============================================================================

nlohmann::json reasons_to_json(const std::vector<Violation>& reasons) {
    nlohmann::json j = nlohmann::json::array();
    for (auto reason : reasons) {
        j.push_back(violation_to_string(reason));
    }
    return j;
}

nlohmann::json outcome_to_json(const RenameOutcome& outcome) {
    nlohmann::json j;
    j["location"] = outcome.location;
    j["original_name"] = outcome.original_name;
    j["new_name"] = outcome.new_name;
    j["original_path"] = outcome.original_path;
    j["new_path"] = outcome.new_path;
    j["type"] = outcome.is_directory ? "directory" : "file";
    j["applied"] = outcome.applied;
    j["reasons"] = reasons_to_json(outcome.reasons);
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
    return j;
}

nlohmann::json skipped_to_json(const SkippedEntry& skipped) {
    nlohmann::json j;
    j["path"] = skipped.path;
    j["length"] = skipped.length;
    return j;
}

nlohmann::json entry_error_to_json(const EntryError& error) {
    nlohmann::json j;
    j["path"] = error.path;
    j["error"] = error.message;
    return j;
}

nlohmann::json summary_to_json(const RunSummary& summary) {
    nlohmann::json j;
    j["renamed"] = summary.renamed;
    j["skipped_too_long"] = summary.skipped_too_long;
    j["errors"] = summary.errors;
    j["visited"] = summary.visited;
    j["ignored"] = summary.ignored;
    return j;
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

void JsonReport::add_outcome(const RenameOutcome& outcome) {
    changes_.push_back(outcome_to_json(outcome));
    if (outcome.error) {
        errors_.push_back(entry_error_to_json(EntryError{outcome.original_path, *outcome.error}));
    }
}

void JsonReport::add_skipped(const SkippedEntry& skipped) {
    skipped_.push_back(skipped_to_json(skipped));
}

void JsonReport::add_error(const EntryError& error) {
    errors_.push_back(entry_error_to_json(error));
}

} // namespace ntfsan
