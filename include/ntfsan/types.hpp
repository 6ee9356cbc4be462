#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ntfsan {

// ============================================================================
// Violations
// ============================================================================

enum class Violation {
    InvalidCharacters,
    TrailingSpaceOrDot,
    ReservedName,
    TooLong,
};

// Canonical lowercase snake_case key
inline const char* violation_to_string(Violation v) {
    switch (v) {
        case Violation::InvalidCharacters: return "invalid_characters";
        case Violation::TrailingSpaceOrDot: return "trailing_space_or_dot";
        case Violation::ReservedName: return "reserved_name";
        case Violation::TooLong: return "too_long";
        default: return "unknown";
    }
}

// Human readable reason line used by the console report
inline const char* violation_description(Violation v) {
    switch (v) {
        case Violation::InvalidCharacters: return "Contains invalid NTFS characters";
        case Violation::TrailingSpaceOrDot: return "Trailing spaces/dots";
        case Violation::ReservedName: return "Reserved Windows name";
        case Violation::TooLong: return "Exceeds maximum length";
        default: return "Unknown";
    }
}

// ============================================================================
// Sanitizer Input / Output
// ============================================================================

constexpr std::size_t kDefaultMaxLength = 255;

struct SanitizeRequest {
    std::string original_name;
    std::size_t max_length = kDefaultMaxLength;
};

struct SanitizeResult {
    std::string new_name;
    std::vector<Violation> reasons;  // detection order, no duplicates
    bool changed = false;

    // Original name is longer than max_length; caller must skip the entry
    bool exceeds_max_length = false;
    std::size_t original_length = 0;  // code points

    bool has_reason(Violation v) const {
        for (auto r : reasons) {
            if (r == v) return true;
        }
        return false;
    }
};

// ============================================================================
// Walk Records
// ============================================================================

struct RenameOutcome {
    std::string location;       // root-relative directory, "" for the root
    std::string original_name;
    std::string new_name;
    std::string original_path;  // root-relative, forward slashes
    std::string new_path;       // root-relative, forward slashes
    bool is_directory = false;
    bool applied = false;       // false in dry-run mode
    std::vector<Violation> reasons;
    std::optional<std::string> error;
};

struct SkippedEntry {
    std::string path;           // root-relative, forward slashes
    std::string name;
    std::size_t length = 0;     // code points
};

struct EntryError {
    std::string path;           // root-relative, forward slashes
    std::string message;
};

struct RunSummary {
    std::size_t renamed = 0;
    std::size_t skipped_too_long = 0;
    std::size_t errors = 0;
    std::size_t visited = 0;
    std::size_t ignored = 0;
};

} // namespace ntfsan
