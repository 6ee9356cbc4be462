#pragma once

#include <cstddef>
#include <string>

namespace ntfsan {

// ============================================================================
// UTF-8 Helpers
// ============================================================================

// Number of code points in a UTF-8 string (continuation bytes are not counted)
std::size_t utf8_length(const std::string& s);

// Keep at most max_code_points code points, never splitting a sequence
std::string utf8_truncate(const std::string& s, std::size_t max_code_points);

// ============================================================================
// Name Helpers
// ============================================================================

struct NameParts {
    std::string base;
    std::string extension;  // includes the leading dot, or empty
};

// Split at the last dot. A dot preceded only by dots (".profile", "..x")
// does not start an extension.
NameParts split_extension(const std::string& name);

// Remove trailing ' ' and '.' characters
std::string strip_trailing_space_or_dot(const std::string& s);

// ============================================================================
// Path Helpers
// ============================================================================

// Join a root-relative location and an entry name
std::string join_relative(const std::string& location, const std::string& name);

} // namespace ntfsan
