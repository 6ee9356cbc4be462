#pragma once

#include "ntfsan/types.hpp"

#include <cstddef>
#include <string>

namespace ntfsan {

// ============================================================================
// Detection
// ============================================================================

// Forbidden set: < > : " / \ | ? * and control characters 0-31
bool is_forbidden_char(unsigned char ch);

bool contains_forbidden_chars(const std::string& name);

// True if stripping leading/trailing ' ' and '.' changes the name
bool has_trailing_space_or_dot(const std::string& name);

// CON, PRN, AUX, NUL, COM1-COM9, LPT1-LPT9, case-insensitive, with or
// without anything after the first dot
bool is_reserved_device_name(const std::string& name);

// ============================================================================
// Sanitization
// ============================================================================

// Placeholder used when a name trims down to nothing
constexpr const char* kPlaceholderName = "unnamed";

// Pure transform of one path component. Steps run in fixed order:
// detect, length pre-check, substitute, trim, reserved guard, truncate.
// When the original exceeds max_length the result is unchanged and
// exceeds_max_length is set; the entry must be skipped, not renamed.
SanitizeResult sanitize(const SanitizeRequest& request);

inline SanitizeResult sanitize(const std::string& name,
                               std::size_t max_length = kDefaultMaxLength) {
    return sanitize(SanitizeRequest{name, max_length});
}

// ============================================================================
// Collision Suffixing
// ============================================================================

// Build "<base>_<n><ext>" from an already sanitized candidate, splitting at
// the last dot. The base is shortened when needed so the result stays
// within max_length. Returns an empty string when "_<n>" alone is longer
// than max_length.
std::string with_collision_suffix(const std::string& candidate,
                                  std::size_t n,
                                  std::size_t max_length = kDefaultMaxLength);

} // namespace ntfsan
