#include "ntfsan/name_sanitizer.hpp"
#include "ntfsan/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ntfsan {

namespace {

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string strip_space_or_dot(const std::string& s) {
    auto start = s.find_first_not_of(" .");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" .");
    return s.substr(start, end - start + 1);
}

std::string placeholder(std::size_t max_length) {
    return utf8_truncate(kPlaceholderName, std::max<std::size_t>(max_length, 1));
}

void add_reason(SanitizeResult& result, Violation v) {
    if (!result.has_reason(v)) {
        result.reasons.push_back(v);
    }
}

// Shorten a name that grew past max_length, keeping the extension when it fits
std::string enforce_length(const std::string& name, std::size_t max_length) {
    auto parts = split_extension(name);
    std::size_t ext_len = utf8_length(parts.extension);
    if (!parts.extension.empty() && ext_len < max_length) {
        return utf8_truncate(parts.base, max_length - ext_len) + parts.extension;
    }
    std::string truncated = strip_trailing_space_or_dot(utf8_truncate(name, max_length));
    if (truncated.empty()) {
        return placeholder(max_length);
    }
    return truncated;
}

} // namespace

// ============================================================================
// Detection
// ============================================================================

bool is_forbidden_char(unsigned char ch) {
    if (ch < 32) {
        return true;
    }
    switch (ch) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

bool contains_forbidden_chars(const std::string& name) {
    return std::any_of(name.begin(), name.end(),
                       [](char c) { return is_forbidden_char(static_cast<unsigned char>(c)); });
}

bool has_trailing_space_or_dot(const std::string& name) {
    return strip_space_or_dot(name) != name;
}

bool is_reserved_device_name(const std::string& name) {
    // Everything after the first dot is ignored: "LPT1.tar.gz" is reserved
    std::string stem = to_upper(name.substr(0, name.find('.')));

    if (stem == "CON" || stem == "PRN" || stem == "AUX" || stem == "NUL") {
        return true;
    }
    if (stem.size() == 4) {
        std::string prefix = stem.substr(0, 3);
        char digit = stem[3];
        if ((prefix == "COM" || prefix == "LPT") && digit >= '1' && digit <= '9') {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Sanitization
// ============================================================================

SanitizeResult sanitize(const SanitizeRequest& request) {
    const std::string& original = request.original_name;

    SanitizeResult result;
    result.new_name = original;
    result.original_length = utf8_length(original);

    if (original.empty()) {
        result.new_name = placeholder(request.max_length);
        result.changed = true;
        return result;
    }

    // 1. Detect against the untouched name
    bool has_invalid = contains_forbidden_chars(original);
    bool has_trailing = has_trailing_space_or_dot(original);
    bool is_reserved = is_reserved_device_name(original);

    if (has_invalid) add_reason(result, Violation::InvalidCharacters);
    if (has_trailing) add_reason(result, Violation::TrailingSpaceOrDot);
    if (is_reserved) add_reason(result, Violation::ReservedName);

    // 2. Too long before any correction: hard skip
    if (result.original_length > request.max_length) {
        result.exceeds_max_length = true;
        add_reason(result, Violation::TooLong);
        return result;
    }

    std::string working = original;

    // 3. Substitute
    if (has_invalid) {
        std::replace_if(working.begin(), working.end(),
                        [](char c) { return is_forbidden_char(static_cast<unsigned char>(c)); },
                        '_');
    }

    // 4. Trim
    if (has_trailing) {
        working = strip_space_or_dot(working);
        if (working.empty()) {
            working = kPlaceholderName;
        }
    }

    // 5. Reserved guard. Trimming can expose a device name ("CON " -> "CON"),
    // so the working name is checked as well.
    if (!is_reserved && is_reserved_device_name(working)) {
        is_reserved = true;
        add_reason(result, Violation::ReservedName);
    }
    if (is_reserved) {
        working = "_" + working;
    }

    // 6. Length enforcement after the fixes
    if (utf8_length(working) > request.max_length) {
        working = enforce_length(working, request.max_length);
        add_reason(result, Violation::TooLong);
    }

    result.new_name = working;
    result.changed = (working != original);
    return result;
}

// ============================================================================
// Collision Suffixing
// ============================================================================

std::string with_collision_suffix(const std::string& candidate,
                                  std::size_t n,
                                  std::size_t max_length) {
    auto parts = split_extension(candidate);
    std::string suffix = "_" + std::to_string(n);

    std::size_t ext_len = utf8_length(parts.extension);
    std::size_t fixed = suffix.size() + ext_len;
    if (utf8_length(parts.base) + fixed <= max_length) {
        return parts.base + suffix + parts.extension;
    }
    if (fixed < max_length) {
        return utf8_truncate(parts.base, max_length - fixed) + suffix + parts.extension;
    }

    // No room for the extension
    if (suffix.size() > max_length) {
        return "";
    }
    return utf8_truncate(candidate, max_length - suffix.size()) + suffix;
}

} // namespace ntfsan
