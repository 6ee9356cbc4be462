#include "ntfsan/path_utils.hpp"

#include <string>

namespace ntfsan {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::size_t utf8_length(const std::string& s) {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if (!is_continuation_byte(c)) ++count;
    }
    return count;
}

std::string utf8_truncate(const std::string& s, std::size_t max_code_points) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation_byte(static_cast<unsigned char>(s[i]))) continue;
        if (seen == max_code_points) {
            return s.substr(0, i);
        }
        ++seen;
    }
    return s;
}

NameParts split_extension(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return {name, ""};
    }
    auto first_non_dot = name.find_first_not_of('.');
    if (first_non_dot == std::string::npos || first_non_dot > dot) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

std::string strip_trailing_space_or_dot(const std::string& s) {
    auto end = s.find_last_not_of(" .");
    if (end == std::string::npos) {
        return "";
    }
    return s.substr(0, end + 1);
}

std::string join_relative(const std::string& location, const std::string& name) {
    if (location.empty()) {
        return name;
    }
    return location + "/" + name;
}

} // namespace ntfsan
