#include "ntfsan/run_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace ntfsan {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<std::string> get_env(const char* name) {
    const char* val = std::getenv(name);
    if (val && *val) {
        return std::string(val);
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> normalize_log_level(const std::string& level) {
    static const char* const kLevels[] = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    std::string lower = to_lower(trim(level));
    for (const char* l : kLevels) {
        if (lower == l) return lower;
    }
    return std::nullopt;
}

RunConfigParseResult parse_run_config(const std::string& json_str,
                                      const std::string& source_path) {
    RunConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (j.contains("$schema") && j["$schema"].is_string()) {
            if (trim(j["$schema"].get<std::string>()) != kConfigSchema) {
                result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
                return result;
            }
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (j.contains("max_length")) {
            const auto& ml = j["max_length"];
            if (!ml.is_number_integer() || ml.get<long long>() < 1) {
                result.error = "max_length must be a positive integer";
                return result;
            }
            result.config.max_length = ml.get<std::size_t>();
        }

        if (j.contains("dry_run")) {
            if (j["dry_run"].is_boolean()) {
                result.config.dry_run = j["dry_run"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:dry_run");
            }
        }

        if (j.contains("ignore")) {
            if (j["ignore"].is_array()) {
                for (const auto& elem : j["ignore"]) {
                    if (elem.is_string() && !elem.get<std::string>().empty()) {
                        result.config.ignore.push_back(elem.get<std::string>());
                    } else {
                        result.warnings.push_back("invalid_configuration:ignore_entry");
                    }
                }
            } else {
                result.warnings.push_back("invalid_configuration:ignore");
            }
        }

        if (j.contains("log_level")) {
            std::optional<std::string> level;
            if (j["log_level"].is_string()) {
                level = normalize_log_level(j["log_level"].get<std::string>());
            }
            if (level) {
                result.config.log_level = level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        for (auto& [key, val] : j.items()) {
            (void)val;
            if (key != "$schema" && key != "max_length" && key != "dry_run" &&
                key != "ignore" && key != "log_level") {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

RunConfigParseResult load_run_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        RunConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot open config file: " + path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_run_config(buffer.str(), path);
}

std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path) {
    // 1. Explicit override
    if (override_path && !override_path->empty()) {
        return override_path;
    }

    // 2. Environment variable
    return get_env(kConfigEnvVar);
}

} // namespace ntfsan
