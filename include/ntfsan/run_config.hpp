#pragma once

#include "ntfsan/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ntfsan {

// ============================================================================
// Run Configuration
// ============================================================================

constexpr const char* kConfigSchema = "ntfsan.config.v1";
constexpr const char* kConfigEnvVar = "NTFSAN_CONFIG";
constexpr const char* kLogLevelEnvVar = "NTFSAN_LOG_LEVEL";

struct RunConfig {
    std::size_t max_length = kDefaultMaxLength;
    bool dry_run = false;

    // Entry names or root-relative paths ("docs/README") left untouched
    std::vector<std::string> ignore;

    std::optional<std::string> log_level;

    // Source path for diagnostics, empty for built-in defaults
    std::string source_path;
};

struct RunConfigParseResult {
    bool ok = false;
    std::string error;
    RunConfig config;
    std::vector<std::string> warnings;
};

// Parse a config document:
// {
//   "$schema": "ntfsan.config.v1",
//   "max_length": 255,
//   "dry_run": false,
//   "ignore": ["build", "docs/README"],
//   "log_level": "info"
// }
RunConfigParseResult parse_run_config(const std::string& json_str,
                                      const std::string& source_path = "");

// Read and parse a config file from disk
RunConfigParseResult load_run_config(const std::string& path);

// Config file location: explicit override, then NTFSAN_CONFIG, else none
std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path);

// Lowercased log level name if it is one of trace, debug, info, warn,
// error, critical, off
std::optional<std::string> normalize_log_level(const std::string& level);

} // namespace ntfsan
