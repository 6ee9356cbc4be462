/**
 * ntfsan CLI - Common utilities and types
 */

#pragma once

#include <ntfsan/report.hpp>
#include <ntfsan/run_config.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace ntfsan::cli {

/**
 * Global options available to every invocation.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    // Include any collected warnings in the output
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << dump_json(output) << std::endl;
    } else {
        std::cout << dump_json(j) << std::endl;
    }
}

/**
 * Resolve the diagnostic log level.
 * Priority: -v/-q flags > config log_level > NTFSAN_LOG_LEVEL env > warn
 */
inline std::string resolve_log_level(const GlobalOptions& opts, const RunConfig& config) {
    if (opts.verbose) return "debug";
    if (opts.quiet) return "error";
    if (config.log_level) return *config.log_level;

    const char* env_level = std::getenv(kLogLevelEnvVar);
    if (env_level) {
        if (auto level = normalize_log_level(env_level)) {
            return *level;
        }
    }
    return "warn";
}

/**
 * Route diagnostics to stderr so stdout carries only the report.
 */
inline void init_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("ntfsan");
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace ntfsan::cli
