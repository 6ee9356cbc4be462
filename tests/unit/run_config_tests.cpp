#include <doctest/doctest.h>
#include <ntfsan/run_config.hpp>

#include <algorithm>
#include <cstdlib>
#include <string>

using namespace ntfsan;

namespace {

inline void safe_setenv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

inline void safe_unsetenv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

bool has_warning(const RunConfigParseResult& r, const std::string& w) {
    return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse full config") {
    auto r = parse_run_config(R"({
        "$schema": "ntfsan.config.v1",
        "max_length": 120,
        "dry_run": true,
        "ignore": ["build", "docs/README"],
        "log_level": "debug"
    })", "/etc/ntfsan.json");

    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    CHECK(r.config.max_length == 120);
    CHECK(r.config.dry_run);
    REQUIRE(r.config.ignore.size() == 2);
    CHECK(r.config.ignore[0] == "build");
    CHECK(r.config.ignore[1] == "docs/README");
    REQUIRE(r.config.log_level.has_value());
    CHECK(*r.config.log_level == "debug");
    CHECK(r.config.source_path == "/etc/ntfsan.json");
}

TEST_CASE("minimal config keeps defaults") {
    auto r = parse_run_config(R"({"$schema": "ntfsan.config.v1"})");
    REQUIRE(r.ok);
    CHECK(r.config.max_length == kDefaultMaxLength);
    CHECK_FALSE(r.config.dry_run);
    CHECK(r.config.ignore.empty());
    CHECK_FALSE(r.config.log_level.has_value());
}

TEST_CASE("schema is required and must match") {
    auto missing = parse_run_config(R"({"max_length": 10})");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto wrong = parse_run_config(R"({"$schema": "ntfsan.config.v0"})");
    CHECK_FALSE(wrong.ok);
    CHECK(wrong.error.find("$schema mismatch") != std::string::npos);
}

TEST_CASE("non-object and malformed JSON are rejected") {
    auto arr = parse_run_config("[1, 2]");
    CHECK_FALSE(arr.ok);
    CHECK(arr.error == "JSON must be an object");

    auto bad = parse_run_config("{not json");
    CHECK_FALSE(bad.ok);
    CHECK(bad.error.find("parse error") == 0);
}

TEST_CASE("max_length must be a positive integer") {
    CHECK_FALSE(parse_run_config(R"({"$schema": "ntfsan.config.v1", "max_length": 0})").ok);
    CHECK_FALSE(parse_run_config(R"({"$schema": "ntfsan.config.v1", "max_length": -5})").ok);
    CHECK_FALSE(parse_run_config(R"({"$schema": "ntfsan.config.v1", "max_length": "100"})").ok);
    CHECK_FALSE(parse_run_config(R"({"$schema": "ntfsan.config.v1", "max_length": 1.5})").ok);
    CHECK(parse_run_config(R"({"$schema": "ntfsan.config.v1", "max_length": 1})").ok);
}

TEST_CASE("wrongly typed optional keys warn and fall back") {
    auto r = parse_run_config(R"({
        "$schema": "ntfsan.config.v1",
        "dry_run": "yes",
        "ignore": "build",
        "log_level": "loud"
    })");
    REQUIRE(r.ok);
    CHECK_FALSE(r.config.dry_run);
    CHECK(r.config.ignore.empty());
    CHECK_FALSE(r.config.log_level.has_value());
    CHECK(has_warning(r, "invalid_configuration:dry_run"));
    CHECK(has_warning(r, "invalid_configuration:ignore"));
    CHECK(has_warning(r, "invalid_configuration:log_level"));
}

TEST_CASE("bad ignore entries are skipped individually") {
    auto r = parse_run_config(R"({"$schema": "ntfsan.config.v1", "ignore": ["keep", 3, ""]})");
    REQUIRE(r.ok);
    REQUIRE(r.config.ignore.size() == 1);
    CHECK(r.config.ignore[0] == "keep");
    CHECK(has_warning(r, "invalid_configuration:ignore_entry"));
}

TEST_CASE("unknown keys produce a warning") {
    auto r = parse_run_config(R"({"$schema": "ntfsan.config.v1", "colour": "red"})");
    REQUIRE(r.ok);
    CHECK(has_warning(r, "unknown_key:colour"));
}

TEST_CASE("log level names are normalized") {
    CHECK(normalize_log_level("DEBUG") == std::optional<std::string>("debug"));
    CHECK(normalize_log_level(" warn ") == std::optional<std::string>("warn"));
    CHECK_FALSE(normalize_log_level("verbose").has_value());
    CHECK_FALSE(normalize_log_level("").has_value());
}

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("loading a missing file fails") {
    auto r = load_run_config("/nonexistent/ntfsan/config.json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("cannot open config file") == 0);
}

TEST_CASE("config path resolution prefers the explicit override") {
    safe_setenv(kConfigEnvVar, "/from/env.json");

    auto explicit_path = resolve_config_path(std::string("/from/flag.json"));
    REQUIRE(explicit_path.has_value());
    CHECK(*explicit_path == "/from/flag.json");

    auto env_path = resolve_config_path(std::nullopt);
    REQUIRE(env_path.has_value());
    CHECK(*env_path == "/from/env.json");

    safe_unsetenv(kConfigEnvVar);
    CHECK_FALSE(resolve_config_path(std::nullopt).has_value());
    CHECK_FALSE(resolve_config_path(std::string("")).has_value());
}
