#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace secplane;

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("ConfigLoader: empty document uses defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.threat.block_threshold == 75);
    CHECK(c.threat.suspicious_threshold == 25);
    CHECK(c.threat.rate_threshold == 60);
    CHECK(c.threat.failed_login_threshold == 5);
    CHECK(c.threat.distinct_address_threshold == 5);
    CHECK(c.threat.window_seconds == 3600);
    CHECK(c.threat.auto_block_ttl_seconds == 86400);
    CHECK(c.audit.default_retention_days == 365);
    CHECK(c.mfa.digits == 6);
    CHECK(c.mfa.skew_steps == 2);
    CHECK(c.encryption.iterations == 100000);
    CHECK(c.storage.backend == "memory");
    CHECK(c.storage.pool_size == 4);
    CHECK(c.logging.level == "info");
}

TEST_CASE("ConfigLoader: every section is read", "[config]") {
    const std::string toml = R"(
[threat]
block_threshold = 80
suspicious_threshold = 30
rate_threshold = 120
failed_login_threshold = 3
distinct_address_threshold = 4
window_seconds = 1800
auto_block_ttl_seconds = 3600
spoofing_headers = ["X-Forwarded-Host"]
system_organization_id = "platform"

[denylist]
sweep_interval_seconds = 60
shard_count = 8

[audit]
default_retention_days = 90
write_timeout_ms = 1000

[audit.webhook]
enabled = true
url = "https://alerts.example.com/hook"
max_retries = 5

[mfa]
issuer = "Acme"
digits = 8
backup_code_count = 12

[encryption]
master_secret_env = "ACME_SECRET"
iterations = 200000

[storage]
backend = "PostgreSQL"
connection_string = "host=db dbname=security"
worker_count = 8
pool_size = 6

[settings]
cache_ttl_seconds = 30
enforce_mfa = true
password_min_length = 14

[logging]
level = "DEBUG"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& c = result.config;

    CHECK(c.threat.block_threshold == 80);
    CHECK(c.threat.suspicious_threshold == 30);
    CHECK(c.threat.rate_threshold == 120);
    CHECK(c.threat.failed_login_threshold == 3);
    CHECK(c.threat.distinct_address_threshold == 4);
    CHECK(c.threat.window_seconds == 1800);
    CHECK(c.threat.auto_block_ttl_seconds == 3600);
    CHECK(c.threat.spoofing_headers == std::vector<std::string>{"x-forwarded-host"});
    CHECK(c.threat.system_organization_id == "platform");

    CHECK(c.denylist.sweep_interval_seconds == 60);
    CHECK(c.denylist.shard_count == 8);

    CHECK(c.audit.default_retention_days == 90);
    CHECK(c.audit.write_timeout_ms == 1000);
    CHECK(c.audit.webhook_enabled);
    CHECK(c.audit.webhook_url == "https://alerts.example.com/hook");
    CHECK(c.audit.webhook_max_retries == 5);

    CHECK(c.mfa.issuer == "Acme");
    CHECK(c.mfa.digits == 8);
    CHECK(c.mfa.backup_code_count == 12);

    CHECK(c.encryption.master_secret_env == "ACME_SECRET");
    CHECK(c.encryption.iterations == 200000);

    CHECK(c.storage.backend == "postgresql");
    CHECK(c.storage.connection_string == "host=db dbname=security");
    CHECK(c.storage.worker_count == 8);
    CHECK(c.storage.pool_size == 6);

    CHECK(c.settings.cache_ttl_seconds == 30);
    CHECK(c.settings.enforce_mfa);
    CHECK(c.logging.level == "debug");
}

TEST_CASE("ConfigLoader: organization defaults follow the config", "[config]") {
    const std::string toml = R"(
[threat]
block_threshold = 90
failed_login_threshold = 7

[audit]
default_retention_days = 30

[settings]
enforce_mfa = true
allow_loopback = false
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto defaults = result.config.default_org_settings();
    CHECK(defaults.threat_score_threshold == 90);
    CHECK(defaults.failed_login_threshold == 7);
    CHECK(defaults.audit_retention_days == 30);
    CHECK(defaults.enforce_mfa);
    CHECK_FALSE(defaults.allow_loopback);
    CHECK(defaults.threat_detection_enabled);
}

TEST_CASE("ConfigLoader: missing file fails", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/secplane.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML fails", "[config]") {
    auto result = ConfigLoader::load_from_string("[threat\nblock_threshold = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("ConfigLoader: expands env vars in strings", "[config][env]") {
    ::setenv("SECPLANE_TEST_DB_PASSWORD", "s3cret", 1);
    const std::string toml = R"(
[storage]
backend = "postgresql"
connection_string = "host=localhost password=${SECPLANE_TEST_DB_PASSWORD} dbname=security"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.storage.connection_string ==
          "host=localhost password=s3cret dbname=security");
    ::unsetenv("SECPLANE_TEST_DB_PASSWORD");
}

TEST_CASE("ConfigLoader: unset env var expands to empty", "[config][env]") {
    ::unsetenv("SECPLANE_TEST_UNSET_VAR");
    const std::string toml = R"(
[audit.webhook]
enabled = true
url = "https://hooks.example.com/${SECPLANE_TEST_UNSET_VAR}"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.audit.webhook_url == "https://hooks.example.com/");
}

TEST_CASE("ConfigLoader: unclosed substitution fails", "[config][env]") {
    const std::string toml = R"(
[storage]
connection_string = "host=${UNCLOSED"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: too few key derivation iterations fail", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[encryption]\niterations = 1000\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("encryption.iterations") != std::string::npos);
}

TEST_CASE("ConfigLoader: unknown storage backend fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[storage]\nbackend = \"redis\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("storage.backend") != std::string::npos);
}

TEST_CASE("ConfigLoader: postgresql needs a connection string", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[storage]\nbackend = \"postgresql\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("connection_string") != std::string::npos);
}

TEST_CASE("ConfigLoader: bad log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: suspicious threshold must stay below block threshold", "[config][validation]") {
    const std::string toml = R"(
[threat]
block_threshold = 50
suspicious_threshold = 50
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("suspicious_threshold") != std::string::npos);
}

TEST_CASE("ConfigLoader: webhook enabled without url fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[audit.webhook]\nenabled = true\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("audit.webhook.url") != std::string::npos);
}

TEST_CASE("ConfigLoader: every problem is reported", "[config][validation]") {
    SecPlaneConfig config;
    config.mfa.digits = 7;
    config.audit.default_retention_days = 0;
    config.storage.worker_count = 0;
    config.storage.pool_size = 0;

    const auto errors = ConfigLoader::validate_config(config);
    CHECK(errors.size() == 4);
    CHECK(ConfigLoader::validate_config(SecPlaneConfig{}).empty());
}
