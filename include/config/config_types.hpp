#pragma once

#include "tenant/security_settings.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace secplane {

// ============================================================================
// Threat scoring (mirrors [threat])
// ============================================================================

struct ThreatConfig {
    int block_threshold = 75;                   // Default org threshold
    int suspicious_threshold = 25;
    uint64_t rate_threshold = 60;
    int failed_login_threshold = 5;             // Default org threshold
    size_t distinct_address_threshold = 5;
    uint32_t window_seconds = 3600;
    uint32_t auto_block_ttl_seconds = 86400;
    std::vector<std::string> spoofing_headers = {"x-forwarded-host", "x-original-url"};
    size_t min_user_agent_length = 10;
    size_t max_scan_bytes = 8192;               // Payload prefix scanned for signatures
    size_t shard_count = 32;
    size_t max_tracked_identities = 100000;
    std::string system_organization_id = "system";
};

// ============================================================================
// Denylist (mirrors [denylist])
// ============================================================================

struct DenylistConfig {
    uint32_t sweep_interval_seconds = 300;
    size_t shard_count = 16;
};

// ============================================================================
// Audit (mirrors [audit] and [audit.webhook])
// ============================================================================

struct AuditConfig {
    int default_retention_days = 365;
    uint32_t write_timeout_ms = 2000;
    uint32_t purge_interval_seconds = 3600;
    uint32_t alert_timeout_ms = 250;            // Request-path wait on alert delivery

    bool webhook_enabled = false;
    std::string webhook_url;
    std::string webhook_auth_header;
    int webhook_timeout_ms = 5000;
    int webhook_max_retries = 3;
};

// ============================================================================
// MFA (mirrors [mfa])
// ============================================================================

struct MfaConfig {
    std::string issuer = "SecPlane";
    int digits = 6;
    int period_seconds = 30;
    int skew_steps = 2;
    size_t backup_code_count = 10;
    int repeated_failure_threshold = 3;
    uint32_t failure_window_seconds = 900;
};

// ============================================================================
// Field encryption (mirrors [encryption])
// ============================================================================

struct EncryptionConfig {
    std::string master_secret_env = "SECPLANE_MASTER_SECRET";
    std::string salt = "secplane-field-encryption";
    int iterations = 100000;
};

// ============================================================================
// Storage (mirrors [storage])
// ============================================================================

struct StorageConfig {
    std::string backend = "memory";             // memory | postgresql
    std::string connection_string;
    uint32_t statement_timeout_ms = 2000;
    uint32_t call_timeout_ms = 2000;
    size_t worker_count = 4;
    size_t pool_size = 4;                       // PostgreSQL connections
    bool bootstrap_schema = true;
    uint32_t stale_session_hours = 168;
};

// ============================================================================
// Organization settings cache (mirrors [settings])
// ============================================================================

struct SettingsConfig {
    uint32_t cache_ttl_seconds = 60;
    uint32_t load_timeout_ms = 500;

    // Defaults for organizations without a stored row
    bool enforce_mfa = false;
    bool allow_loopback = true;
    int password_min_length = 12;
    int session_timeout_minutes = 1440;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Top-level
// ============================================================================

struct SecPlaneConfig {
    ThreatConfig threat;
    DenylistConfig denylist;
    AuditConfig audit;
    MfaConfig mfa;
    EncryptionConfig encryption;
    StorageConfig storage;
    SettingsConfig settings;
    LoggingConfig logging;

    /// Settings applied to organizations without a stored row
    [[nodiscard]] OrgSecuritySettings default_org_settings() const {
        OrgSecuritySettings s;
        s.enforce_mfa = settings.enforce_mfa;
        s.threat_score_threshold = threat.block_threshold;
        s.failed_login_threshold = threat.failed_login_threshold;
        s.audit_retention_days = audit.default_retention_days;
        s.allow_loopback = settings.allow_loopback;
        s.password_min_length = settings.password_min_length;
        s.session_timeout_minutes = settings.session_timeout_minutes;
        return s;
    }
};

} // namespace secplane
