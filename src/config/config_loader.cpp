#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/derived_key_manager.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace secplane {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_node(val);
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* t = node.as_table()) {
        expand_table(*t);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_table(result);
    return result;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

ThreatConfig ConfigLoader::extract_threat(const toml::table& root) {
    ThreatConfig cfg;
    const auto* threat = root["threat"].as_table();
    if (!threat) return cfg;
    const auto& t = *threat;

    cfg.block_threshold = t["block_threshold"].value_or(cfg.block_threshold);
    cfg.suspicious_threshold = t["suspicious_threshold"].value_or(cfg.suspicious_threshold);
    cfg.rate_threshold = static_cast<uint64_t>(t["rate_threshold"].value_or(int64_t{60}));
    cfg.failed_login_threshold = t["failed_login_threshold"].value_or(cfg.failed_login_threshold);
    cfg.distinct_address_threshold = static_cast<size_t>(t["distinct_address_threshold"].value_or(5));
    cfg.window_seconds = static_cast<uint32_t>(t["window_seconds"].value_or(3600));
    cfg.auto_block_ttl_seconds = static_cast<uint32_t>(t["auto_block_ttl_seconds"].value_or(86400));
    if (t.contains("spoofing_headers")) {
        cfg.spoofing_headers.clear();
        for (const auto& h : toml_string_array(t, "spoofing_headers")) {
            cfg.spoofing_headers.push_back(utils::to_lower(h));
        }
    }
    cfg.min_user_agent_length = static_cast<size_t>(t["min_user_agent_length"].value_or(10));
    cfg.max_scan_bytes = static_cast<size_t>(t["max_scan_bytes"].value_or(8192));
    cfg.shard_count = static_cast<size_t>(t["shard_count"].value_or(32));
    cfg.max_tracked_identities = static_cast<size_t>(t["max_tracked_identities"].value_or(100000));
    cfg.system_organization_id = t["system_organization_id"].value_or(cfg.system_organization_id);
    return cfg;
}

DenylistConfig ConfigLoader::extract_denylist(const toml::table& root) {
    DenylistConfig cfg;
    const auto* denylist = root["denylist"].as_table();
    if (!denylist) return cfg;
    const auto& d = *denylist;

    cfg.sweep_interval_seconds = static_cast<uint32_t>(d["sweep_interval_seconds"].value_or(300));
    cfg.shard_count = static_cast<size_t>(d["shard_count"].value_or(16));
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.default_retention_days = a["default_retention_days"].value_or(cfg.default_retention_days);
    cfg.write_timeout_ms = static_cast<uint32_t>(a["write_timeout_ms"].value_or(2000));
    cfg.purge_interval_seconds = static_cast<uint32_t>(a["purge_interval_seconds"].value_or(3600));
    cfg.alert_timeout_ms = static_cast<uint32_t>(a["alert_timeout_ms"].value_or(250));

    if (const auto* w = a["webhook"].as_table()) {
        cfg.webhook_enabled = (*w)["enabled"].value_or(false);
        cfg.webhook_url = (*w)["url"].value_or(""s);
        cfg.webhook_auth_header = (*w)["auth_header"].value_or(""s);
        cfg.webhook_timeout_ms = (*w)["timeout_ms"].value_or(5000);
        cfg.webhook_max_retries = (*w)["max_retries"].value_or(3);
    }
    return cfg;
}

MfaConfig ConfigLoader::extract_mfa(const toml::table& root) {
    MfaConfig cfg;
    const auto* mfa = root["mfa"].as_table();
    if (!mfa) return cfg;
    const auto& m = *mfa;

    cfg.issuer = m["issuer"].value_or(cfg.issuer);
    cfg.digits = m["digits"].value_or(cfg.digits);
    cfg.period_seconds = m["period_seconds"].value_or(cfg.period_seconds);
    cfg.skew_steps = m["skew_steps"].value_or(cfg.skew_steps);
    cfg.backup_code_count = static_cast<size_t>(m["backup_code_count"].value_or(10));
    cfg.repeated_failure_threshold = m["repeated_failure_threshold"].value_or(cfg.repeated_failure_threshold);
    cfg.failure_window_seconds = static_cast<uint32_t>(m["failure_window_seconds"].value_or(900));
    return cfg;
}

EncryptionConfig ConfigLoader::extract_encryption(const toml::table& root) {
    EncryptionConfig cfg;
    const auto* enc = root["encryption"].as_table();
    if (!enc) return cfg;
    const auto& e = *enc;

    cfg.master_secret_env = e["master_secret_env"].value_or(cfg.master_secret_env);
    cfg.salt = e["salt"].value_or(cfg.salt);
    cfg.iterations = e["iterations"].value_or(cfg.iterations);
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.backend = utils::to_lower(s["backend"].value_or(cfg.backend));
    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.statement_timeout_ms = static_cast<uint32_t>(s["statement_timeout_ms"].value_or(2000));
    cfg.call_timeout_ms = static_cast<uint32_t>(s["call_timeout_ms"].value_or(2000));
    cfg.worker_count = static_cast<size_t>(s["worker_count"].value_or(4));
    cfg.pool_size = static_cast<size_t>(s["pool_size"].value_or(4));
    cfg.bootstrap_schema = s["bootstrap_schema"].value_or(true);
    cfg.stale_session_hours = static_cast<uint32_t>(s["stale_session_hours"].value_or(168));
    return cfg;
}

SettingsConfig ConfigLoader::extract_settings(const toml::table& root) {
    SettingsConfig cfg;
    const auto* settings = root["settings"].as_table();
    if (!settings) return cfg;
    const auto& s = *settings;

    cfg.cache_ttl_seconds = static_cast<uint32_t>(s["cache_ttl_seconds"].value_or(60));
    cfg.load_timeout_ms = static_cast<uint32_t>(s["load_timeout_ms"].value_or(500));
    cfg.enforce_mfa = s["enforce_mfa"].value_or(cfg.enforce_mfa);
    cfg.allow_loopback = s["allow_loopback"].value_or(cfg.allow_loopback);
    cfg.password_min_length = s["password_min_length"].value_or(cfg.password_min_length);
    cfg.session_timeout_minutes = s["session_timeout_minutes"].value_or(cfg.session_timeout_minutes);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

SecPlaneConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    SecPlaneConfig config;
    config.threat = extract_threat(tbl);
    config.denylist = extract_denylist(tbl);
    config.audit = extract_audit(tbl);
    config.mfa = extract_mfa(tbl);
    config.encryption = extract_encryption(tbl);
    config.storage = extract_storage(tbl);
    config.settings = extract_settings(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SecPlaneConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SecPlaneConfig& config) {
    std::vector<std::string> errors;

    const auto& t = config.threat;
    if (!utils::in_range<1, 1000>(t.block_threshold)) {
        errors.push_back(std::format("threat.block_threshold must be 1-1000, got {}", t.block_threshold));
    }
    if (t.suspicious_threshold < 0 || t.suspicious_threshold >= t.block_threshold) {
        errors.push_back(std::format(
            "threat.suspicious_threshold ({}) must be >= 0 and below block_threshold ({})",
            t.suspicious_threshold, t.block_threshold));
    }
    if (t.rate_threshold == 0) errors.emplace_back("threat.rate_threshold must be > 0");
    if (t.failed_login_threshold < 1) errors.emplace_back("threat.failed_login_threshold must be >= 1");
    if (t.window_seconds == 0) errors.emplace_back("threat.window_seconds must be > 0");
    if (t.auto_block_ttl_seconds == 0) errors.emplace_back("threat.auto_block_ttl_seconds must be > 0");
    if (t.shard_count == 0) errors.emplace_back("threat.shard_count must be > 0");
    if (t.max_scan_bytes == 0) errors.emplace_back("threat.max_scan_bytes must be > 0");
    if (t.system_organization_id.empty()) errors.emplace_back("threat.system_organization_id must not be empty");

    if (config.denylist.shard_count == 0) errors.emplace_back("denylist.shard_count must be > 0");
    if (config.denylist.sweep_interval_seconds == 0) {
        errors.emplace_back("denylist.sweep_interval_seconds must be > 0");
    }

    const auto& a = config.audit;
    if (!utils::in_range<1, 3650>(a.default_retention_days)) {
        errors.push_back(std::format("audit.default_retention_days must be 1-3650, got {}",
                                     a.default_retention_days));
    }
    if (a.write_timeout_ms == 0) errors.emplace_back("audit.write_timeout_ms must be > 0");
    if (a.purge_interval_seconds == 0) errors.emplace_back("audit.purge_interval_seconds must be > 0");
    if (a.webhook_enabled && a.webhook_url.empty()) {
        errors.emplace_back("audit.webhook.url required when webhook is enabled");
    }

    const auto& m = config.mfa;
    if (m.digits != 6 && m.digits != 8) {
        errors.push_back(std::format("mfa.digits must be 6 or 8, got {}", m.digits));
    }
    if (m.period_seconds <= 0) errors.emplace_back("mfa.period_seconds must be > 0");
    if (!utils::in_range<0, 10>(m.skew_steps)) errors.emplace_back("mfa.skew_steps must be 0-10");
    if (m.backup_code_count == 0) errors.emplace_back("mfa.backup_code_count must be > 0");
    if (m.repeated_failure_threshold < 1) errors.emplace_back("mfa.repeated_failure_threshold must be >= 1");

    const auto& e = config.encryption;
    if (e.master_secret_env.empty()) errors.emplace_back("encryption.master_secret_env must not be empty");
    if (e.salt.empty()) errors.emplace_back("encryption.salt must not be empty");
    if (e.iterations < DerivedKeyManager::kMinIterations) {
        errors.push_back(std::format("encryption.iterations must be >= {}, got {}",
                                     DerivedKeyManager::kMinIterations, e.iterations));
    }

    const auto& s = config.storage;
    if (s.backend != "memory" && s.backend != "postgresql") {
        errors.push_back(std::format("storage.backend must be 'memory' or 'postgresql', got '{}'", s.backend));
    }
    if (s.backend == "postgresql" && s.connection_string.empty()) {
        errors.emplace_back("storage.connection_string required for the postgresql backend");
    }
    if (s.worker_count == 0) errors.emplace_back("storage.worker_count must be > 0");
    if (s.pool_size == 0) errors.emplace_back("storage.pool_size must be > 0");
    if (s.call_timeout_ms == 0) errors.emplace_back("storage.call_timeout_ms must be > 0");

    if (!utils::in_range<1, 128>(config.settings.password_min_length)) {
        errors.emplace_back("settings.password_min_length must be 1-128");
    }
    if (config.settings.session_timeout_minutes < 1) {
        errors.emplace_back("settings.session_timeout_minutes must be >= 1");
    }

    const auto& level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'", level));
    }

    return errors;
}

} // namespace secplane
