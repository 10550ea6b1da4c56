#include "db/postgresql/pg_security_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace secplane {

namespace {

// ============================================================================
// Schema
// ============================================================================

constexpr const char* kSchemaStatements[] = {
    "CREATE TABLE IF NOT EXISTS security_blocked_addresses ("
    " address TEXT PRIMARY KEY,"
    " reason TEXT NOT NULL,"
    " blocked_by TEXT,"
    " blocked_at BIGINT NOT NULL,"
    " expires_at BIGINT,"
    " automatic BOOLEAN NOT NULL DEFAULT FALSE)",

    "CREATE TABLE IF NOT EXISTS security_audit_events ("
    " event_id TEXT PRIMARY KEY,"
    " organization_id TEXT NOT NULL,"
    " actor_user_id TEXT,"
    " event_type TEXT NOT NULL,"
    " severity TEXT NOT NULL,"
    " resource_type TEXT,"
    " resource_id TEXT,"
    " action TEXT NOT NULL,"
    " source_address TEXT NOT NULL,"
    " user_agent TEXT NOT NULL,"
    " metadata TEXT NOT NULL,"
    " changes TEXT,"
    " created_at BIGINT NOT NULL,"
    " sequence_num BIGINT NOT NULL,"
    " previous_hash TEXT NOT NULL,"
    " record_hash TEXT NOT NULL)",

    "CREATE INDEX IF NOT EXISTS idx_security_audit_org_created"
    " ON security_audit_events (organization_id, created_at)",

    "CREATE UNIQUE INDEX IF NOT EXISTS idx_security_audit_org_seq"
    " ON security_audit_events (organization_id, sequence_num)",

    "CREATE TABLE IF NOT EXISTS security_mfa_credentials ("
    " user_id TEXT PRIMARY KEY,"
    " organization_id TEXT NOT NULL,"
    " enabled BOOLEAN NOT NULL,"
    " verified BOOLEAN NOT NULL,"
    " encrypted_secret TEXT NOT NULL,"
    " backup_code_hashes TEXT NOT NULL,"
    " last_used_step BIGINT,"
    " created_at BIGINT NOT NULL,"
    " updated_at BIGINT NOT NULL)",

    "CREATE TABLE IF NOT EXISTS security_org_settings ("
    " organization_id TEXT PRIMARY KEY,"
    " enforce_mfa BOOLEAN NOT NULL,"
    " threat_detection_enabled BOOLEAN NOT NULL,"
    " threat_score_threshold INTEGER NOT NULL,"
    " failed_login_threshold INTEGER NOT NULL,"
    " audit_logging_enabled BOOLEAN NOT NULL,"
    " audit_retention_days INTEGER NOT NULL,"
    " ip_allowlist_enabled BOOLEAN NOT NULL,"
    " allowed_addresses TEXT NOT NULL,"
    " allow_loopback BOOLEAN NOT NULL,"
    " password_min_length INTEGER NOT NULL,"
    " session_timeout_minutes INTEGER NOT NULL)",
};

constexpr const char* kAuditColumns =
    "event_id, organization_id, actor_user_id, event_type, severity,"
    " resource_type, resource_id, action, source_address, user_agent,"
    " metadata, changes, created_at, sequence_num, previous_hash, record_hash";

// ============================================================================
// Value conversion
// ============================================================================

std::string pg_bool(bool v) { return v ? "true" : "false"; }

bool from_pg_bool(const std::optional<std::string>& v) {
    return v && (*v == "t" || *v == "true");
}

std::string pg_time(TimePoint tp) { return std::to_string(utils::to_epoch_ms(tp)); }

TimePoint from_pg_time(const std::optional<std::string>& v) {
    return utils::from_epoch_ms(v ? utils::parse_int<int64_t>(*v, 0) : 0);
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += items[i];
    }
    return out;
}

std::vector<std::string> split_list(const std::optional<std::string>& v) {
    std::vector<std::string> out;
    if (!v || v->empty()) return out;
    for (auto& item : utils::split(*v, ',')) {
        auto trimmed = utils::trim(item);
        if (!trimmed.empty()) out.push_back(std::move(trimmed));
    }
    return out;
}

AuditEvent audit_from_row(PGresult* res, int row) {
    AuditEvent e;
    e.event_id = PgConnection::get(res, row, 0).value_or("");
    e.organization_id = PgConnection::get(res, row, 1).value_or("");
    e.actor_user_id = PgConnection::get(res, row, 2);
    e.event_type = event_type_from_string(PgConnection::get(res, row, 3).value_or(""))
                       .value_or(AuditEventType::DATA_VIEWED);
    e.severity = severity_from_string(PgConnection::get(res, row, 4).value_or(""))
                     .value_or(Severity::LOW);
    e.resource_type = PgConnection::get(res, row, 5);
    e.resource_id = PgConnection::get(res, row, 6);
    e.action = PgConnection::get(res, row, 7).value_or("");
    e.source_address = PgConnection::get(res, row, 8).value_or("");
    e.user_agent = PgConnection::get(res, row, 9).value_or("");
    if (auto meta = json_value_from_string(PgConnection::get(res, row, 10).value_or(""))) {
        e.metadata = std::move(*meta);
    }
    if (const auto changes = PgConnection::get(res, row, 11)) {
        e.changes = json_value_from_string(*changes);
    }
    e.created_at = from_pg_time(PgConnection::get(res, row, 12));
    e.sequence_num = utils::parse_int<uint64_t>(PgConnection::get(res, row, 13).value_or("0"), 0);
    e.previous_hash = PgConnection::get(res, row, 14).value_or("");
    e.record_hash = PgConnection::get(res, row, 15).value_or("");
    return e;
}

/// WHERE clause for an AuditFilter; parameters appended in placeholder order
std::string build_audit_where(const AuditFilter& filter,
                              std::vector<std::optional<std::string>>& params) {
    params.emplace_back(filter.organization_id);
    std::string where = "WHERE organization_id = $1";

    const auto add = [&](const char* column, const char* op, std::string value) {
        params.emplace_back(std::move(value));
        where += std::format(" AND {} {} ${}", column, op, params.size());
    };

    if (filter.event_type) add("event_type", "=", event_type_to_string(*filter.event_type));
    if (filter.severity) add("severity", "=", severity_to_string(*filter.severity));
    if (filter.actor_user_id) add("actor_user_id", "=", *filter.actor_user_id);
    if (filter.resource_type) add("resource_type", "=", *filter.resource_type);
    if (filter.resource_id) add("resource_id", "=", *filter.resource_id);
    if (filter.start) add("created_at", ">=", pg_time(*filter.start));
    if (filter.end) add("created_at", "<", pg_time(*filter.end));
    return where;
}

} // anonymous namespace

// ============================================================================
// Connection handling
// ============================================================================

PgSecurityStore::PgSecurityStore(const Config& config)
    : config_(config),
      pool_("postgresql", config.pool_size, [this] { return open_connection(); }) {
    if (config_.bootstrap_schema) {
        ensure_schema();
    }
}

std::unique_ptr<PgConnection> PgSecurityStore::open_connection() const {
    auto conn = PgConnection::connect(config_.connection_string);
    if (!conn->set_query_timeout(config_.statement_timeout_ms)) {
        utils::log::warn("PostgreSQL: could not set statement_timeout");
    }
    return conn;
}

template<typename Fn>
auto PgSecurityStore::with_connection(Fn&& fn) -> decltype(fn(std::declval<PgConnection&>())) {
    auto lease = pool_.acquire(config_.acquire_timeout);
    return fn(*lease);
}

void PgSecurityStore::ensure_schema() {
    with_connection([](PgConnection& conn) {
        for (const char* stmt : kSchemaStatements) {
            conn.execute(stmt);
        }
    });
}

// ============================================================================
// Blocked addresses
// ============================================================================

void PgSecurityStore::upsert_blocked(const BlockedAddress& row) {
    with_connection([&](PgConnection& conn) {
        conn.execute(
            "INSERT INTO security_blocked_addresses"
            " (address, reason, blocked_by, blocked_at, expires_at, automatic)"
            " VALUES ($1, $2, $3, $4, $5, $6)"
            " ON CONFLICT (address) DO UPDATE SET"
            " reason = EXCLUDED.reason, blocked_by = EXCLUDED.blocked_by,"
            " blocked_at = EXCLUDED.blocked_at, expires_at = EXCLUDED.expires_at,"
            " automatic = EXCLUDED.automatic",
            {row.address, row.reason, row.blocked_by, pg_time(row.blocked_at),
             row.expires_at ? std::optional<std::string>(pg_time(*row.expires_at)) : std::nullopt,
             pg_bool(row.automatic)});
    });
}

bool PgSecurityStore::remove_blocked(const std::string& address) {
    return with_connection([&](PgConnection& conn) {
        auto res = conn.execute("DELETE FROM security_blocked_addresses WHERE address = $1",
                                {address});
        return PgConnection::affected_rows(res.get()) > 0;
    });
}

bool PgSecurityStore::remove_expired_blocked(const std::string& address, TimePoint now) {
    return with_connection([&](PgConnection& conn) {
        auto res = conn.execute(
            "DELETE FROM security_blocked_addresses"
            " WHERE address = $1 AND expires_at IS NOT NULL AND expires_at <= $2",
            {address, pg_time(now)});
        return PgConnection::affected_rows(res.get()) > 0;
    });
}

std::vector<BlockedAddress> PgSecurityStore::load_active_blocked(TimePoint now) {
    return with_connection([&](PgConnection& conn) {
        auto res = conn.execute(
            "SELECT address, reason, blocked_by, blocked_at, expires_at, automatic"
            " FROM security_blocked_addresses"
            " WHERE expires_at IS NULL OR expires_at > $1",
            {pg_time(now)});

        std::vector<BlockedAddress> rows;
        const int n = PQntuples(res.get());
        rows.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            BlockedAddress row;
            row.address = PgConnection::get(res.get(), i, 0).value_or("");
            row.reason = PgConnection::get(res.get(), i, 1).value_or("");
            row.blocked_by = PgConnection::get(res.get(), i, 2);
            row.blocked_at = from_pg_time(PgConnection::get(res.get(), i, 3));
            if (const auto exp = PgConnection::get(res.get(), i, 4)) {
                row.expires_at = from_pg_time(exp);
            }
            row.automatic = from_pg_bool(PgConnection::get(res.get(), i, 5));
            rows.push_back(std::move(row));
        }
        return rows;
    });
}

std::vector<std::string> PgSecurityStore::list_expired_blocked(TimePoint now) {
    return with_connection([&](PgConnection& conn) {
        auto res = conn.execute(
            "SELECT address FROM security_blocked_addresses"
            " WHERE expires_at IS NOT NULL AND expires_at <= $1",
            {pg_time(now)});

        std::vector<std::string> addresses;
        const int n = PQntuples(res.get());
        for (int i = 0; i < n; ++i) {
            addresses.push_back(PgConnection::get(res.get(), i, 0).value_or(""));
        }
        return addresses;
    });
}

// ============================================================================
// Audit events
// ============================================================================

void PgSecurityStore::insert_audit(const AuditEvent& e) {
    with_connection([&](PgConnection& conn) {
        conn.execute(
            std::format("INSERT INTO security_audit_events ({}) VALUES"
                        " ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)",
                        kAuditColumns),
            {e.event_id, e.organization_id, e.actor_user_id,
             std::string(event_type_to_string(e.event_type)),
             std::string(severity_to_string(e.severity)),
             e.resource_type, e.resource_id, e.action, e.source_address, e.user_agent,
             json_value_to_string(e.metadata),
             e.changes ? std::optional<std::string>(json_value_to_string(*e.changes)) : std::nullopt,
             pg_time(e.created_at), std::to_string(e.sequence_num),
             e.previous_hash, e.record_hash});
    });
}

AuditPage PgSecurityStore::query_audit(const AuditFilter& filter, const Pagination& pagination) {
    return with_connection([&](PgConnection& conn) {
        std::vector<std::optional<std::string>> params;
        const auto where = build_audit_where(filter, params);

        AuditPage page;
        page.page = pagination.page;
        page.limit = pagination.limit;

        auto count = conn.execute(std::format("SELECT COUNT(*) FROM security_audit_events {}", where),
                                  params);
        page.total = utils::parse_int<uint64_t>(PgConnection::get(count.get(), 0, 0).value_or("0"), 0);

        const size_t limit_idx = params.size() + 1;
        params.emplace_back(std::to_string(pagination.limit));
        params.emplace_back(std::to_string(pagination.offset()));

        auto res = conn.execute(
            std::format("SELECT {} FROM security_audit_events {}"
                        " ORDER BY created_at DESC, sequence_num DESC LIMIT ${} OFFSET ${}",
                        kAuditColumns, where, limit_idx, limit_idx + 1),
            params);

        const int n = PQntuples(res.get());
        page.events.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            page.events.push_back(audit_from_row(res.get(), i));
        }
        return page;
    });
}

std::vector<AuditEvent> PgSecurityStore::list_audit(const AuditFilter& filter) {
    return with_connection([&](PgConnection& conn) {
        std::vector<std::optional<std::string>> params;
        const auto where = build_audit_where(filter, params);
        auto res = conn.execute(
            std::format("SELECT {} FROM security_audit_events {} ORDER BY sequence_num ASC",
                        kAuditColumns, where),
            params);

        std::vector<AuditEvent> events;
        const int n = PQntuples(res.get());
        events.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            events.push_back(audit_from_row(res.get(), i));
        }
        return events;
    });
}

std::optional<AuditEvent> PgSecurityStore::last_audit(const std::string& organization_id) {
    return with_connection([&](PgConnection& conn) -> std::optional<AuditEvent> {
        auto res = conn.execute(
            std::format("SELECT {} FROM security_audit_events WHERE organization_id = $1"
                        " ORDER BY sequence_num DESC LIMIT 1", kAuditColumns),
            {organization_id});
        if (PQntuples(res.get()) == 0) return std::nullopt;
        return audit_from_row(res.get(), 0);
    });
}

uint64_t PgSecurityStore::delete_audit_before(const std::string& organization_id, TimePoint cutoff) {
    return with_connection([&](PgConnection& conn) {
        auto res = conn.execute(
            "DELETE FROM security_audit_events WHERE organization_id = $1 AND created_at < $2",
            {organization_id, pg_time(cutoff)});
        return PgConnection::affected_rows(res.get());
    });
}

std::vector<std::string> PgSecurityStore::list_organizations() {
    return with_connection([](PgConnection& conn) {
        auto res = conn.execute(
            "SELECT organization_id FROM security_audit_events"
            " UNION SELECT organization_id FROM security_org_settings"
            " ORDER BY 1");
        std::vector<std::string> orgs;
        const int n = PQntuples(res.get());
        for (int i = 0; i < n; ++i) {
            orgs.push_back(PgConnection::get(res.get(), i, 0).value_or(""));
        }
        return orgs;
    });
}

// ============================================================================
// MFA credentials
// ============================================================================

std::optional<MfaCredential> PgSecurityStore::get_mfa(const std::string& user_id) {
    return with_connection([&](PgConnection& conn) -> std::optional<MfaCredential> {
        auto res = conn.execute(
            "SELECT user_id, organization_id, enabled, verified, encrypted_secret,"
            " backup_code_hashes, last_used_step, created_at, updated_at"
            " FROM security_mfa_credentials WHERE user_id = $1",
            {user_id});
        if (PQntuples(res.get()) == 0) return std::nullopt;

        MfaCredential c;
        c.user_id = PgConnection::get(res.get(), 0, 0).value_or("");
        c.organization_id = PgConnection::get(res.get(), 0, 1).value_or("");
        c.enabled = from_pg_bool(PgConnection::get(res.get(), 0, 2));
        c.verified = from_pg_bool(PgConnection::get(res.get(), 0, 3));
        c.encrypted_secret = PgConnection::get(res.get(), 0, 4).value_or("");
        c.backup_code_hashes = split_list(PgConnection::get(res.get(), 0, 5));
        if (const auto step = PgConnection::get(res.get(), 0, 6)) {
            c.last_used_step = utils::try_parse_int<uint64_t>(*step);
        }
        c.created_at = from_pg_time(PgConnection::get(res.get(), 0, 7));
        c.updated_at = from_pg_time(PgConnection::get(res.get(), 0, 8));
        return c;
    });
}

void PgSecurityStore::put_mfa(const MfaCredential& c) {
    with_connection([&](PgConnection& conn) {
        conn.execute(
            "INSERT INTO security_mfa_credentials"
            " (user_id, organization_id, enabled, verified, encrypted_secret,"
            "  backup_code_hashes, last_used_step, created_at, updated_at)"
            " VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)"
            " ON CONFLICT (user_id) DO UPDATE SET"
            " organization_id = EXCLUDED.organization_id, enabled = EXCLUDED.enabled,"
            " verified = EXCLUDED.verified, encrypted_secret = EXCLUDED.encrypted_secret,"
            " backup_code_hashes = EXCLUDED.backup_code_hashes,"
            " last_used_step = EXCLUDED.last_used_step, updated_at = EXCLUDED.updated_at",
            {c.user_id, c.organization_id, pg_bool(c.enabled), pg_bool(c.verified),
             c.encrypted_secret, join(c.backup_code_hashes),
             c.last_used_step ? std::optional<std::string>(std::to_string(*c.last_used_step))
                              : std::nullopt,
             pg_time(c.created_at), pg_time(c.updated_at)});
    });
}

void PgSecurityStore::remove_mfa(const std::string& user_id) {
    with_connection([&](PgConnection& conn) {
        conn.execute("DELETE FROM security_mfa_credentials WHERE user_id = $1", {user_id});
    });
}

// ============================================================================
// Settings
// ============================================================================

std::optional<OrgSecuritySettings> PgSecurityStore::get_settings(const std::string& organization_id) {
    return with_connection([&](PgConnection& conn) -> std::optional<OrgSecuritySettings> {
        auto res = conn.execute(
            "SELECT organization_id, enforce_mfa, threat_detection_enabled,"
            " threat_score_threshold, failed_login_threshold, audit_logging_enabled,"
            " audit_retention_days, ip_allowlist_enabled, allowed_addresses,"
            " allow_loopback, password_min_length, session_timeout_minutes"
            " FROM security_org_settings WHERE organization_id = $1",
            {organization_id});
        if (PQntuples(res.get()) == 0) return std::nullopt;

        PGresult* r = res.get();
        const auto int_at = [r](int col, int fallback) {
            return utils::parse_int<int>(PgConnection::get(r, 0, col).value_or(""), fallback);
        };

        OrgSecuritySettings s;
        s.organization_id = PgConnection::get(r, 0, 0).value_or("");
        s.enforce_mfa = from_pg_bool(PgConnection::get(r, 0, 1));
        s.threat_detection_enabled = from_pg_bool(PgConnection::get(r, 0, 2));
        s.threat_score_threshold = int_at(3, s.threat_score_threshold);
        s.failed_login_threshold = int_at(4, s.failed_login_threshold);
        s.audit_logging_enabled = from_pg_bool(PgConnection::get(r, 0, 5));
        s.audit_retention_days = int_at(6, s.audit_retention_days);
        s.ip_allowlist_enabled = from_pg_bool(PgConnection::get(r, 0, 7));
        s.allowed_addresses = split_list(PgConnection::get(r, 0, 8));
        s.allow_loopback = from_pg_bool(PgConnection::get(r, 0, 9));
        s.password_min_length = int_at(10, s.password_min_length);
        s.session_timeout_minutes = int_at(11, s.session_timeout_minutes);
        return s;
    });
}

void PgSecurityStore::put_settings(const OrgSecuritySettings& s) {
    with_connection([&](PgConnection& conn) {
        conn.execute(
            "INSERT INTO security_org_settings"
            " (organization_id, enforce_mfa, threat_detection_enabled, threat_score_threshold,"
            "  failed_login_threshold, audit_logging_enabled, audit_retention_days,"
            "  ip_allowlist_enabled, allowed_addresses, allow_loopback,"
            "  password_min_length, session_timeout_minutes)"
            " VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)"
            " ON CONFLICT (organization_id) DO UPDATE SET"
            " enforce_mfa = EXCLUDED.enforce_mfa,"
            " threat_detection_enabled = EXCLUDED.threat_detection_enabled,"
            " threat_score_threshold = EXCLUDED.threat_score_threshold,"
            " failed_login_threshold = EXCLUDED.failed_login_threshold,"
            " audit_logging_enabled = EXCLUDED.audit_logging_enabled,"
            " audit_retention_days = EXCLUDED.audit_retention_days,"
            " ip_allowlist_enabled = EXCLUDED.ip_allowlist_enabled,"
            " allowed_addresses = EXCLUDED.allowed_addresses,"
            " allow_loopback = EXCLUDED.allow_loopback,"
            " password_min_length = EXCLUDED.password_min_length,"
            " session_timeout_minutes = EXCLUDED.session_timeout_minutes",
            {s.organization_id, pg_bool(s.enforce_mfa), pg_bool(s.threat_detection_enabled),
             std::to_string(s.threat_score_threshold), std::to_string(s.failed_login_threshold),
             pg_bool(s.audit_logging_enabled), std::to_string(s.audit_retention_days),
             pg_bool(s.ip_allowlist_enabled), join(s.allowed_addresses),
             pg_bool(s.allow_loopback), std::to_string(s.password_min_length),
             std::to_string(s.session_timeout_minutes)});
    });
}

// ============================================================================
// Identity-side counts
// ============================================================================

UserSecuritySummary PgSecurityStore::get_user_summary(const std::string& organization_id) {
    return with_connection([&](PgConnection& conn) {
        UserSecuritySummary summary;

        auto users = conn.execute(
            "SELECT COUNT(*), COUNT(m.user_id)"
            " FROM users u LEFT JOIN security_mfa_credentials m"
            "   ON m.user_id = u.id AND m.enabled AND m.verified"
            " WHERE u.organization_id = $1",
            {organization_id});
        summary.total_users = utils::parse_int<uint64_t>(
            PgConnection::get(users.get(), 0, 0).value_or("0"), 0);
        summary.mfa_enabled_users = utils::parse_int<uint64_t>(
            PgConnection::get(users.get(), 0, 1).value_or("0"), 0);

        const auto stale_cutoff = utils::now() - config_.stale_session_age;
        auto sessions = conn.execute(
            "SELECT COUNT(*), COUNT(*) FILTER (WHERE created_at < $2)"
            " FROM user_sessions WHERE organization_id = $1 AND NOT revoked",
            {organization_id, pg_time(stale_cutoff)});
        summary.active_sessions = utils::parse_int<uint64_t>(
            PgConnection::get(sessions.get(), 0, 0).value_or("0"), 0);
        summary.stale_sessions = utils::parse_int<uint64_t>(
            PgConnection::get(sessions.get(), 0, 1).value_or("0"), 0);
        return summary;
    });
}

} // namespace secplane
