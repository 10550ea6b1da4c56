#pragma once

#include "db/connection_pool.hpp"
#include "db/isecurity_store.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace secplane {

/**
 * @brief ISecurityStore backed by PostgreSQL (libpq)
 *
 * Calls run on connections checked out of a bounded pool of pool_size.
 * A connection dropped by the server is discarded when it comes back and
 * the next checkout opens a fresh one. Every session sets
 * statement_timeout so no statement runs unbounded.
 * Timestamps are stored as epoch milliseconds (BIGINT); metadata and
 * change snapshots as JSON text.
 *
 * User and session counts come from the identity tables owned by the
 * surrounding system: users(id, organization_id) and
 * user_sessions(user_id, organization_id, created_at, revoked).
 */
class PgSecurityStore : public ISecurityStore {
public:
    struct Config {
        std::string connection_string;
        uint32_t statement_timeout_ms = 2000;
        size_t pool_size = 4;
        std::chrono::milliseconds acquire_timeout{2000};
        std::chrono::hours stale_session_age{24 * 7};
        bool bootstrap_schema = true;
    };

    explicit PgSecurityStore(const Config& config);
    ~PgSecurityStore() override = default;

    void upsert_blocked(const BlockedAddress& row) override;
    bool remove_blocked(const std::string& address) override;
    bool remove_expired_blocked(const std::string& address, TimePoint now) override;
    [[nodiscard]] std::vector<BlockedAddress> load_active_blocked(TimePoint now) override;
    [[nodiscard]] std::vector<std::string> list_expired_blocked(TimePoint now) override;

    void insert_audit(const AuditEvent& event) override;
    [[nodiscard]] AuditPage query_audit(const AuditFilter& filter,
                                        const Pagination& pagination) override;
    [[nodiscard]] std::vector<AuditEvent> list_audit(const AuditFilter& filter) override;
    [[nodiscard]] std::optional<AuditEvent> last_audit(const std::string& organization_id) override;
    uint64_t delete_audit_before(const std::string& organization_id, TimePoint cutoff) override;
    [[nodiscard]] std::vector<std::string> list_organizations() override;

    [[nodiscard]] std::optional<MfaCredential> get_mfa(const std::string& user_id) override;
    void put_mfa(const MfaCredential& credential) override;
    void remove_mfa(const std::string& user_id) override;

    [[nodiscard]] std::optional<OrgSecuritySettings> get_settings(
        const std::string& organization_id) override;
    void put_settings(const OrgSecuritySettings& settings) override;

    [[nodiscard]] UserSecuritySummary get_user_summary(const std::string& organization_id) override;

    [[nodiscard]] std::string name() const override { return "postgresql"; }

    /// Create the control-plane tables if they do not exist
    void ensure_schema();

    [[nodiscard]] PoolStats pool_stats() const { return pool_.get_stats(); }

private:
    /// Opens a session with statement_timeout applied
    [[nodiscard]] std::unique_ptr<PgConnection> open_connection() const;

    template<typename Fn>
    auto with_connection(Fn&& fn) -> decltype(fn(std::declval<PgConnection&>()));

    Config config_;
    ConnectionPool<PgConnection> pool_;
};

} // namespace secplane
