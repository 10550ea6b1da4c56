#pragma once

#include "db/isecurity_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace secplane {

/**
 * @brief Process-local ISecurityStore
 *
 * Backs tests and single-node deployments without a database. One mutex
 * per table; every call copies in or out so no reference escapes a lock.
 */
class InMemorySecurityStore : public ISecurityStore {
public:
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

    [[nodiscard]] std::string name() const override { return "memory"; }

    // ---- Identity-side seeding (owned by the surrounding system) -----------

    void register_user(const std::string& organization_id, const std::string& user_id);
    void set_session_counts(const std::string& organization_id,
                            uint64_t active_sessions, uint64_t stale_sessions);

    /// Direct row access for integrity checks
    [[nodiscard]] size_t audit_row_count() const;

private:
    struct SessionCounts {
        uint64_t active = 0;
        uint64_t stale = 0;
    };

    mutable std::mutex blocked_mutex_;
    std::unordered_map<std::string, BlockedAddress> blocked_;

    mutable std::mutex audit_mutex_;
    std::unordered_map<std::string, std::vector<AuditEvent>> audit_;   // org → sequence order

    mutable std::mutex mfa_mutex_;
    std::unordered_map<std::string, MfaCredential> mfa_;

    mutable std::mutex settings_mutex_;
    std::unordered_map<std::string, OrgSecuritySettings> settings_;

    mutable std::mutex users_mutex_;
    std::unordered_map<std::string, std::unordered_set<std::string>> users_;
    std::unordered_map<std::string, SessionCounts> sessions_;
};

} // namespace secplane
