#pragma once

#include "audit/audit_event.hpp"
#include "security/blocked_address.hpp"
#include "security/mfa_credential.hpp"
#include "tenant/security_settings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

/**
 * @brief Persistence seam for the control plane
 *
 * Implementations throw SecurityError(PERSISTENCE_UNAVAILABLE) when the
 * backing store cannot be reached. They must be safe to call from
 * several threads at once; callers bound the wait via TaskExecutor.
 */
class ISecurityStore {
public:
    virtual ~ISecurityStore() = default;

    // ---- Blocked addresses (unique on address) -----------------------------

    /// Insert or replace reason / blocked_by / expiry for an address
    virtual void upsert_blocked(const BlockedAddress& row) = 0;

    /// Returns true if a row was removed
    virtual bool remove_blocked(const std::string& address) = 0;

    /// Removes the row only while its expiry is still at or before now,
    /// so a block renewed since it was listed survives
    virtual bool remove_expired_blocked(const std::string& address, TimePoint now) = 0;

    /// Rows whose expiry is empty or later than now
    [[nodiscard]] virtual std::vector<BlockedAddress> load_active_blocked(TimePoint now) = 0;

    /// Addresses whose expiry is at or before now
    [[nodiscard]] virtual std::vector<std::string> list_expired_blocked(TimePoint now) = 0;

    // ---- Audit events (append-only) ----------------------------------------

    virtual void insert_audit(const AuditEvent& event) = 0;

    [[nodiscard]] virtual AuditPage query_audit(const AuditFilter& filter,
                                                const Pagination& pagination) = 0;

    /// Every matching event, oldest first (chain order)
    [[nodiscard]] virtual std::vector<AuditEvent> list_audit(const AuditFilter& filter) = 0;

    /// Highest-sequence event of an organization
    [[nodiscard]] virtual std::optional<AuditEvent> last_audit(const std::string& organization_id) = 0;

    /// Retention purge; returns the number of rows deleted
    virtual uint64_t delete_audit_before(const std::string& organization_id, TimePoint cutoff) = 0;

    /// Organizations that own audit rows or settings
    [[nodiscard]] virtual std::vector<std::string> list_organizations() = 0;

    // ---- MFA credentials (one per user) ------------------------------------

    [[nodiscard]] virtual std::optional<MfaCredential> get_mfa(const std::string& user_id) = 0;
    virtual void put_mfa(const MfaCredential& credential) = 0;
    virtual void remove_mfa(const std::string& user_id) = 0;

    // ---- Organization settings ---------------------------------------------

    [[nodiscard]] virtual std::optional<OrgSecuritySettings> get_settings(
        const std::string& organization_id) = 0;
    virtual void put_settings(const OrgSecuritySettings& settings) = 0;

    // ---- Identity-side counts ----------------------------------------------

    [[nodiscard]] virtual UserSecuritySummary get_user_summary(const std::string& organization_id) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace secplane
