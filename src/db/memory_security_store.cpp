#include "db/memory_security_store.hpp"

#include <algorithm>
#include <set>

namespace secplane {

// ============================================================================
// Blocked addresses
// ============================================================================

void InMemorySecurityStore::upsert_blocked(const BlockedAddress& row) {
    std::lock_guard lock(blocked_mutex_);
    blocked_.insert_or_assign(row.address, row);
}

bool InMemorySecurityStore::remove_blocked(const std::string& address) {
    std::lock_guard lock(blocked_mutex_);
    return blocked_.erase(address) > 0;
}

bool InMemorySecurityStore::remove_expired_blocked(const std::string& address, TimePoint now) {
    std::lock_guard lock(blocked_mutex_);
    const auto it = blocked_.find(address);
    if (it == blocked_.end() || !it->second.is_expired(now)) return false;
    blocked_.erase(it);
    return true;
}

std::vector<BlockedAddress> InMemorySecurityStore::load_active_blocked(TimePoint now) {
    std::lock_guard lock(blocked_mutex_);
    std::vector<BlockedAddress> result;
    result.reserve(blocked_.size());
    for (const auto& [address, row] : blocked_) {
        if (!row.is_expired(now)) {
            result.push_back(row);
        }
    }
    return result;
}

std::vector<std::string> InMemorySecurityStore::list_expired_blocked(TimePoint now) {
    std::lock_guard lock(blocked_mutex_);
    std::vector<std::string> result;
    for (const auto& [address, row] : blocked_) {
        if (row.is_expired(now)) {
            result.push_back(address);
        }
    }
    return result;
}

// ============================================================================
// Audit events
// ============================================================================

void InMemorySecurityStore::insert_audit(const AuditEvent& event) {
    std::lock_guard lock(audit_mutex_);
    auto& rows = audit_[event.organization_id];
    // Keep sequence order even when concurrent writers land out of order
    const auto pos = std::upper_bound(rows.begin(), rows.end(), event.sequence_num,
        [](uint64_t seq, const AuditEvent& e) { return seq < e.sequence_num; });
    rows.insert(pos, event);
}

AuditPage InMemorySecurityStore::query_audit(const AuditFilter& filter,
                                             const Pagination& pagination) {
    auto matching = list_audit(filter);

    std::stable_sort(matching.begin(), matching.end(),
        [](const AuditEvent& a, const AuditEvent& b) {
            if (a.created_at != b.created_at) return a.created_at > b.created_at;
            return a.sequence_num > b.sequence_num;
        });

    AuditPage page;
    page.total = matching.size();
    page.page = pagination.page;
    page.limit = pagination.limit;

    const size_t offset = pagination.offset();
    if (offset < matching.size()) {
        const size_t end = std::min(matching.size(), offset + pagination.limit);
        page.events.assign(std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(offset)),
                           std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return page;
}

std::vector<AuditEvent> InMemorySecurityStore::list_audit(const AuditFilter& filter) {
    std::lock_guard lock(audit_mutex_);
    std::vector<AuditEvent> result;
    const auto it = audit_.find(filter.organization_id);
    if (it == audit_.end()) return result;

    for (const auto& event : it->second) {
        if (filter.matches(event)) {
            result.push_back(event);
        }
    }
    return result;
}

std::optional<AuditEvent> InMemorySecurityStore::last_audit(const std::string& organization_id) {
    std::lock_guard lock(audit_mutex_);
    const auto it = audit_.find(organization_id);
    if (it == audit_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

uint64_t InMemorySecurityStore::delete_audit_before(const std::string& organization_id,
                                                    TimePoint cutoff) {
    std::lock_guard lock(audit_mutex_);
    const auto it = audit_.find(organization_id);
    if (it == audit_.end()) return 0;

    auto& rows = it->second;
    const auto removed = std::erase_if(rows, [cutoff](const AuditEvent& e) {
        return e.created_at < cutoff;
    });
    return static_cast<uint64_t>(removed);
}

std::vector<std::string> InMemorySecurityStore::list_organizations() {
    std::set<std::string> orgs;
    {
        std::lock_guard lock(audit_mutex_);
        for (const auto& [org, _] : audit_) orgs.insert(org);
    }
    {
        std::lock_guard lock(settings_mutex_);
        for (const auto& [org, _] : settings_) orgs.insert(org);
    }
    return {orgs.begin(), orgs.end()};
}

size_t InMemorySecurityStore::audit_row_count() const {
    std::lock_guard lock(audit_mutex_);
    size_t count = 0;
    for (const auto& [org, rows] : audit_) count += rows.size();
    return count;
}

// ============================================================================
// MFA credentials
// ============================================================================

std::optional<MfaCredential> InMemorySecurityStore::get_mfa(const std::string& user_id) {
    std::lock_guard lock(mfa_mutex_);
    const auto it = mfa_.find(user_id);
    if (it == mfa_.end()) return std::nullopt;
    return it->second;
}

void InMemorySecurityStore::put_mfa(const MfaCredential& credential) {
    std::lock_guard lock(mfa_mutex_);
    mfa_.insert_or_assign(credential.user_id, credential);
}

void InMemorySecurityStore::remove_mfa(const std::string& user_id) {
    std::lock_guard lock(mfa_mutex_);
    mfa_.erase(user_id);
}

// ============================================================================
// Settings and identity-side counts
// ============================================================================

std::optional<OrgSecuritySettings> InMemorySecurityStore::get_settings(
    const std::string& organization_id) {
    std::lock_guard lock(settings_mutex_);
    const auto it = settings_.find(organization_id);
    if (it == settings_.end()) return std::nullopt;
    return it->second;
}

void InMemorySecurityStore::put_settings(const OrgSecuritySettings& settings) {
    std::lock_guard lock(settings_mutex_);
    settings_.insert_or_assign(settings.organization_id, settings);
}

void InMemorySecurityStore::register_user(const std::string& organization_id,
                                          const std::string& user_id) {
    std::lock_guard lock(users_mutex_);
    users_[organization_id].insert(user_id);
}

void InMemorySecurityStore::set_session_counts(const std::string& organization_id,
                                               uint64_t active_sessions,
                                               uint64_t stale_sessions) {
    std::lock_guard lock(users_mutex_);
    sessions_[organization_id] = SessionCounts{active_sessions, stale_sessions};
}

UserSecuritySummary InMemorySecurityStore::get_user_summary(const std::string& organization_id) {
    UserSecuritySummary summary;
    std::unordered_set<std::string> members;
    {
        std::lock_guard lock(users_mutex_);
        if (const auto it = users_.find(organization_id); it != users_.end()) {
            members = it->second;
        }
        if (const auto it = sessions_.find(organization_id); it != sessions_.end()) {
            summary.active_sessions = it->second.active;
            summary.stale_sessions = it->second.stale;
        }
    }
    summary.total_users = members.size();

    std::lock_guard lock(mfa_mutex_);
    for (const auto& [user_id, credential] : mfa_) {
        if (credential.organization_id == organization_id &&
            credential.state() == MfaState::ENABLED &&
            members.contains(user_id)) {
            ++summary.mfa_enabled_users;
        }
    }
    return summary;
}

} // namespace secplane
