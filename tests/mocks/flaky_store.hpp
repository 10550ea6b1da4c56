#pragma once

#include "core/error.hpp"
#include "db/memory_security_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace secplane::testing {

/**
 * @brief InMemorySecurityStore wrapper that can go down or slow down
 *
 * fail_* switches make the matching calls throw
 * SecurityError(PERSISTENCE_UNAVAILABLE); delay applies to every call.
 */
class FlakyStore : public ISecurityStore {
public:
    FlakyStore() : inner_(std::make_shared<InMemorySecurityStore>()) {}

    std::atomic<bool> fail_all{false};
    std::atomic<bool> fail_audit_writes{false};
    std::atomic<bool> fail_blocked_writes{false};
    std::atomic<bool> fail_reads{false};
    std::atomic<int> delay_ms{0};

    /// Runs just before an expired row is deleted; lets a test interleave a write
    std::function<void(const std::string& address)> before_expired_removal;

    [[nodiscard]] InMemorySecurityStore& inner() { return *inner_; }

    [[nodiscard]] uint64_t call_count() const {
        return calls_.load(std::memory_order_relaxed);
    }

    void upsert_blocked(const BlockedAddress& row) override {
        enter(fail_blocked_writes);
        inner_->upsert_blocked(row);
    }

    bool remove_blocked(const std::string& address) override {
        enter(fail_blocked_writes);
        return inner_->remove_blocked(address);
    }

    bool remove_expired_blocked(const std::string& address, TimePoint now) override {
        enter(fail_blocked_writes);
        if (before_expired_removal) before_expired_removal(address);
        return inner_->remove_expired_blocked(address, now);
    }

    [[nodiscard]] std::vector<BlockedAddress> load_active_blocked(TimePoint now) override {
        enter(fail_reads);
        return inner_->load_active_blocked(now);
    }

    [[nodiscard]] std::vector<std::string> list_expired_blocked(TimePoint now) override {
        enter(fail_reads);
        return inner_->list_expired_blocked(now);
    }

    void insert_audit(const AuditEvent& event) override {
        enter(fail_audit_writes);
        inner_->insert_audit(event);
    }

    [[nodiscard]] AuditPage query_audit(const AuditFilter& filter,
                                        const Pagination& pagination) override {
        enter(fail_reads);
        return inner_->query_audit(filter, pagination);
    }

    [[nodiscard]] std::vector<AuditEvent> list_audit(const AuditFilter& filter) override {
        enter(fail_reads);
        return inner_->list_audit(filter);
    }

    [[nodiscard]] std::optional<AuditEvent> last_audit(const std::string& organization_id) override {
        enter(fail_reads);
        return inner_->last_audit(organization_id);
    }

    uint64_t delete_audit_before(const std::string& organization_id, TimePoint cutoff) override {
        enter(fail_audit_writes);
        return inner_->delete_audit_before(organization_id, cutoff);
    }

    [[nodiscard]] std::vector<std::string> list_organizations() override {
        enter(fail_reads);
        return inner_->list_organizations();
    }

    [[nodiscard]] std::optional<MfaCredential> get_mfa(const std::string& user_id) override {
        enter(fail_reads);
        return inner_->get_mfa(user_id);
    }

    void put_mfa(const MfaCredential& credential) override {
        enter(fail_all);
        inner_->put_mfa(credential);
    }

    void remove_mfa(const std::string& user_id) override {
        enter(fail_all);
        inner_->remove_mfa(user_id);
    }

    [[nodiscard]] std::optional<OrgSecuritySettings> get_settings(
        const std::string& organization_id) override {
        enter(fail_reads);
        return inner_->get_settings(organization_id);
    }

    void put_settings(const OrgSecuritySettings& settings) override {
        enter(fail_all);
        inner_->put_settings(settings);
    }

    [[nodiscard]] UserSecuritySummary get_user_summary(const std::string& organization_id) override {
        enter(fail_reads);
        return inner_->get_user_summary(organization_id);
    }

    [[nodiscard]] std::string name() const override { return "flaky"; }

private:
    void enter(const std::atomic<bool>& specific) {
        calls_.fetch_add(1, std::memory_order_relaxed);
        if (const int d = delay_ms.load(); d > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(d));
        }
        if (fail_all.load() || specific.load()) {
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE, "store unavailable");
        }
    }

    std::shared_ptr<InMemorySecurityStore> inner_;
    std::atomic<uint64_t> calls_{0};
};

} // namespace secplane::testing
