#include <catch2/catch_test_macros.hpp>
#include "core/security_control_plane.hpp"
#include "core/utils.hpp"
#include "db/memory_security_store.hpp"
#include "security/derived_key_manager.hpp"
#include "mocks/recording_notifier.hpp"

using namespace secplane;
using namespace std::chrono_literals;

namespace {

struct PlaneHarness {
    std::shared_ptr<InMemorySecurityStore> store = std::make_shared<InMemorySecurityStore>();
    std::shared_ptr<testing::RecordingNotifier> notifier = std::make_shared<testing::RecordingNotifier>();
    std::unique_ptr<SecurityControlPlane> plane;

    explicit PlaneHarness(SecPlaneConfig config = {}) {
        config.storage.call_timeout_ms = 500;
        config.storage.worker_count = 2;
        plane = std::make_unique<SecurityControlPlane>(
            config, store, std::make_shared<DerivedKeyManager>("plane-test-master-secret"), notifier);
    }

    [[nodiscard]] size_t events(AuditEventType type, const std::string& org = "org-a") {
        AuditFilter filter;
        filter.organization_id = org;
        filter.event_type = type;
        return store->list_audit(filter).size();
    }
};

Caller admin() {
    return Caller{.user_id = "admin", .organization_id = "org-a", .source_address = "10.0.0.9"};
}

RequestContext request(const std::string& address, const std::string& body = {}) {
    RequestContext ctx;
    ctx.user_id = "alice";
    ctx.organization_id = "org-a";
    ctx.source_address = address;
    ctx.user_agent = "Mozilla/5.0 (Macintosh; Intel Mac OS X 14_0)";
    ctx.path = "/api/reports";
    ctx.body = body;
    return ctx;
}

} // anonymous namespace

// ============================================================================
// Construction and factories
// ============================================================================

TEST_CASE("SecurityControlPlane: store is required", "[control_plane]") {
    CHECK_THROWS_AS(SecurityControlPlane(SecPlaneConfig{}, nullptr,
                                         std::make_shared<DerivedKeyManager>("plane-test-master-secret"),
                                         std::make_shared<LogAlertNotifier>()),
                    SecurityError);
}

TEST_CASE("SecurityControlPlane: store factory", "[control_plane]") {
    StorageConfig memory;
    memory.backend = "memory";
    auto store = SecurityControlPlane::make_store(memory);
    REQUIRE(store);
    CHECK(store->name() == "memory");

    StorageConfig unknown;
    unknown.backend = "oracle";
    CHECK_THROWS_AS(SecurityControlPlane::make_store(unknown), SecurityError);
}

TEST_CASE("SecurityControlPlane: notifier factory", "[control_plane]") {
    AuditConfig plain;
    CHECK(dynamic_cast<LogAlertNotifier*>(SecurityControlPlane::make_notifier(plain).get()) != nullptr);

    AuditConfig webhook;
    webhook.webhook_enabled = true;
    webhook.webhook_url = "http://127.0.0.1:9/alerts";
    CHECK(dynamic_cast<WebhookAlertNotifier*>(SecurityControlPlane::make_notifier(webhook).get()) != nullptr);
}

// ============================================================================
// Request path
// ============================================================================

TEST_CASE("SecurityControlPlane: clean request is allowed", "[control_plane]") {
    PlaneHarness h;
    const auto d = h.plane->evaluate_request(request("10.0.0.1"));
    CHECK(d.allow);
    CHECK(d.score == 0);
    CHECK(h.plane->threat_stats().evaluated == 1);
}

TEST_CASE("SecurityControlPlane: block, reject, unblock", "[control_plane]") {
    PlaneHarness h;
    auto lowered = OrgSecuritySettings{};
    lowered.organization_id = "org-a";
    lowered.threat_score_threshold = 50;
    REQUIRE(h.plane->update_settings(admin(), lowered).is_ok());

    const auto attack = h.plane->evaluate_request(request("203.0.113.50", "id=1' OR '1'='1"));
    CHECK_FALSE(attack.allow);
    CHECK(attack.score >= 50);
    CHECK(h.events(AuditEventType::IP_BLOCKED) == 1);
    CHECK(h.notifier->count() == 1);

    const auto blocked = h.plane->list_blocked();
    REQUIRE(blocked.size() == 1);
    CHECK(blocked[0].address == "203.0.113.50");
    CHECK(blocked[0].automatic);

    const auto follow_up = h.plane->evaluate_request(request("203.0.113.50"));
    CHECK_FALSE(follow_up.allow);
    CHECK(follow_up.display_score() == 100);

    auto unblocked = h.plane->unblock_address(admin(), "203.0.113.50");
    REQUIRE(unblocked.is_ok());
    CHECK(unblocked.value());
    CHECK(h.plane->evaluate_request(request("203.0.113.50")).allow);
}

TEST_CASE("SecurityControlPlane: manual block with TTL", "[control_plane]") {
    PlaneHarness h;
    auto blocked = h.plane->block_address(admin(), " 198.51.100.20 ", "", 1h);
    REQUIRE(blocked.is_ok());
    CHECK(blocked.value().address == "198.51.100.20");
    CHECK(blocked.value().reason == "blocked by administrator");
    CHECK(blocked.value().blocked_by == "admin");
    REQUIRE(blocked.value().expires_at.has_value());

    CHECK_FALSE(h.plane->evaluate_request(request("198.51.100.20")).allow);
    CHECK(h.plane->block_address(Caller{.user_id = "admin"}, "198.51.100.21", "x").error_category() ==
          ErrorCategory::VALIDATION_ERROR);
}

TEST_CASE("SecurityControlPlane: allowlist check", "[control_plane][ip_allowlist]") {
    PlaneHarness h;
    CHECK(h.plane->is_address_allowed("org-a", "8.8.8.8"));

    REQUIRE(h.plane->add_allowed_address(admin(), "10.0.0.0/8").is_ok());
    REQUIRE(h.plane->set_allowlist_enabled(admin(), true).is_ok());

    CHECK(h.plane->is_address_allowed("org-a", "10.20.30.40"));
    CHECK_FALSE(h.plane->is_address_allowed("org-a", "8.8.8.8"));
    CHECK(h.plane->is_address_allowed("org-a", "127.0.0.1"));
    CHECK(h.plane->is_address_allowed("org-b", "8.8.8.8"));
    CHECK(h.plane->is_address_allowed("", "8.8.8.8"));

    REQUIRE(h.plane->remove_allowed_address(admin(), "10.0.0.0/8").is_ok());
    CHECK_FALSE(h.plane->is_address_allowed("org-a", "10.20.30.40"));
}

// ============================================================================
// Audit
// ============================================================================

TEST_CASE("SecurityControlPlane: data access follows audit_logging_enabled", "[control_plane][audit]") {
    PlaneHarness h;
    REQUIRE(h.plane->record_data_access("org-a", "alice", AuditEventType::DATA_VIEWED,
                                        "document", "doc-1", "10.0.0.1").is_ok());
    CHECK(h.events(AuditEventType::DATA_VIEWED) == 1);

    auto off = OrgSecuritySettings{};
    off.organization_id = "org-a";
    off.audit_logging_enabled = false;
    REQUIRE(h.plane->update_settings(admin(), off).is_ok());

    REQUIRE(h.plane->record_data_access("org-a", "alice", AuditEventType::DATA_VIEWED,
                                        "document", "doc-2", "10.0.0.1").is_ok());
    CHECK(h.events(AuditEventType::DATA_VIEWED) == 1);
}

TEST_CASE("SecurityControlPlane: query and verify the audit trail", "[control_plane][audit]") {
    PlaneHarness h;
    REQUIRE(h.plane->record_auth_event("org-a", std::string("alice"), AuditEventType::LOGIN, true,
                                       "10.0.0.1", "Mozilla/5.0").is_ok());
    REQUIRE(h.plane->record_auth_event("org-a", std::string("alice"), AuditEventType::LOGIN_FAILED,
                                       false, "10.0.0.1", "Mozilla/5.0").is_ok());

    AuditFilter filter;
    filter.organization_id = "org-a";
    auto page = h.plane->query_audit_events(admin(), filter, Pagination{});
    REQUIRE(page.is_ok());
    CHECK(page.value().total == 2);
    CHECK(page.value().events[0].event_type == AuditEventType::LOGIN_FAILED);

    auto verified = h.plane->verify_audit_chain(admin());
    REQUIRE(verified.is_ok());
    CHECK(verified.value().intact);
    CHECK(verified.value().events_checked == 2);

    CHECK(h.plane->verify_audit_chain(Caller{.user_id = "admin"}).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
}

TEST_CASE("SecurityControlPlane: purge follows organization retention", "[control_plane][audit]") {
    PlaneHarness h;
    AuditEvent old;
    old.event_id = "old-1";
    old.organization_id = "org-a";
    old.event_type = AuditEventType::DATA_VIEWED;
    old.action = "viewed";
    old.created_at = utils::now() - std::chrono::hours(24 * 40);
    h.store->insert_audit(old);

    auto kept = h.plane->purge_audit();
    REQUIRE(kept.is_ok());
    CHECK(kept.value() == 0);

    REQUIRE(h.plane->set_retention_days(admin(), 30).is_ok());
    auto purged = h.plane->purge_audit();
    REQUIRE(purged.is_ok());
    CHECK(purged.value() == 1);
    CHECK(h.events(AuditEventType::DATA_VIEWED) == 0);
}

// ============================================================================
// MFA and monitoring through the facade
// ============================================================================

TEST_CASE("SecurityControlPlane: MFA setup and status", "[control_plane][mfa]") {
    PlaneHarness h;
    const Caller alice{.user_id = "alice", .organization_id = "org-a", .source_address = "10.0.0.1"};

    auto setup = h.plane->setup_mfa(alice);
    REQUIRE(setup.is_ok());
    CHECK(h.plane->mfa_status(alice).value().state == MfaState::PENDING_SETUP);

    const auto code = Totp::code_at(setup.value().secret, utils::now(), Totp::Config{});
    auto verified = h.plane->verify_mfa(alice, code);
    REQUIRE(verified.is_ok());
    CHECK(verified.value());
    CHECK(h.plane->mfa_status(alice).value().state == MfaState::ENABLED);

    REQUIRE(h.plane->disable_mfa(alice).is_ok());
    CHECK(h.plane->mfa_status(alice).value().state == MfaState::UNSET);
}

TEST_CASE("SecurityControlPlane: dashboard sees evaluated traffic", "[control_plane][monitor]") {
    PlaneHarness h;
    h.store->register_user("org-a", "alice");
    REQUIRE(h.plane->record_auth_event("org-a", std::string("alice"), AuditEventType::LOGIN_FAILED,
                                       false, "10.0.0.1", "Mozilla/5.0").is_ok());
    REQUIRE(h.plane->block_address(admin(), "203.0.113.1", "manual").is_ok());

    auto dashboard = h.plane->get_dashboard(admin(), "org-a", Timeframe::DAY);
    REQUIRE(dashboard.is_ok());
    CHECK(dashboard.value().failed_logins == 1);
    CHECK(dashboard.value().blocked_addresses == 1);
    CHECK(dashboard.value().total_users == 1);

    CHECK(h.plane->get_dashboard(admin(), "org-b", Timeframe::DAY).error_category() ==
          ErrorCategory::AUTHORIZATION_FAILURE);
}

TEST_CASE("SecurityControlPlane: automatic blocks count as suspicious activity", "[control_plane][monitor]") {
    PlaneHarness h;

    // 50 signature + 15 user agent + 10 spoofing header reaches the default threshold
    auto attack = request("203.0.113.77", "name=x' OR '1'='1");
    attack.user_agent.clear();
    attack.headers["x-forwarded-host"] = "evil.example";
    REQUIRE_FALSE(h.plane->evaluate_request(attack).allow);

    // Signature alone stays in the suspicious band
    REQUIRE(h.plane->evaluate_request(request("10.0.0.2", "name=x' OR '1'='1")).allow);

    // Manual blocks are administration, not detection
    REQUIRE(h.plane->block_address(admin(), "198.51.100.3", "manual").is_ok());

    auto dashboard = h.plane->get_dashboard(admin(), "org-a", Timeframe::DAY);
    REQUIRE(dashboard.is_ok());
    CHECK(dashboard.value().suspicious_activity == 2);
    CHECK(dashboard.value().blocked_addresses == 2);
    REQUIRE_FALSE(dashboard.value().recent_critical.empty());
    CHECK(dashboard.value().recent_critical.front().event_type == AuditEventType::IP_BLOCKED);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("SecurityControlPlane: start hydrates persisted blocks", "[control_plane]") {
    PlaneHarness h;
    BlockedAddress row;
    row.address = "192.0.2.77";
    row.reason = "persisted";
    row.blocked_at = utils::now() - 1h;
    h.store->upsert_blocked(row);

    CHECK(h.plane->evaluate_request(request("192.0.2.77")).allow);

    h.plane->start();
    CHECK_FALSE(h.plane->evaluate_request(request("192.0.2.77")).allow);

    h.plane->stop();
    h.plane->stop();
}
