#include <catch2/catch_test_macros.hpp>
#include "tenant/settings_manager.hpp"
#include "mocks/flaky_store.hpp"
#include "mocks/recording_notifier.hpp"

using namespace secplane;
using namespace std::chrono_literals;

namespace {

struct SettingsHarness {
    std::shared_ptr<testing::FlakyStore> store = std::make_shared<testing::FlakyStore>();
    std::shared_ptr<TaskExecutor> executor = std::make_shared<TaskExecutor>(
        TaskExecutor::Config{.worker_count = 2, .call_timeout = 500ms});
    std::shared_ptr<AuditLogService> audit = std::make_shared<AuditLogService>(
        store, executor, std::make_shared<testing::RecordingNotifier>(),
        AuditLogService::Config{.write_timeout = 500ms});
    std::shared_ptr<SettingsManager> settings;

    explicit SettingsHarness(std::chrono::seconds ttl = 60s) {
        settings = std::make_shared<SettingsManager>(
            store, executor, audit,
            SettingsManager::Config{.ttl = ttl, .load_timeout = 500ms, .write_timeout = 500ms});
    }

    [[nodiscard]] std::vector<AuditEvent> events(AuditEventType type, const std::string& org = "org-a") {
        AuditFilter filter;
        filter.organization_id = org;
        filter.event_type = type;
        return store->inner().list_audit(filter);
    }

    void seed(const std::string& org, int threshold) {
        OrgSecuritySettings s;
        s.organization_id = org;
        s.threat_score_threshold = threshold;
        store->inner().put_settings(s);
    }
};

Caller admin(const std::string& org = "org-a") {
    return Caller{.user_id = "admin", .organization_id = org, .source_address = "10.0.0.9"};
}

OrgSecuritySettings with_threshold(const std::string& org, int threshold) {
    OrgSecuritySettings s;
    s.organization_id = org;
    s.threat_score_threshold = threshold;
    return s;
}

} // anonymous namespace

// ============================================================================
// Reads
// ============================================================================

TEST_CASE("SettingsManager: unknown organization gets defaults", "[settings]") {
    SettingsHarness h;
    const auto s = h.settings->get("org-new");
    CHECK(s.organization_id == "org-new");
    CHECK(s.threat_detection_enabled);
    CHECK(s.threat_score_threshold == 75);
    CHECK(s.failed_login_threshold == 5);
    CHECK(s.audit_logging_enabled);
    CHECK(s.audit_retention_days == 365);
    CHECK_FALSE(s.ip_allowlist_enabled);
    CHECK(h.settings->retention_days("org-new") == 365);
}

TEST_CASE("SettingsManager: stored values are cached until invalidated", "[settings]") {
    SettingsHarness h;
    h.seed("org-a", 40);
    CHECK(h.settings->get("org-a").threat_score_threshold == 40);

    h.seed("org-a", 55);
    CHECK(h.settings->get("org-a").threat_score_threshold == 40);

    h.settings->invalidate("org-a");
    CHECK(h.settings->get("org-a").threat_score_threshold == 55);
}

TEST_CASE("SettingsManager: outage serves last known or default values", "[settings]") {
    SettingsHarness h(0s);
    h.seed("org-a", 40);
    REQUIRE(h.settings->get("org-a").threat_score_threshold == 40);

    h.store->fail_reads = true;
    CHECK(h.settings->get("org-a").threat_score_threshold == 40);
    CHECK(h.settings->get("org-b").threat_score_threshold == 75);
}

TEST_CASE("SettingsManager: slow store falls back within the load timeout", "[settings]") {
    SettingsHarness h;
    h.settings = std::make_shared<SettingsManager>(
        h.store, h.executor, h.audit,
        SettingsManager::Config{.load_timeout = 50ms});
    h.seed("org-a", 40);
    h.store->delay_ms = 300;

    const auto start = std::chrono::steady_clock::now();
    const auto s = h.settings->get("org-a");
    CHECK(std::chrono::steady_clock::now() - start < 250ms);
    CHECK(s.threat_score_threshold == 75);
}

TEST_CASE("SettingsManager: strict load reports storage errors", "[settings]") {
    SettingsHarness h;
    h.seed("org-a", 40);
    auto loaded = h.settings->load(admin());
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().threat_score_threshold == 40);

    h.store->fail_reads = true;
    CHECK(h.settings->load(admin()).error_category() == ErrorCategory::PERSISTENCE_UNAVAILABLE);
    CHECK(h.settings->load(Caller{.user_id = "admin"}).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
}

// ============================================================================
// Updates
// ============================================================================

TEST_CASE("SettingsManager: update persists, caches and audits", "[settings]") {
    SettingsHarness h;
    REQUIRE(h.settings->get("org-a").threat_score_threshold == 75);

    auto updated = h.settings->update(admin(), with_threshold("org-a", 50));
    REQUIRE(updated.is_ok());
    CHECK(updated.value().threat_score_threshold == 50);

    const auto stored = h.store->inner().get_settings("org-a");
    REQUIRE(stored.has_value());
    CHECK(stored->threat_score_threshold == 50);
    CHECK(h.settings->get("org-a").threat_score_threshold == 50);

    const auto changed = h.events(AuditEventType::SETTINGS_CHANGED);
    REQUIRE(changed.size() == 1);
    CHECK(changed[0].actor_user_id == "admin");
    CHECK(changed[0].resource_id == "org-a");
    REQUIRE(changed[0].changes.has_value());
    auto changes = *changed[0].changes;
    CHECK(changes["before"]["threat_score_threshold"].get<double>() == 75.0);
    CHECK(changes["after"]["threat_score_threshold"].get<double>() == 50.0);

    CHECK(h.events(AuditEventType::RETENTION_CHANGED).empty());
}

TEST_CASE("SettingsManager: retention change is audited separately", "[settings]") {
    SettingsHarness h;
    auto updated = h.settings->set_retention_days(admin(), 30);
    REQUIRE(updated.is_ok());
    CHECK(h.settings->retention_days("org-a") == 30);

    CHECK(h.events(AuditEventType::SETTINGS_CHANGED).size() == 1);
    const auto retention = h.events(AuditEventType::RETENTION_CHANGED);
    REQUIRE(retention.size() == 1);
    auto meta = retention[0].metadata;
    CHECK(meta["previous_days"].get<double>() == 365.0);
    CHECK(meta["new_days"].get<double>() == 30.0);
}

TEST_CASE("SettingsManager: invalid settings are rejected", "[settings]") {
    SettingsHarness h;
    CHECK(h.settings->update(admin(), with_threshold("org-a", 0)).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
    CHECK(h.settings->set_retention_days(admin(), 0).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
    CHECK_FALSE(h.store->inner().get_settings("org-a").has_value());
    CHECK(h.events(AuditEventType::SETTINGS_CHANGED).empty());
}

TEST_CASE("SettingsManager: validate reports the first invalid field", "[settings]") {
    auto s = with_threshold("org-a", 75);
    CHECK(SettingsManager::validate(s).empty());

    s.organization_id.clear();
    CHECK(SettingsManager::validate(s) == "organization_id is required");

    s = with_threshold("org-a", 1001);
    CHECK_FALSE(SettingsManager::validate(s).empty());

    s = with_threshold("org-a", 75);
    s.allowed_addresses = {"10.0.0.0/8", "bogus"};
    CHECK(SettingsManager::validate(s).find("bogus") != std::string::npos);

    s = with_threshold("org-a", 75);
    s.audit_retention_days = 4000;
    CHECK_FALSE(SettingsManager::validate(s).empty());
}

TEST_CASE("SettingsManager: cross-organization update is denied and audited", "[settings]") {
    SettingsHarness h;
    auto denied = h.settings->update(admin("org-a"), with_threshold("org-b", 10));
    CHECK(denied.is_error());
    CHECK(denied.error_category() == ErrorCategory::AUTHORIZATION_FAILURE);
    CHECK_FALSE(h.store->inner().get_settings("org-b").has_value());

    const auto access = h.events(AuditEventType::ACCESS_DENIED, "org-a");
    REQUIRE(access.size() == 1);
    CHECK(access[0].severity == Severity::HIGH);
    CHECK(h.events(AuditEventType::ACCESS_DENIED, "org-b").empty());
}

TEST_CASE("SettingsManager: storage failure leaves the cache untouched", "[settings]") {
    SettingsHarness h;
    h.seed("org-a", 40);
    REQUIRE(h.settings->get("org-a").threat_score_threshold == 40);

    h.store->fail_all = true;
    auto updated = h.settings->update(admin(), with_threshold("org-a", 90));
    CHECK(updated.error_category() == ErrorCategory::PERSISTENCE_UNAVAILABLE);
    h.store->fail_all = false;

    CHECK(h.settings->get("org-a").threat_score_threshold == 40);
    CHECK(h.events(AuditEventType::SETTINGS_CHANGED).empty());
}

// ============================================================================
// Allowlist administration
// ============================================================================

TEST_CASE("SettingsManager: allowlist entries are added once", "[settings][ip_allowlist]") {
    SettingsHarness h;
    REQUIRE(h.settings->add_allowed_address(admin(), " 10.0.0.0/8 ").is_ok());
    auto again = h.settings->add_allowed_address(admin(), "10.0.0.0/8");
    REQUIRE(again.is_ok());
    CHECK(again.value().allowed_addresses == std::vector<std::string>{"10.0.0.0/8"});

    CHECK(h.settings->add_allowed_address(admin(), "10.0.0.0/40").error_category() ==
          ErrorCategory::VALIDATION_ERROR);
}

TEST_CASE("SettingsManager: removing a missing entry is NOT_FOUND", "[settings][ip_allowlist]") {
    SettingsHarness h;
    REQUIRE(h.settings->add_allowed_address(admin(), "192.168.1.100").is_ok());

    CHECK(h.settings->remove_allowed_address(admin(), "192.168.1.101").error_category() ==
          ErrorCategory::NOT_FOUND);

    auto removed = h.settings->remove_allowed_address(admin(), "192.168.1.100");
    REQUIRE(removed.is_ok());
    CHECK(removed.value().allowed_addresses.empty());
}

TEST_CASE("SettingsManager: allowlist can be toggled", "[settings][ip_allowlist]") {
    SettingsHarness h;
    REQUIRE(h.settings->set_allowlist_enabled(admin(), true).is_ok());
    CHECK(h.settings->get("org-a").ip_allowlist_enabled);
    REQUIRE(h.settings->set_allowlist_enabled(admin(), false).is_ok());
    CHECK_FALSE(h.settings->get("org-a").ip_allowlist_enabled);
    CHECK(h.events(AuditEventType::SETTINGS_CHANGED).size() == 2);
}

TEST_CASE("SettingsManager: JSON view", "[settings]") {
    auto s = with_threshold("org-a", 60);
    s.allowed_addresses = {"10.0.0.0/8"};
    auto j = SettingsManager::to_json(s);
    CHECK(j["organization_id"].get<std::string>() == "org-a");
    CHECK(j["threat_score_threshold"].get<double>() == 60.0);
    CHECK(j["threat_detection_enabled"].get<bool>());
    CHECK(j["allowed_addresses"].get<glz::json_t::array_t>().size() == 1);
}
