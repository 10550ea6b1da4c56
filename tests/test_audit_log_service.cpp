#include <catch2/catch_test_macros.hpp>
#include "audit/audit_log_service.hpp"
#include "core/utils.hpp"
#include "mocks/flaky_store.hpp"
#include "mocks/recording_notifier.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace secplane;
using namespace std::chrono_literals;

namespace {

struct AuditHarness {
    std::shared_ptr<testing::FlakyStore> store = std::make_shared<testing::FlakyStore>();
    std::shared_ptr<TaskExecutor> executor = std::make_shared<TaskExecutor>(
        TaskExecutor::Config{.worker_count = 2, .call_timeout = 500ms});
    std::shared_ptr<testing::RecordingNotifier> notifier = std::make_shared<testing::RecordingNotifier>();
    std::shared_ptr<AuditLogService> audit;

    explicit AuditHarness(AuditLogService::Config cfg = {.write_timeout = 500ms, .alert_timeout = 500ms}) {
        audit = std::make_shared<AuditLogService>(store, executor, notifier, cfg);
    }
};

AuditEvent make_event(const std::string& org, AuditEventType type = AuditEventType::DATA_VIEWED,
                      Severity severity = Severity::LOW) {
    AuditEvent e;
    e.organization_id = org;
    e.actor_user_id = "user-1";
    e.event_type = type;
    e.severity = severity;
    e.resource_type = "document";
    e.resource_id = "doc-1";
    e.action = "viewed document";
    e.source_address = "10.0.0.5";
    return e;
}

Caller caller_in(const std::string& org) {
    return Caller{.user_id = "admin", .organization_id = org, .source_address = "10.0.0.9"};
}

} // anonymous namespace

// ============================================================================
// Recording and hash chain
// ============================================================================

TEST_CASE("AuditLog: record stamps id, time and chain", "[audit]") {
    AuditHarness h;
    auto first = h.audit->record(make_event("org-a"));
    REQUIRE(first.is_ok());
    CHECK(first.value().event_id.size() == 36);
    CHECK(first.value().created_at != TimePoint{});
    CHECK(first.value().sequence_num == 1);
    CHECK(first.value().previous_hash.empty());
    CHECK(first.value().record_hash.size() == 64);
    CHECK(first.value().metadata.is_object());

    auto second = h.audit->record(make_event("org-a"));
    REQUIRE(second.is_ok());
    CHECK(second.value().sequence_num == 2);
    CHECK(second.value().previous_hash == first.value().record_hash);
    CHECK(second.value().event_id != first.value().event_id);
    CHECK(h.store->inner().audit_row_count() == 2);
}

TEST_CASE("AuditLog: chains are per organization", "[audit]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    auto other = h.audit->record(make_event("org-b"));
    REQUIRE(other.is_ok());
    CHECK(other.value().sequence_num == 1);
    CHECK(other.value().previous_hash.empty());
}

TEST_CASE("AuditLog: chain continues from persisted head after restart", "[audit]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    auto last = h.audit->record(make_event("org-a"));
    REQUIRE(last.is_ok());

    AuditLogService restarted(h.store, h.executor, h.notifier, {.write_timeout = 500ms});
    auto next = restarted.record(make_event("org-a"));
    REQUIRE(next.is_ok());
    CHECK(next.value().sequence_num == 3);
    CHECK(next.value().previous_hash == last.value().record_hash);
}

TEST_CASE("AuditLog: event without organization is rejected", "[audit]") {
    AuditHarness h;
    auto result = h.audit->record(make_event(""));
    CHECK(result.is_error());
    CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(h.store->inner().audit_row_count() == 0);
}

TEST_CASE("AuditLog: record hash covers event content", "[audit]") {
    AuditHarness h;
    auto recorded = h.audit->record(make_event("org-a"));
    REQUIRE(recorded.is_ok());

    AuditEvent copy = recorded.value();
    CHECK(AuditLogService::compute_record_hash(copy) == copy.record_hash);
    copy.action = "edited document";
    CHECK(AuditLogService::compute_record_hash(copy) != recorded.value().record_hash);
}

// ============================================================================
// Convenience recorders
// ============================================================================

TEST_CASE("AuditLog: auth events are LOW on success and MEDIUM on failure", "[audit]") {
    AuditHarness h;
    auto ok = h.audit->record_auth_event("org-a", std::string("alice"), AuditEventType::LOGIN,
                                         true, "10.0.0.1", "Mozilla/5.0");
    auto failed = h.audit->record_auth_event("org-a", std::string("alice"),
                                             AuditEventType::LOGIN_FAILED, false,
                                             "10.0.0.1", "Mozilla/5.0");
    REQUIRE(ok.is_ok());
    REQUIRE(failed.is_ok());
    CHECK(ok.value().severity == Severity::LOW);
    CHECK(failed.value().severity == Severity::MEDIUM);
    CHECK(failed.value().resource_type == "user");
    CHECK(failed.value().user_agent == "Mozilla/5.0");
}

TEST_CASE("AuditLog: data deletes are HIGH", "[audit]") {
    AuditHarness h;
    glz::json_t changes;
    changes["before"]["title"] = std::string("Q3 plan");

    auto deleted = h.audit->record_data_access("org-a", "alice", AuditEventType::DATA_DELETED,
                                               "document", "doc-7", "10.0.0.1", changes);
    auto viewed = h.audit->record_data_access("org-a", "alice", AuditEventType::DATA_VIEWED,
                                              "document", "doc-7", "10.0.0.1");
    REQUIRE(deleted.is_ok());
    REQUIRE(viewed.is_ok());
    CHECK(deleted.value().severity == Severity::HIGH);
    CHECK(deleted.value().changes.has_value());
    CHECK(viewed.value().severity == Severity::LOW);
    CHECK_FALSE(viewed.value().changes.has_value());
}

// ============================================================================
// Query
// ============================================================================

TEST_CASE("AuditLog: query returns newest first with pagination", "[audit]") {
    AuditHarness h;
    for (int i = 0; i < 7; ++i) {
        REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    }

    AuditFilter filter;
    filter.organization_id = "org-a";
    auto page1 = h.audit->query(caller_in("org-a"), filter, {.page = 1, .limit = 3});
    REQUIRE(page1.is_ok());
    CHECK(page1.value().total == 7);
    REQUIRE(page1.value().events.size() == 3);
    CHECK(page1.value().events[0].sequence_num == 7);
    CHECK(page1.value().events[2].sequence_num == 5);

    auto page3 = h.audit->query(caller_in("org-a"), filter, {.page = 3, .limit = 3});
    REQUIRE(page3.is_ok());
    REQUIRE(page3.value().events.size() == 1);
    CHECK(page3.value().events[0].sequence_num == 1);

    auto beyond = h.audit->query(caller_in("org-a"), filter, {.page = 9, .limit = 3});
    REQUIRE(beyond.is_ok());
    CHECK(beyond.value().events.empty());
    CHECK(beyond.value().total == 7);
}

TEST_CASE("AuditLog: query filters", "[audit]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a", AuditEventType::LOGIN_FAILED, Severity::MEDIUM)).is_ok());
    REQUIRE(h.audit->record(make_event("org-a", AuditEventType::LOGIN_FAILED, Severity::MEDIUM)).is_ok());
    REQUIRE(h.audit->record(make_event("org-a", AuditEventType::DATA_DELETED, Severity::HIGH)).is_ok());
    auto bob = make_event("org-a", AuditEventType::LOGIN);
    bob.actor_user_id = "bob";
    REQUIRE(h.audit->record(bob).is_ok());

    AuditFilter filter;
    filter.organization_id = "org-a";

    SECTION("by event type") {
        filter.event_type = AuditEventType::LOGIN_FAILED;
        auto page = h.audit->query(caller_in("org-a"), filter, {});
        REQUIRE(page.is_ok());
        CHECK(page.value().total == 2);
    }
    SECTION("by severity") {
        filter.severity = Severity::HIGH;
        auto page = h.audit->query(caller_in("org-a"), filter, {});
        REQUIRE(page.is_ok());
        REQUIRE(page.value().total == 1);
        CHECK(page.value().events[0].event_type == AuditEventType::DATA_DELETED);
    }
    SECTION("by actor") {
        filter.actor_user_id = "bob";
        auto page = h.audit->query(caller_in("org-a"), filter, {});
        REQUIRE(page.is_ok());
        CHECK(page.value().total == 1);
    }
    SECTION("by time range") {
        filter.start = utils::now() + 1h;
        auto page = h.audit->query(caller_in("org-a"), filter, {});
        REQUIRE(page.is_ok());
        CHECK(page.value().total == 0);
    }
}

TEST_CASE("AuditLog: query never crosses organizations", "[audit]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    REQUIRE(h.audit->record(make_event("org-b")).is_ok());

    AuditFilter own;
    own.organization_id = "org-a";
    auto page = h.audit->query(caller_in("org-a"), own, {});
    REQUIRE(page.is_ok());
    for (const auto& e : page.value().events) {
        CHECK(e.organization_id == "org-a");
    }

    AuditFilter foreign;
    foreign.organization_id = "org-b";
    auto rejected = h.audit->query(caller_in("org-a"), foreign, {});
    CHECK(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::AUTHORIZATION_FAILURE);

    // The attempt is recorded in the caller's own trail
    AuditFilter denied;
    denied.organization_id = "org-a";
    denied.event_type = AuditEventType::ACCESS_DENIED;
    auto trail = h.audit->query(caller_in("org-a"), denied, {});
    REQUIRE(trail.is_ok());
    REQUIRE(trail.value().total == 1);
    CHECK(trail.value().events[0].severity == Severity::HIGH);
}

TEST_CASE("AuditLog: query validates pagination and range", "[audit]") {
    AuditHarness h;
    AuditFilter filter;
    filter.organization_id = "org-a";
    const auto caller = caller_in("org-a");

    CHECK(h.audit->query(caller, filter, {.page = 0, .limit = 10}).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
    CHECK(h.audit->query(caller, filter, {.page = 1, .limit = 0}).error_category() ==
          ErrorCategory::VALIDATION_ERROR);
    CHECK(h.audit->query(caller, filter, {.page = 1, .limit = Pagination::kMaxLimit + 1}).error_category() ==
          ErrorCategory::VALIDATION_ERROR);

    filter.start = utils::now();
    filter.end = utils::now() - 1h;
    CHECK(h.audit->query(caller, filter, {}).error_category() == ErrorCategory::VALIDATION_ERROR);

    CHECK(h.audit->query(Caller{}, filter, {}).error_category() == ErrorCategory::VALIDATION_ERROR);
}

// ============================================================================
// Alerts
// ============================================================================

TEST_CASE("AuditLog: CRITICAL events are alerted", "[audit][alert]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a", AuditEventType::IP_BLOCKED, Severity::CRITICAL)).is_ok());
    REQUIRE(h.audit->record(make_event("org-a", AuditEventType::LOGIN_FAILED, Severity::HIGH)).is_ok());

    CHECK(h.notifier->count() == 1);
    CHECK(h.notifier->events()[0].event_type == AuditEventType::IP_BLOCKED);
    CHECK(h.audit->get_stats().alerts_sent == 1);
}

TEST_CASE("AuditLog: alert failure does not fail the write", "[audit][alert]") {
    AuditHarness h;
    h.notifier->set_succeed(false);

    auto result = h.audit->record(make_event("org-a", AuditEventType::IP_BLOCKED, Severity::CRITICAL));
    CHECK(result.is_ok());
    CHECK(h.store->inner().audit_row_count() == 1);
    CHECK(h.audit->get_stats().alert_failures == 1);
}

TEST_CASE("AuditLog: alert is attempted even when the write fails", "[audit][alert]") {
    AuditHarness h;
    h.store->fail_audit_writes = true;

    auto result = h.audit->record(make_event("org-a", AuditEventType::IP_BLOCKED, Severity::CRITICAL));
    CHECK(result.is_error());
    CHECK(result.error_category() == ErrorCategory::PERSISTENCE_UNAVAILABLE);
    CHECK(h.notifier->count() == 1);
    CHECK(h.audit->get_stats().persist_failures == 1);
}

TEST_CASE("AuditLog: slow alert delivery does not hold up the write", "[audit][alert]") {
    AuditHarness h(AuditLogService::Config{.write_timeout = 500ms, .alert_timeout = 20ms});
    h.notifier->delay_ms = 300;

    const auto begin = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) {
        REQUIRE(h.audit->record(make_event("org-a", AuditEventType::IP_BLOCKED, Severity::CRITICAL)).is_ok());
    }
    CHECK(std::chrono::steady_clock::now() - begin < 400ms);
    CHECK(h.store->inner().audit_row_count() == 3);

    // Queued alerts are still delivered
    h.audit->shutdown();
    CHECK(h.notifier->count() == 3);
    CHECK(h.audit->get_stats().alerts_sent == 3);
}

// ============================================================================
// Persistence failures
// ============================================================================

TEST_CASE("AuditLog: rejected write leaves the chain intact", "[audit][integrity]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());

    h.store->fail_audit_writes = true;
    CHECK(h.audit->record(make_event("org-a")).is_error());
    CHECK(h.audit->record(make_event("org-a")).is_error());
    h.store->fail_audit_writes = false;

    auto next = h.audit->record(make_event("org-a"));
    REQUIRE(next.is_ok());
    CHECK(next.value().sequence_num == 2);

    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK(verified.value().intact);
    CHECK(verified.value().events_checked == 2);
}

TEST_CASE("AuditLog: concurrent writers of one organization keep the chain", "[audit][integrity]") {
    AuditHarness h;
    std::atomic<int> written{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&h, &written] {
            for (int i = 0; i < 10; ++i) {
                if (h.audit->record(make_event("org-a")).is_ok()) written.fetch_add(1);
            }
        });
    }
    for (auto& w : writers) w.join();
    REQUIRE(written.load() == 40);

    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK(verified.value().intact);
    CHECK(verified.value().events_checked == 40);
}

TEST_CASE("AuditLog: slow write times out but still lands", "[audit]") {
    AuditHarness h(AuditLogService::Config{.write_timeout = 50ms});
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());

    h.store->delay_ms = 300;
    auto slow = h.audit->record(make_event("org-a"));
    CHECK(slow.is_error());
    CHECK(slow.error_category() == ErrorCategory::PERSISTENCE_UNAVAILABLE);

    h.executor->shutdown();
    CHECK(h.store->inner().audit_row_count() == 2);
}

// ============================================================================
// Integrity
// ============================================================================

TEST_CASE("AuditLog: verify_chain on an intact trail", "[audit][integrity]") {
    AuditHarness h;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    }
    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK(verified.value().intact);
    CHECK(verified.value().events_checked == 5);

    auto empty = h.audit->verify_chain("org-none");
    REQUIRE(empty.is_ok());
    CHECK(empty.value().intact);
    CHECK(empty.value().events_checked == 0);
}

TEST_CASE("AuditLog: verify_chain detects a forged row", "[audit][integrity]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    auto second = h.audit->record(make_event("org-a"));
    REQUIRE(second.is_ok());

    AuditEvent forged = make_event("org-a");
    forged.event_id = "forged";
    forged.created_at = utils::now();
    forged.sequence_num = 3;
    forged.previous_hash = std::string(64, '0');
    forged.record_hash = AuditLogService::compute_record_hash(forged);
    h.store->inner().insert_audit(forged);

    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK_FALSE(verified.value().intact);
    REQUIRE(verified.value().first_broken_sequence.has_value());
    CHECK(*verified.value().first_broken_sequence == 3);
}

TEST_CASE("AuditLog: verify_chain detects an edited row", "[audit][integrity]") {
    AuditHarness h;
    auto first = h.audit->record(make_event("org-a"));
    REQUIRE(first.is_ok());

    AuditEvent edited = make_event("org-a");
    edited.created_at = utils::now();
    edited.sequence_num = 2;
    edited.previous_hash = first.value().record_hash;
    edited.record_hash = AuditLogService::compute_record_hash(edited);
    edited.action = "rewritten after the fact";
    h.store->inner().insert_audit(edited);

    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK_FALSE(verified.value().intact);
    CHECK(verified.value().detail.find("content hash") != std::string::npos);
}

// ============================================================================
// Retention
// ============================================================================

TEST_CASE("AuditLog: purge honors per-organization retention", "[audit][retention]") {
    AuditHarness h;
    const auto now = utils::now();

    auto old_a = make_event("org-a");
    old_a.created_at = std::chrono::floor<std::chrono::milliseconds>(now - 24h * 400);
    REQUIRE(h.audit->record(old_a).is_ok());
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());

    auto old_b = make_event("org-b");
    old_b.created_at = std::chrono::floor<std::chrono::milliseconds>(now - 24h * 60);
    REQUIRE(h.audit->record(old_b).is_ok());
    REQUIRE(h.audit->record(make_event("org-b")).is_ok());

    auto purged = h.audit->purge_expired([](const std::string& org) {
        return org == "org-b" ? 30 : 365;
    });
    REQUIRE(purged.is_ok());
    CHECK(purged.value() == 2);
    CHECK(h.store->inner().audit_row_count() == 2);
    CHECK(h.audit->get_stats().rows_purged == 2);

    // The first remaining row anchors the chain
    auto verified = h.audit->verify_chain("org-a");
    REQUIRE(verified.is_ok());
    CHECK(verified.value().intact);
}

TEST_CASE("AuditLog: purge falls back to default retention", "[audit][retention]") {
    AuditHarness h(AuditLogService::Config{.write_timeout = 500ms, .default_retention_days = 10});
    auto old = make_event("org-a");
    old.created_at = std::chrono::floor<std::chrono::milliseconds>(utils::now() - 24h * 20);
    REQUIRE(h.audit->record(old).is_ok());

    auto purged = h.audit->purge_expired([](const std::string&) { return 0; });
    REQUIRE(purged.is_ok());
    CHECK(purged.value() == 1);
}

TEST_CASE("AuditLog: purge reports an unreachable store", "[audit][retention]") {
    AuditHarness h;
    REQUIRE(h.audit->record(make_event("org-a")).is_ok());
    h.store->fail_reads = true;

    auto purged = h.audit->purge_expired({});
    CHECK(purged.is_error());
    CHECK(purged.error_category() == ErrorCategory::PERSISTENCE_UNAVAILABLE);
}
