#include "audit/audit_log_service.hpp"
#include "core/utils.hpp"
#include "security/field_encryptor.hpp"

#include <format>
#include <future>
#include <stdexcept>

namespace secplane {

AuditLogService::AuditLogService(std::shared_ptr<ISecurityStore> store,
                                 std::shared_ptr<TaskExecutor> executor,
                                 std::shared_ptr<IAlertNotifier> notifier,
                                 const Config& config)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      notifier_(std::move(notifier)),
      config_(config),
      alert_executor_(std::make_unique<TaskExecutor>(TaskExecutor::Config{
          .worker_count = 1,
          .call_timeout = config.alert_timeout,
          .max_queue_depth = 1000})) {}

AuditLogService::~AuditLogService() {
    shutdown();
}

void AuditLogService::shutdown() {
    alert_executor_->shutdown();
}

// ============================================================================
// Hash chain
// ============================================================================

std::string AuditLogService::compute_record_hash(const AuditEvent& event) {
    // Hash: sequence_num|previous_hash|canonical event JSON
    std::string input;
    input.reserve(512);
    input += std::format("{}", event.sequence_num);
    input += '|';
    input += event.previous_hash;
    input += '|';
    input += audit_event_to_json(event, false);
    return FieldEncryptor::hash(input);
}

AuditLogService::ChainHead AuditLogService::load_head(const std::string& organization_id) {
    {
        std::lock_guard lock(chain_mutex_);
        const auto it = heads_.find(organization_id);
        if (it != heads_.end()) return it->second;
    }

    auto store = store_;
    const auto last = executor_->run_bounded(
        [store, organization_id] { return store->last_audit(organization_id); },
        config_.write_timeout);

    ChainHead head;
    if (last) {
        head.sequence = last->sequence_num;
        head.hash = last->record_hash;
    }
    return head;
}

AuditLogService::ChainHead AuditLogService::assign_chain(AuditEvent& event) {
    const ChainHead loaded = load_head(event.organization_id);

    std::lock_guard lock(chain_mutex_);
    auto& head = heads_.try_emplace(event.organization_id, loaded).first->second;
    const ChainHead previous = head;

    event.sequence_num = head.sequence + 1;
    event.previous_hash = head.hash;
    event.record_hash = compute_record_hash(event);

    head.sequence = event.sequence_num;
    head.hash = event.record_hash;
    return previous;
}

void AuditLogService::rollback_chain(const AuditEvent& event, const ChainHead& previous) {
    std::lock_guard lock(chain_mutex_);
    const auto it = heads_.find(event.organization_id);
    if (it != heads_.end() && it->second.sequence == event.sequence_num) {
        it->second = previous;
    }
}

std::timed_mutex& AuditLogService::write_lock_for(const std::string& organization_id) {
    return write_locks_[std::hash<std::string>{}(organization_id) % kWriteStripes];
}

// ============================================================================
// Recording
// ============================================================================

Result<AuditEvent> AuditLogService::record(AuditEvent event) {
    if (event.organization_id.empty()) {
        return Result<AuditEvent>::error(ErrorCategory::VALIDATION_ERROR,
                                         "audit event requires an organization id");
    }
    if (event.event_id.empty()) {
        event.event_id = utils::generate_uuid();
    }
    if (event.created_at == TimePoint{}) {
        // Stored timestamps carry millisecond precision; hash what is stored
        event.created_at = std::chrono::floor<std::chrono::milliseconds>(utils::now());
    }
    if (event.metadata.is_null()) {
        event.metadata = glz::json_t::object_t{};
    }

    std::optional<SecurityError> failure;
    try {
        std::unique_lock write_lock(write_lock_for(event.organization_id), std::defer_lock);
        if (!write_lock.try_lock_for(config_.write_timeout)) {
            throw SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE,
                std::format("audit chain of {} busy for {}ms",
                            event.organization_id, config_.write_timeout.count()));
        }
        const ChainHead previous = assign_chain(event);

        auto store = store_;
        auto rejected = std::make_shared<std::atomic<bool>>(false);
        try {
            executor_->run_bounded([store, event, rejected] {
                try {
                    store->insert_audit(event);
                } catch (const std::exception&) {
                    rejected->store(true);
                    throw;
                }
            }, config_.write_timeout);
        } catch (const std::exception&) {
            // A timed-out insert may still land and keeps its sequence number
            if (rejected->load()) {
                rollback_chain(event, previous);
            }
            throw;
        }
        recorded_.fetch_add(1, std::memory_order_relaxed);
    } catch (const SecurityError& e) {
        failure = e;
    } catch (const std::exception& e) {
        failure = SecurityError(ErrorCategory::PERSISTENCE_UNAVAILABLE, e.what());
    }

    if (failure) {
        persist_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Audit write failed ({} {} org={}): {}",
            event_type_to_string(event.event_type), severity_to_string(event.severity),
            event.organization_id, failure->what()));
    }

    // Log first, then alert: the alert is attempted even if the row was lost
    if (event.severity == Severity::CRITICAL) {
        dispatch_alert(event);
    }

    if (failure) {
        return Result<AuditEvent>::from_exception(*failure);
    }
    return Result<AuditEvent>::ok(std::move(event));
}

void AuditLogService::dispatch_alert(const AuditEvent& event) {
    if (!notifier_) return;

    auto attempted = std::make_shared<std::promise<void>>();
    auto outcome = attempted->get_future();
    try {
        alert_executor_->submit([this, event, attempted] {
            deliver_alert(event);
            attempted->set_value();
        });
    } catch (const SecurityError& e) {
        alert_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Critical alert for {} dropped: {}", event.event_id, e.what()));
        return;
    }

    if (outcome.wait_for(config_.alert_timeout) != std::future_status::ready) {
        utils::log::warn(std::format("Critical alert for {} still pending after {}ms",
                                     event.event_id, config_.alert_timeout.count()));
    }
}

void AuditLogService::deliver_alert(const AuditEvent& event) {
    bool delivered = false;
    try {
        delivered = notifier_->notify(event);
        if (!delivered) {
            utils::log::warn(std::format("Critical alert for {} not delivered via {}",
                                         event.event_id, notifier_->name()));
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Critical alert for {} failed: {}", event.event_id, e.what()));
    }
    if (delivered) {
        alerts_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
        alert_failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

Result<AuditEvent> AuditLogService::record_auth_event(const std::string& organization_id,
                                                      const std::optional<std::string>& user_id,
                                                      AuditEventType type,
                                                      bool success,
                                                      const std::string& source_address,
                                                      const std::string& user_agent,
                                                      glz::json_t metadata) {
    AuditEvent event;
    event.organization_id = organization_id;
    event.actor_user_id = user_id;
    event.event_type = type;
    event.severity = success ? Severity::LOW : Severity::MEDIUM;
    event.resource_type = "user";
    event.resource_id = user_id;
    event.action = std::format("{} {}", event_type_to_string(type), success ? "succeeded" : "failed");
    event.source_address = source_address;
    event.user_agent = user_agent;
    event.metadata = std::move(metadata);
    return record(std::move(event));
}

Result<AuditEvent> AuditLogService::record_data_access(const std::string& organization_id,
                                                       const std::string& user_id,
                                                       AuditEventType type,
                                                       const std::string& resource_type,
                                                       const std::string& resource_id,
                                                       const std::string& source_address,
                                                       std::optional<glz::json_t> changes) {
    AuditEvent event;
    event.organization_id = organization_id;
    event.actor_user_id = user_id;
    event.event_type = type;
    event.severity = type == AuditEventType::DATA_DELETED ? Severity::HIGH : Severity::LOW;
    event.resource_type = resource_type;
    event.resource_id = resource_id;
    event.action = std::format("{} {}", event_type_to_string(type), resource_type);
    event.source_address = source_address;
    event.changes = std::move(changes);
    return record(std::move(event));
}

Result<AuditEvent> AuditLogService::record_security_event(const std::string& organization_id,
                                                          const std::optional<std::string>& user_id,
                                                          AuditEventType type,
                                                          Severity severity,
                                                          const std::string& action,
                                                          const std::string& source_address,
                                                          glz::json_t metadata) {
    AuditEvent event;
    event.organization_id = organization_id;
    event.actor_user_id = user_id;
    event.event_type = type;
    event.severity = severity;
    event.resource_type = "security";
    event.action = action;
    event.source_address = source_address;
    event.metadata = std::move(metadata);
    return record(std::move(event));
}

// ============================================================================
// Query
// ============================================================================

Result<AuditPage> AuditLogService::query(const Caller& caller,
                                         const AuditFilter& filter,
                                         const Pagination& pagination) {
    if (caller.organization_id.empty()) {
        return Result<AuditPage>::error(ErrorCategory::VALIDATION_ERROR,
                                        "caller has no organization");
    }

    if (filter.organization_id != caller.organization_id) {
        glz::json_t meta;
        meta["requested_organization"] = filter.organization_id;
        auto audited = record_security_event(caller.organization_id, caller.user_id,
                                             AuditEventType::ACCESS_DENIED, Severity::HIGH,
                                             "cross-tenant audit query rejected",
                                             caller.source_address, std::move(meta));
        if (audited.is_error()) {
            utils::log::warn("Cross-tenant audit query could not be recorded");
        }
        return Result<AuditPage>::error(ErrorCategory::AUTHORIZATION_FAILURE,
                                        "audit events of another organization are not accessible");
    }

    if (pagination.page < 1) {
        return Result<AuditPage>::error(ErrorCategory::VALIDATION_ERROR, "page must be >= 1");
    }
    if (pagination.limit < 1 || pagination.limit > Pagination::kMaxLimit) {
        return Result<AuditPage>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("limit must be between 1 and {}", Pagination::kMaxLimit));
    }
    if (filter.start && filter.end && *filter.start > *filter.end) {
        return Result<AuditPage>::error(ErrorCategory::VALIDATION_ERROR,
                                        "start must not be after end");
    }

    try {
        auto store = store_;
        return Result<AuditPage>::ok(executor_->run_bounded(
            [store, filter, pagination] { return store->query_audit(filter, pagination); },
            config_.write_timeout));
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Audit query failed for org {}: {}",
                                      filter.organization_id, e.what()));
        return Result<AuditPage>::from_exception(e);
    }
}

// ============================================================================
// Retention
// ============================================================================

Result<uint64_t> AuditLogService::purge_expired(const RetentionLookup& retention_days_for) {
    std::vector<std::string> orgs;
    auto store = store_;
    try {
        orgs = executor_->run_bounded([store] { return store->list_organizations(); },
                                      config_.write_timeout);
    } catch (const SecurityError& e) {
        utils::log::error(std::format("Audit purge: cannot list organizations: {}", e.what()));
        return Result<uint64_t>::from_exception(e);
    }

    const auto now = utils::now();
    uint64_t total = 0;
    size_t skipped = 0;

    for (const auto& org : orgs) {
        int days = retention_days_for ? retention_days_for(org) : config_.default_retention_days;
        if (days <= 0) days = config_.default_retention_days;
        const auto cutoff = now - std::chrono::hours(24) * days;

        try {
            const uint64_t deleted = executor_->run_bounded(
                [store, org, cutoff] { return store->delete_audit_before(org, cutoff); },
                config_.write_timeout);
            if (deleted > 0) {
                utils::log::info(std::format("Audit purge: {} rows older than {} days removed for org {}",
                                             deleted, days, org));
            }
            total += deleted;
        } catch (const SecurityError& e) {
            ++skipped;
            utils::log::warn(std::format("Audit purge skipped org {}: {}", org, e.what()));
        }
    }

    rows_purged_.fetch_add(total, std::memory_order_relaxed);
    utils::log::info(std::format("Audit purge complete: {} rows, {} orgs, {} skipped",
                                 total, orgs.size(), skipped));
    return Result<uint64_t>::ok(total);
}

// ============================================================================
// Integrity
// ============================================================================

Result<AuditLogService::ChainVerification> AuditLogService::verify_chain(
    const std::string& organization_id) {
    std::vector<AuditEvent> events;
    try {
        auto store = store_;
        AuditFilter filter;
        filter.organization_id = organization_id;
        events = executor_->run_bounded([store, filter] { return store->list_audit(filter); },
                                        config_.write_timeout);
    } catch (const SecurityError& e) {
        return Result<ChainVerification>::from_exception(e);
    }

    ChainVerification result;
    const AuditEvent* prev = nullptr;

    for (const auto& event : events) {
        ++result.events_checked;

        // The first remaining row anchors the chain (older rows may be purged)
        if (prev) {
            if (event.sequence_num != prev->sequence_num + 1) {
                result.intact = false;
                result.first_broken_sequence = event.sequence_num;
                result.detail = std::format("sequence gap: {} follows {}",
                                            event.sequence_num, prev->sequence_num);
                break;
            }
            if (event.previous_hash != prev->record_hash) {
                result.intact = false;
                result.first_broken_sequence = event.sequence_num;
                result.detail = std::format("previous_hash mismatch at sequence {}", event.sequence_num);
                break;
            }
        }
        if (compute_record_hash(event) != event.record_hash) {
            result.intact = false;
            result.first_broken_sequence = event.sequence_num;
            result.detail = std::format("content hash mismatch at sequence {}", event.sequence_num);
            break;
        }
        prev = &event;
    }

    if (!result.intact) {
        utils::log::error(std::format("Audit chain broken for org {}: {}", organization_id, result.detail));
    }
    return Result<ChainVerification>::ok(std::move(result));
}

AuditLogService::Stats AuditLogService::get_stats() const {
    return {
        .recorded = recorded_.load(std::memory_order_relaxed),
        .persist_failures = persist_failures_.load(std::memory_order_relaxed),
        .alerts_sent = alerts_sent_.load(std::memory_order_relaxed),
        .alert_failures = alert_failures_.load(std::memory_order_relaxed),
        .rows_purged = rows_purged_.load(std::memory_order_relaxed),
    };
}

} // namespace secplane
