#pragma once

#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

// ============================================================================
// Audit Event
// ============================================================================

struct AuditEvent {
    std::string event_id;                   // UUID, assigned on record
    std::string organization_id;
    std::optional<std::string> actor_user_id;   // Empty for unauthenticated events
    AuditEventType event_type = AuditEventType::DATA_VIEWED;
    Severity severity = Severity::LOW;

    // Target
    std::optional<std::string> resource_type;
    std::optional<std::string> resource_id;
    std::string action;

    // Origin
    std::string source_address;
    std::string user_agent;

    glz::json_t metadata;                   // Free-form key/value object
    std::optional<glz::json_t> changes;     // {"before": ..., "after": ...}

    TimePoint created_at{};

    // Integrity chain (per organization)
    uint64_t sequence_num = 0;
    std::string previous_hash;
    std::string record_hash;
};

// ============================================================================
// Query
// ============================================================================

struct AuditFilter {
    std::string organization_id;            // Always required
    std::optional<AuditEventType> event_type;
    std::optional<Severity> severity;
    std::optional<std::string> actor_user_id;
    std::optional<std::string> resource_type;
    std::optional<std::string> resource_id;
    std::optional<TimePoint> start;         // Inclusive
    std::optional<TimePoint> end;           // Exclusive

    [[nodiscard]] bool matches(const AuditEvent& e) const {
        if (e.organization_id != organization_id) return false;
        if (event_type && e.event_type != *event_type) return false;
        if (severity && e.severity != *severity) return false;
        if (actor_user_id && e.actor_user_id != actor_user_id) return false;
        if (resource_type && e.resource_type != resource_type) return false;
        if (resource_id && e.resource_id != resource_id) return false;
        if (start && e.created_at < *start) return false;
        if (end && e.created_at >= *end) return false;
        return true;
    }
};

struct Pagination {
    static constexpr size_t kMaxLimit = 1000;

    size_t page = 1;                        // 1-based
    size_t limit = 50;

    [[nodiscard]] size_t offset() const { return (page - 1) * limit; }
};

/// Events newest first (created_at DESC, then sequence DESC)
struct AuditPage {
    std::vector<AuditEvent> events;
    uint64_t total = 0;
    size_t page = 1;
    size_t limit = 50;
};

/// Canonical JSON line for an event (used for hashing, storage and alerts)
[[nodiscard]] std::string audit_event_to_json(const AuditEvent& event, bool include_integrity = true);

/// Serialize a JSON DOM value; returns "{}" if glaze cannot write it
[[nodiscard]] std::string json_value_to_string(const glz::json_t& value);

/// Parse a stored JSON document; returns std::nullopt on malformed input
[[nodiscard]] std::optional<glz::json_t> json_value_from_string(const std::string& text);

} // namespace secplane
