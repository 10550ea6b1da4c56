#include "audit/audit_event.hpp"
#include "core/utils.hpp"

#include <format>

namespace secplane {

std::string json_value_to_string(const glz::json_t& value) {
    if (value.is_null()) return "{}";
    const auto written = glz::write_json(value);
    if (!written) {
        utils::log::warn("audit: metadata could not be serialized");
        return "{}";
    }
    return *written;
}

std::optional<glz::json_t> json_value_from_string(const std::string& text) {
    if (text.empty()) return std::nullopt;
    glz::json_t result;
    const auto ec = glz::read_json(result, text);
    if (ec) return std::nullopt;
    return result;
}

namespace {

void append_optional(std::string& out, std::string_view key, const std::optional<std::string>& value) {
    if (value) {
        out += std::format("\"{}\":\"{}\",", key, utils::escape_json(*value));
    } else {
        out += std::format("\"{}\":null,", key);
    }
}

} // anonymous namespace

std::string audit_event_to_json(const AuditEvent& e, bool include_integrity) {
    std::string out;
    out.reserve(512);
    out += '{';
    out += std::format("\"event_id\":\"{}\",", utils::escape_json(e.event_id));
    out += std::format("\"organization_id\":\"{}\",", utils::escape_json(e.organization_id));
    append_optional(out, "actor_user_id", e.actor_user_id);
    out += std::format("\"event_type\":\"{}\",", event_type_to_string(e.event_type));
    out += std::format("\"severity\":\"{}\",", severity_to_string(e.severity));
    append_optional(out, "resource_type", e.resource_type);
    append_optional(out, "resource_id", e.resource_id);
    out += std::format("\"action\":\"{}\",", utils::escape_json(e.action));
    out += std::format("\"source_address\":\"{}\",", utils::escape_json(e.source_address));
    out += std::format("\"user_agent\":\"{}\",", utils::escape_json(e.user_agent));
    out += std::format("\"metadata\":{},", json_value_to_string(e.metadata));
    if (e.changes) {
        out += std::format("\"changes\":{},", json_value_to_string(*e.changes));
    } else {
        out += "\"changes\":null,";
    }
    out += std::format("\"created_at\":\"{}\"", utils::format_timestamp(e.created_at));
    if (include_integrity) {
        out += std::format(",\"sequence_num\":{},\"previous_hash\":\"{}\",\"record_hash\":\"{}\"",
                           e.sequence_num, e.previous_hash, e.record_hash);
    }
    out += '}';
    return out;
}

} // namespace secplane
