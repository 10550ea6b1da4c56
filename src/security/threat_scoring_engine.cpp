#include "security/threat_scoring_engine.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace secplane {

namespace {

std::string join_reasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) out += ", ";
        out += reasons[i];
    }
    return out;
}

glz::json_t reasons_json(const std::vector<std::string>& reasons) {
    glz::json_t::array_t arr;
    for (const auto& r : reasons) arr.emplace_back(r);
    return arr;
}

} // anonymous namespace

ThreatScoringEngine::ThreatScoringEngine(std::shared_ptr<IpDenylist> denylist,
                                         std::shared_ptr<ActivityTracker> activity,
                                         std::shared_ptr<AuditLogService> audit,
                                         std::shared_ptr<SettingsManager> settings,
                                         const Config& config)
    : denylist_(std::move(denylist)),
      activity_(std::move(activity)),
      audit_(std::move(audit)),
      settings_(std::move(settings)),
      config_(config),
      signatures_(config.max_scan_bytes) {}

// ============================================================================
// Scoring
// ============================================================================

ThreatScoringEngine::Score ThreatScoringEngine::score(const RequestContext& ctx,
                                                      const ActivityTracker::Snapshot& activity,
                                                      bool denylisted,
                                                      int failed_login_threshold) const {
    Score result;

    if (denylisted) {
        result.score += kDenylistedWeight;
        result.reasons.emplace_back("address is denylisted");
    }

    if (activity.request_count > config_.rate_threshold) {
        result.score += kRateWeight;
        result.reasons.push_back(std::format("excessive request rate ({} in window)",
                                             activity.request_count));
    }

    if (failed_login_threshold >= 0 &&
        activity.failed_logins > static_cast<uint64_t>(failed_login_threshold)) {
        result.score += kFailedLoginWeight;
        result.reasons.push_back(std::format("repeated failed logins ({} in window)",
                                             activity.failed_logins));
    }

    if (activity.distinct_addresses > config_.distinct_address_threshold) {
        result.score += kDistinctAddressWeight;
        result.reasons.push_back(std::format("many source addresses ({} in window)",
                                             activity.distinct_addresses));
    }

    if (const auto sig = signatures_.first_match({ctx.path, ctx.query, ctx.body})) {
        result.score += kSignatureWeight;
        result.reasons.push_back(std::format("attack signature: {}", *sig));
    }

    std::string_view user_agent = ctx.user_agent;
    if (user_agent.empty()) {
        if (const auto it = ctx.headers.find("user-agent"); it != ctx.headers.end()) {
            user_agent = it->second;
        }
    }
    if (user_agent.size() < config_.min_user_agent_length) {
        result.score += kUserAgentWeight;
        result.reasons.emplace_back("missing or short user agent");
    }

    for (const auto& header : config_.spoofing_headers) {
        if (ctx.has_header(header)) {
            result.score += kSpoofHeaderWeight;
            result.reasons.push_back(std::format("spoofing header: {}", header));
        }
    }

    return result;
}

// ============================================================================
// Evaluation
// ============================================================================

std::string ThreatScoringEngine::audit_organization(const RequestContext& ctx) const {
    return ctx.organization_id.empty() ? config_.system_organization_id : ctx.organization_id;
}

Decision ThreatScoringEngine::evaluate(const RequestContext& ctx) noexcept {
    evaluated_.fetch_add(1, std::memory_order_relaxed);
    try {
        return evaluate_impl(ctx);
    } catch (const std::exception& e) {
        fail_open_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Threat scoring failed open for {} ({}): {}",
                                      ctx.source_address, ctx.identity(), e.what()));
        Decision decision;
        decision.allow = true;
        decision.fail_open = true;
        decision.reasons.emplace_back("threat scoring unavailable");
        return decision;
    }
}

Decision ThreatScoringEngine::evaluate_impl(const RequestContext& ctx) {
    Decision decision;

    // Cheapest rejection first: no tracking or persistence for known-bad addresses
    if (denylist_->is_blocked(ctx.source_address)) {
        blocked_.fetch_add(1, std::memory_order_relaxed);
        decision.allow = false;
        decision.score = kDenylistedWeight;
        decision.reasons.emplace_back("address is denylisted");
        decision.client_message = kClientBlockedMessage;
        return decision;
    }

    const OrgSecuritySettings settings = ctx.organization_id.empty()
        ? settings_->config().defaults
        : settings_->get(ctx.organization_id);

    if (!settings.threat_detection_enabled) {
        return decision;
    }

    const std::optional<std::string> actor = ctx.user_id.empty()
        ? std::nullopt : std::optional<std::string>(ctx.user_id);

    const auto activity = activity_->record_request(ctx.identity(), ctx.source_address,
                                                    ctx.failed_authentication);
    auto scored = score(ctx, activity, false, settings.failed_login_threshold);
    decision.score = scored.score;
    decision.reasons = std::move(scored.reasons);

    if (decision.score >= settings.threat_score_threshold) {
        glz::json_t meta;
        meta["threat_score"] = static_cast<double>(decision.score);
        meta["reasons"] = reasons_json(decision.reasons);
        meta["identity"] = ctx.identity();
        meta["path"] = ctx.path;

        IpDenylist::BlockRequest request;
        request.address = ctx.source_address;
        request.reason = std::format("threat score {}: {}", decision.score, join_reasons(decision.reasons));
        request.ttl = config_.auto_block_ttl;
        request.automatic = true;
        request.organization_id = audit_organization(ctx);
        request.source_address = ctx.source_address;
        request.metadata = std::move(meta);

        auto blocked = denylist_->block(request);
        if (blocked.is_error() && blocked.error_category() != ErrorCategory::VALIDATION_ERROR) {
            throw SecurityError(blocked.error_category(), blocked.error_message());
        }

        if (blocked.is_error()) {
            // No denylist entry for an unusable address; the request is still rejected
            glz::json_t unlisted = request.metadata;
            unlisted["denylisted"] = false;
            unlisted["denylist_error"] = blocked.error_message();
            auto audited = audit_->record_security_event(
                request.organization_id, actor, AuditEventType::SUSPICIOUS_ACTIVITY, Severity::CRITICAL,
                "request blocked, address not denylisted", ctx.source_address, std::move(unlisted));
            if (audited.is_error()) {
                throw SecurityError(audited.error_category(), audited.error_message());
            }
            utils::log::warn(std::format("Rejected request from unlistable address '{}' ({}) with threat score {}",
                                         ctx.source_address, ctx.identity(), decision.score));
        } else {
            utils::log::warn(std::format("Blocked {} ({}) with threat score {}",
                                         ctx.source_address, ctx.identity(), decision.score));
        }

        blocked_.fetch_add(1, std::memory_order_relaxed);
        decision.allow = false;
        decision.client_message = kClientBlockedMessage;
        return decision;
    }

    if (decision.score > config_.suspicious_threshold) {
        suspicious_.fetch_add(1, std::memory_order_relaxed);

        glz::json_t meta;
        meta["threat_score"] = static_cast<double>(decision.score);
        meta["reasons"] = reasons_json(decision.reasons);
        meta["path"] = ctx.path;

        auto audited = audit_->record_security_event(
            audit_organization(ctx), actor, AuditEventType::SUSPICIOUS_ACTIVITY, Severity::MEDIUM,
            "suspicious request allowed", ctx.source_address, std::move(meta));
        if (audited.is_error()) {
            throw SecurityError(audited.error_category(), audited.error_message());
        }
    }

    return decision;
}

void ThreatScoringEngine::report_failed_login(const std::string& identity, const std::string& address) {
    activity_->record_failed_login(identity, address);
}

void ThreatScoringEngine::clear_activity() {
    activity_->clear();
    utils::log::info("Threat scoring: activity windows cleared");
}

ThreatScoringEngine::Stats ThreatScoringEngine::get_stats() const {
    return {
        .evaluated = evaluated_.load(std::memory_order_relaxed),
        .blocked = blocked_.load(std::memory_order_relaxed),
        .suspicious = suspicious_.load(std::memory_order_relaxed),
        .fail_open = fail_open_.load(std::memory_order_relaxed),
    };
}

} // namespace secplane
